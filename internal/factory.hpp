#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/pipeline.hpp"
#include "internal/registry/observer_registry.hpp"
#include "internal/runtime/lua_runtime.hpp"
#include "internal/runtime/python_runtime.hpp"
#include "internal/script/script_loader.hpp"
#include "internal/store/note_store.hpp"
#include "internal/watch/event_normalizer.hpp"

namespace notewatch::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  notewatch::runtime::config::RuntimeConfig config;

  std::shared_ptr<store::NoteStore>           store;
  std::shared_ptr<watch::EventNormalizer>     normalizer;
  std::shared_ptr<registry::ObserverRegistry> registry;

  std::shared_ptr<runtime::LuaRuntime>    lua;
  std::shared_ptr<runtime::PythonRuntime> python;
  std::shared_ptr<script::ScriptLoader>   scripts;

  std::shared_ptr<core::Pipeline> pipeline;
};

/*
  Build

  Constructs the whole pipeline from a config with defaults applied.
  This is the composition root; the only place that knows which
  observers exist. The pipeline is returned stopped.
*/
Application Build(const notewatch::runtime::config::RuntimeConfig& config);

} // namespace notewatch::factory
