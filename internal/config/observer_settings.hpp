#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/observer.hpp"

namespace notewatch::config {

// What an observer gets when the config has no entry for it.
struct ObserverDefaults {
  bool                          enabled      = true;
  std::int32_t                  priority     = 0;
  model::CapabilitySet          capabilities = model::kAllCapabilities;
  std::vector<model::EventKind> events;
};

const notewatch::runtime::config::ObserverConfig* FindObserverConfig(const notewatch::runtime::config::RuntimeConfig& config,
                                                                     const std::string&                               name);

bool ObserverEnabled(const notewatch::runtime::config::RuntimeConfig& config, const std::string& name, bool default_enabled);

// Descriptor from the matching observers[] entry over `defaults`.
// Throws InvalidArgument on an unknown event or capability name.
model::ObserverDescriptor DescribeObserver(const notewatch::runtime::config::RuntimeConfig& config,
                                           const std::string&                               name,
                                           model::RuntimeKind                               runtime,
                                           const ObserverDefaults&                          defaults = {});

} // namespace notewatch::config
