#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/model/observer.hpp"
#include "internal/runtime/observer_runtime.hpp"

namespace notewatch::registry {

struct RegisteredObserver {
  model::ObserverDescriptor   descriptor;
  runtime::ObserverRuntimePtr binding;

  // registration order, kept across re-registration
  std::uint64_t sequence = 0;
};

/*
  Observer Registry.

  Names are unique. Registering an existing name replaces its descriptor
  and binding in place, which is how scripts are reloaded while the
  pipeline keeps running. Readers get copies, so a reload never changes
  the list an in-flight dispatch is iterating.
*/
class ObserverRegistry {
 public:
  void Register(model::ObserverDescriptor descriptor, runtime::ObserverRuntimePtr binding);

  bool Unregister(const std::string& name);

  // Observers interested in `kind`: highest priority first, ties by registration order.
  std::vector<RegisteredObserver> ListFor(model::EventKind kind) const;

  // Every observer in dispatch order.
  std::vector<RegisteredObserver> List() const;

  std::optional<RegisteredObserver> Find(const std::string& name) const;

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                 mutex_;
  std::map<std::string, RegisteredObserver> observers_;
  std::uint64_t                             next_sequence_ = 0;
};

} // namespace notewatch::registry
