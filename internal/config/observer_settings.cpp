#include "observer_settings.hpp"

#include "internal/util/errors.hpp"

namespace notewatch::config {

using notewatch::runtime::config::ObserverConfig;
using notewatch::runtime::config::RuntimeConfig;

const ObserverConfig* FindObserverConfig(const RuntimeConfig& config, const std::string& name) {
  for (const auto& entry : config.observers()) {
    if (entry.name() == name) return &entry;
  }
  return nullptr;
}

bool ObserverEnabled(const RuntimeConfig& config, const std::string& name, bool default_enabled) {
  const auto* entry = FindObserverConfig(config, name);
  if (!entry || !entry->has_enabled()) return default_enabled;
  return entry->enabled();
}

model::ObserverDescriptor DescribeObserver(const RuntimeConfig&    config,
                                           const std::string&      name,
                                           model::RuntimeKind      runtime,
                                           const ObserverDefaults& defaults) {
  model::ObserverDescriptor descriptor;
  descriptor.name         = name;
  descriptor.runtime      = runtime;
  descriptor.capabilities = defaults.capabilities;
  descriptor.priority     = defaults.priority;
  descriptor.events       = defaults.events;
  descriptor.timeout      = std::chrono::milliseconds(config.dispatch().default_timeout_ms());

  const auto* entry = FindObserverConfig(config, name);
  if (!entry) return descriptor;

  if (entry->has_priority()) descriptor.priority = entry->priority();
  if (entry->timeout_ms() > 0) descriptor.timeout = std::chrono::milliseconds(entry->timeout_ms());

  if (entry->events_size() > 0) {
    descriptor.events.clear();
    for (const auto& name_text : entry->events()) {
      auto kind = model::ParseEventKind(name_text);
      if (!kind) {
        throw util::InvalidArgument("observer " + name + ": unknown event '" + name_text + "'");
      }
      descriptor.events.push_back(*kind);
    }
  }

  if (entry->capabilities_size() > 0) {
    descriptor.capabilities = 0;
    for (const auto& name_text : entry->capabilities()) {
      auto capability = model::ParseCapability(name_text);
      if (!capability) {
        throw util::InvalidArgument("observer " + name + ": unknown capability '" + name_text + "'");
      }
      descriptor.capabilities |= *capability;
    }
  }

  return descriptor;
}

} // namespace notewatch::config
