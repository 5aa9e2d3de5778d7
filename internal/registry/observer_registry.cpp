#include "observer_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::registry {

namespace {

void SortForDispatch(std::vector<RegisteredObserver>& observers) {
  std::sort(observers.begin(), observers.end(), [](const RegisteredObserver& a, const RegisteredObserver& b) {
    if (a.descriptor.priority != b.descriptor.priority) return a.descriptor.priority > b.descriptor.priority;
    return a.sequence < b.sequence;
  });
}

} // namespace

// ------------------------------------------------------------
// Register
// ------------------------------------------------------------

void ObserverRegistry::Register(model::ObserverDescriptor descriptor, runtime::ObserverRuntimePtr binding) {
  if (descriptor.name.empty()) {
    throw util::InvalidArgument("observer name must not be empty");
  }
  if (!binding) {
    throw util::InvalidArgument("observer " + descriptor.name + " has no runtime binding");
  }

  std::unique_lock lock(mutex_);

  auto it = observers_.find(descriptor.name);
  if (it != observers_.end()) {
    it->second.descriptor = std::move(descriptor);
    it->second.binding    = std::move(binding);
    NOTEWATCH_LOG_DEBUG("Observer replaced", {observability::StringField("observer", it->first)});
    return;
  }

  const auto name = descriptor.name;
  observers_.emplace(name, RegisteredObserver{std::move(descriptor), std::move(binding), next_sequence_++});
}

bool ObserverRegistry::Unregister(const std::string& name) {
  std::unique_lock lock(mutex_);
  return observers_.erase(name) > 0;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::vector<RegisteredObserver> ObserverRegistry::ListFor(model::EventKind kind) const {
  std::vector<RegisteredObserver> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [name, observer] : observers_) {
      if (observer.descriptor.InterestedIn(kind)) result.push_back(observer);
    }
  }
  SortForDispatch(result);
  return result;
}

std::vector<RegisteredObserver> ObserverRegistry::List() const {
  std::vector<RegisteredObserver> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [name, observer] : observers_) result.push_back(observer);
  }
  SortForDispatch(result);
  return result;
}

std::optional<RegisteredObserver> ObserverRegistry::Find(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = observers_.find(name);
  if (it == observers_.end()) return std::nullopt;
  return it->second;
}

std::size_t ObserverRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return observers_.size();
}

} // namespace notewatch::registry
