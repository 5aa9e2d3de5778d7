#pragma once

#include <functional>
#include <stop_token>

#include "internal/runtime/observer_runtime.hpp"

namespace notewatch::runtime {

/*
  Compiled-in observer logic.

  Each call runs on a thread owned by the call. At the deadline the
  handler's stop token is signalled and Invoke waits for the handler to
  return before reporting the timeout, so a cancelled observer never
  writes after its failure is reported and never overlaps the next event
  for the same note. Handlers with side effects must check the token
  before committing them.
*/
class NativeRuntime : public ObserverRuntime {
 public:
  using Handler = std::function<model::ObserverResult(const model::ObserverDescriptor&, const model::NoteEvent&, std::stop_token)>;

  // Handlers that finish quickly and have nothing to cancel.
  using SimpleHandler = std::function<model::ObserverResult(const model::ObserverDescriptor&, const model::NoteEvent&)>;

  explicit NativeRuntime(Handler handler);
  explicit NativeRuntime(SimpleHandler handler);

  model::ObserverResult Invoke(const model::ObserverDescriptor& descriptor, const model::NoteEvent& event) override;

  model::RuntimeKind Kind() const override {
    return model::RuntimeKind::kNative;
  }

 private:
  Handler handler_;
};

} // namespace notewatch::runtime
