#include "native_runtime.hpp"

#include <chrono>
#include <future>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::runtime {

namespace {

// how long a cancelled handler may run on before it is reported
constexpr std::chrono::milliseconds kCancelGrace{1000};

} // namespace

NativeRuntime::NativeRuntime(Handler handler) : handler_(std::move(handler)) {
  if (!handler_) {
    throw util::InvalidArgument("native observer without handler");
  }
}

NativeRuntime::NativeRuntime(SimpleHandler handler) {
  if (!handler) {
    throw util::InvalidArgument("native observer without handler");
  }
  handler_ = [handler = std::move(handler)](const model::ObserverDescriptor& descriptor, const model::NoteEvent& event, std::stop_token) {
    return handler(descriptor, event);
  };
}

model::ObserverResult NativeRuntime::Invoke(const model::ObserverDescriptor& descriptor, const model::NoteEvent& event) {
  std::promise<model::ObserverResult> promise;
  auto                                future = promise.get_future();

  std::jthread call([this, &descriptor, &event, &promise](std::stop_token stop) {
    try {
      promise.set_value(handler_(descriptor, event, stop));
    } catch (const std::exception& e) {
      promise.set_value(model::ObserverResult::Failed(e.what()));
    }
  });

  if (future.wait_for(descriptor.timeout) == std::future_status::ready) {
    return future.get();
  }

  call.request_stop();
  if (future.wait_for(kCancelGrace) == std::future_status::timeout) {
    NOTEWATCH_LOG_WARN("Native observer slow to honour cancellation",
                       {observability::StringField("observer", descriptor.name), observability::StringField("path", event.path.string())});
  }
  call.join();

  return model::ObserverResult::Failed("timeout");
}

} // namespace notewatch::runtime
