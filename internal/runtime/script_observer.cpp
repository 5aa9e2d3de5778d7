#include "script_observer.hpp"

#include "internal/runtime/event_codec.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::runtime {

ScriptObserver::ScriptObserver(std::shared_ptr<ScriptEngine> engine, model::RuntimeKind kind, std::string entry, std::string source)
    : engine_(std::move(engine)), kind_(kind), entry_(std::move(entry)), source_(std::move(source)) {
  if (!engine_) {
    throw util::InvalidArgument("script observer without engine");
  }
}

model::ObserverResult ScriptObserver::Invoke(const model::ObserverDescriptor& descriptor, const model::NoteEvent& event) {
  try {
    auto reply = engine_->CallEntry(descriptor.name, source_, entry_, EncodeEvent(event), descriptor.timeout);
    return DecodeReply(reply);
  } catch (const util::ObserverExecutionError& e) {
    return model::ObserverResult::Failed(e.what());
  }
}

} // namespace notewatch::runtime
