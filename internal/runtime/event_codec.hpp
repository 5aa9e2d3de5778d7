#pragma once

#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/model/note_event.hpp"
#include "internal/model/observer.hpp"

namespace notewatch::runtime {

/*
  JSON plugin contract shared by the script runtimes.

  Input:  {"Updated": {"title": .., "content": .., "file_path": .., "frontmatter": {..}}}
  Output: null, or {"metadata": {..}, "content": "..", "error": ".."}
*/

std::string EncodeEvent(const model::NoteEvent& event);

// nullopt, empty or "null" replies are Unchanged. Throws ObserverExecutionError
// when the reply is not a valid document.
model::ObserverResult DecodeReply(const std::optional<std::string>& reply);

google::protobuf::Value ToProtoValue(const model::MetaValue& value);

// nullopt for JSON null. Numbers and booleans become their text form;
// objects and lists holding objects or lists become NestedValue.
std::optional<model::MetaValue> FromProtoValue(const google::protobuf::Value& value);

} // namespace notewatch::runtime
