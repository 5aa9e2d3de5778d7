#include "event_codec.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "notewatch/observer/v1/observer.pb.h"

namespace notewatch::runtime {

namespace pb = notewatch::observer::v1;

namespace {

std::string NumberToString(double number) {
  if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) < 1e15) {
    return std::to_string(static_cast<long long>(number));
  }
  std::ostringstream out;
  out << std::setprecision(15) << number;
  return out.str();
}

std::string ScalarToString(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNumberValue:
      return NumberToString(value.number_value());
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      return {};
  }
}

google::protobuf::Value NodeToProto(const YAML::Node& node) {
  google::protobuf::Value out;
  if (node.IsMap()) {
    auto& fields = *out.mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) fields[entry.first.Scalar()] = NodeToProto(entry.second);
  } else if (node.IsSequence()) {
    auto* list = out.mutable_list_value();
    for (const auto& item : node) *list->add_values() = NodeToProto(item);
  } else if (node.IsScalar()) {
    out.set_string_value(node.Scalar());
  } else {
    out.set_null_value(google::protobuf::NULL_VALUE);
  }
  return out;
}

// Struct keys come out sorted so the emitted YAML is stable.
YAML::Node ProtoToNode(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStructValue: {
      std::vector<std::string> keys;
      for (const auto& [key, _] : value.struct_value().fields()) keys.push_back(key);
      std::sort(keys.begin(), keys.end());

      YAML::Node node(YAML::NodeType::Map);
      for (const auto& key : keys) node[key] = ProtoToNode(value.struct_value().fields().at(key));
      return node;
    }
    case google::protobuf::Value::kListValue: {
      YAML::Node node(YAML::NodeType::Sequence);
      for (const auto& item : value.list_value().values()) node.push_back(ProtoToNode(item));
      return node;
    }
    case google::protobuf::Value::kNullValue:
      return YAML::Node(YAML::NodeType::Null);
    default:
      return YAML::Node(ScalarToString(value));
  }
}

model::NestedValue ToNested(const google::protobuf::Value& value) {
  YAML::Emitter out;
  out << ProtoToNode(value);
  return model::NestedValue{out.c_str()};
}

bool IsScalar(const google::protobuf::Value& value) {
  return value.kind_case() != google::protobuf::Value::kStructValue && value.kind_case() != google::protobuf::Value::kListValue;
}

void FillPayload(const model::Note& note, pb::NotePayload* payload) {
  payload->set_title(note.title);
  payload->set_content(note.body);
  payload->set_file_path(note.path.string());
  auto& frontmatter = *payload->mutable_frontmatter();
  for (const auto& [key, value] : note.frontmatter.Entries()) {
    frontmatter[key] = ToProtoValue(value);
  }
}

} // namespace

google::protobuf::Value ToProtoValue(const model::MetaValue& value) {
  google::protobuf::Value out;
  if (const auto* scalar = std::get_if<std::string>(&value)) {
    out.set_string_value(*scalar);
    return out;
  }
  if (const auto* nested = std::get_if<model::NestedValue>(&value)) {
    try {
      return NodeToProto(YAML::Load(nested->yaml));
    } catch (const YAML::Exception& e) {
      throw util::ObserverExecutionError("cannot encode nested value: " + std::string(e.what()));
    }
  }
  auto* list = out.mutable_list_value();
  for (const auto& item : std::get<std::vector<std::string>>(value)) {
    list->add_values()->set_string_value(item);
  }
  return out;
}

std::optional<model::MetaValue> FromProtoValue(const google::protobuf::Value& value) {
  if (value.kind_case() == google::protobuf::Value::kNullValue) {
    return std::nullopt;
  }
  if (value.kind_case() == google::protobuf::Value::kStructValue) {
    return model::MetaValue(ToNested(value));
  }
  if (value.kind_case() == google::protobuf::Value::kListValue) {
    const auto& values = value.list_value().values();
    if (!std::all_of(values.begin(), values.end(), IsScalar)) return model::MetaValue(ToNested(value));

    std::vector<std::string> items;
    for (const auto& item : value.list_value().values()) items.push_back(ScalarToString(item));
    return model::MetaValue(std::move(items));
  }
  return model::MetaValue(ScalarToString(value));
}

// ------------------------------------------------------------
// Encode
// ------------------------------------------------------------

std::string EncodeEvent(const model::NoteEvent& event) {
  pb::ObserverEvent message;
  const auto&       note = event.Subject();

  switch (event.kind) {
    case model::EventKind::kCreated:
      FillPayload(note, message.mutable_created());
      break;
    case model::EventKind::kUpdated:
      FillPayload(note, message.mutable_updated());
      break;
    case model::EventKind::kSynced:
      FillPayload(note, message.mutable_synced());
      break;
    case model::EventKind::kDeleted:
      FillPayload(note, message.mutable_deleted());
      break;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::ObserverExecutionError("cannot encode event: " + std::string(status.message()));
  }
  return json;
}

// ------------------------------------------------------------
// Decode
// ------------------------------------------------------------

model::ObserverResult DecodeReply(const std::optional<std::string>& reply) {
  if (!reply) return model::ObserverResult::Unchanged();

  const auto trimmed = util::Trim(*reply);
  if (trimmed.empty() || trimmed == "null") return model::ObserverResult::Unchanged();

  pb::ObserverReply message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(trimmed, &message, options);
  if (!status.ok()) {
    throw util::ObserverExecutionError("invalid observer reply: " + std::string(status.message()));
  }

  if (!message.error().empty()) {
    return model::ObserverResult::Failed(message.error());
  }

  model::ObserverResult result;
  for (const auto& [key, value] : message.metadata().fields()) {
    result.metadata.emplace_back(key, FromProtoValue(value));
  }
  // map iteration order is unspecified
  std::sort(result.metadata.begin(), result.metadata.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  if (message.has_content()) {
    result.body = message.content();
  }

  result.status = (result.metadata.empty() && !result.body) ? model::ObserverStatus::kUnchanged : model::ObserverStatus::kModified;
  return result;
}

} // namespace notewatch::runtime
