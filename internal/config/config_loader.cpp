#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace notewatch::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

notewatch::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  notewatch::runtime::config::RuntimeConfig config;

  // an empty file is a valid, all-defaults configuration
  if (yaml.IsDefined() && !yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(notewatch::runtime::config::RuntimeConfig& config) {
  auto* notes = config.mutable_notes();
  if (notes->directory().empty()) notes->set_directory(".");
  if (notes->extension().empty()) notes->set_extension("md");
  if (!notes->extension().empty() && notes->extension().front() == '.') notes->set_extension(notes->extension().substr(1));

  auto* watch = config.mutable_watch();
  if (watch->debounce_ms() == 0) watch->set_debounce_ms(400);
  if (watch->retry_initial_backoff_ms() == 0) watch->set_retry_initial_backoff_ms(500);
  if (watch->retry_max_backoff_ms() == 0) watch->set_retry_max_backoff_ms(30000);

  auto* dispatch = config.mutable_dispatch();
  if (dispatch->worker_threads() == 0) dispatch->set_worker_threads(4);
  if (dispatch->script_pool_size() == 0) dispatch->set_script_pool_size(4);
  if (dispatch->default_timeout_ms() == 0) dispatch->set_default_timeout_ms(5000);
  if (dispatch->shutdown_grace_ms() == 0) dispatch->set_shutdown_grace_ms(3000);

  auto* persistence = config.mutable_persistence();
  if (persistence->max_attempts() == 0) persistence->set_max_attempts(3);
  if (persistence->backoff_ms() == 0) persistence->set_backoff_ms(100);

  auto* scripts = config.mutable_scripts();
  if (!scripts->has_lua()) scripts->set_lua(true);
  if (!scripts->has_python()) scripts->set_python(true);

  if (config.tag_index().file_name().empty()) {
    config.mutable_tag_index()->set_file_name("_tag_index." + notes->extension());
  }
}

} // namespace notewatch::config
