#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace stockcount::config {

using stockcount::runtime::config::RuntimeConfig;

namespace {

constexpr double   kDefaultHealthyFactor     = 1.5;
constexpr uint32_t kDefaultSkipHintThreshold = 2;
constexpr uint32_t kDefaultDeadlineMs        = 5000;
constexpr uint32_t kDefaultPollMs            = 1000;
constexpr char     kDefaultDeviceId[]        = "local-device";

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  // quoted scalars stay strings ("0042" is a device id, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end && *end == '\0') {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(text);
}

void NodeToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& element : node) {
        NodeToValue(element, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        NodeToValue(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }
  }
  throw util::ValidationError("config: unsupported YAML node");
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::ValidationError("config: " + message);
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("config: cannot load " + path + ": " + e.what());
  }

  // an empty file is an all-defaults config
  google::protobuf::Value root;
  if (yaml.IsNull()) {
    root.mutable_struct_value();
  } else {
    Require(yaml.IsMap(), path + " must contain a mapping");
    NodeToValue(yaml, &root);
  }

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json.ok()) {
    throw util::ValidationError("config: " + std::string(to_json.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw util::ValidationError("config: " + path + ": " + std::string(parsed.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* session = config.mutable_session();
  if (session->healthy_factor() == 0.0) {
    session->set_healthy_factor(kDefaultHealthyFactor);
  }
  if (session->skip_hint_threshold() == 0) {
    session->set_skip_hint_threshold(kDefaultSkipHintThreshold);
  }
  if (session->device_id().empty()) {
    session->set_device_id(kDefaultDeviceId);
  }

  auto* remote = config.mutable_remote();
  if (remote->deadline_ms() == 0) {
    remote->set_deadline_ms(kDefaultDeadlineMs);
  }
  if (remote->connectivity_poll_ms() == 0) {
    remote->set_connectivity_poll_ms(kDefaultPollMs);
  }
  if (remote->blob_store_address().empty()) {
    remote->set_blob_store_address(remote->inventory_address());
  }

  if (!config.database().has_sqlite() && !config.database().has_memory()) {
    config.mutable_database()->mutable_memory();
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& session = config.session();
  Require(std::isfinite(session.healthy_factor()) && session.healthy_factor() >= 1.0, "session.healthy_factor must be >= 1");

  if (config.database().has_sqlite()) {
    Require(!config.database().sqlite().path().empty(), "database.sqlite.path must not be empty");
  }

  const auto& level = config.logging().level();
  if (!level.empty()) {
    Require(level == "off" || spdlog::level::from_str(level) != spdlog::level::off, "unknown logging.level '" + level + "'");
  }
}

} // namespace stockcount::config
