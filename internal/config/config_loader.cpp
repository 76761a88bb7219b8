#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace bounty::config {

using bounty::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress     = "0.0.0.0:50061";
constexpr uint32_t    kDefaultMaxAttempts     = 3;
constexpr uint32_t    kMaxAttemptsCeiling     = 10;
constexpr uint32_t    kDefaultBackoffMs       = 50;
constexpr uint32_t    kDefaultPgConnections   = 16;
constexpr uint32_t    kDefaultMetricsInterval = 1000;

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void ScalarToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings so ids like "1234" survive.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      ScalarToProtoValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value root;
  ToProtoValue(yaml, &root);

  RuntimeConfig config;
  if (root.has_null_value()) {
    ApplyDefaults(config);
    Validate(config);
    return config;
  }

  std::string json;
  auto        print_status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!print_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(print_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parse_status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parse_status.ok()) {
    throw std::invalid_argument("Invalid configuration: " + std::string(parse_status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);

  auto* database = config.mutable_database();
  if (database->backend_case() == bounty::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(kDefaultPgConnections);
  }

  auto* review = config.mutable_review();
  if (review->compensation_max_attempts() == 0) review->set_compensation_max_attempts(kDefaultMaxAttempts);
  if (review->compensation_backoff_ms() == 0) review->set_compensation_backoff_ms(kDefaultBackoffMs);
  if (review->notifier() == bounty::runtime::config::NOTIFIER_KIND_UNSPECIFIED) {
    review->set_notifier(bounty::runtime::config::NOTIFIER_KIND_ACTIVITY_LOG);
  }

  auto* observability = config.mutable_observability();
  if (observability->metrics_interval_ms() == 0) observability->set_metrics_interval_ms(kDefaultMetricsInterval);
}

void Validate(const RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    throw std::invalid_argument("server.bind_address must not be empty");
  }

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must not be empty");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri must not be empty");
  }

  const auto attempts = config.review().compensation_max_attempts();
  if (attempts < 1 || attempts > kMaxAttemptsCeiling) {
    throw std::invalid_argument("review.compensation_max_attempts must be between 1 and 10");
  }

  for (int i = 0; i < config.admins_size(); ++i) {
    const auto& admin = config.admins(i);
    if (!util::IsCanonicalUuid(admin.id())) {
      throw std::invalid_argument("admins[" + std::to_string(i) + "].id must be a UUID");
    }
    if (admin.role() == bounty::ledger::core::v1::ADMIN_ROLE_UNSPECIFIED) {
      throw std::invalid_argument("admins[" + std::to_string(i) + "].role must be set");
    }
  }
}

} // namespace bounty::config
