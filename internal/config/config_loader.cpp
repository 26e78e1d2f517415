#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace flowlock::config {

namespace {

constexpr auto kDefaultTtl             = std::chrono::seconds(15);
constexpr auto kDefaultBlockingTimeout = std::chrono::seconds(10);
constexpr auto kDefaultPollInterval    = std::chrono::milliseconds(50);
constexpr auto kDefaultLockWaitTimeout = std::chrono::seconds(5);
constexpr auto kDefaultKeyPrefix       = "workflow";
constexpr auto kDefaultAuditPageSize   = 100u;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

template <typename Rep, typename Period>
void SetIfUnset(google::protobuf::Duration* d, std::chrono::duration<Rep, Period> value) {
  if (d->seconds() != 0 || d->nanos() != 0) {
    return;
  }
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(value);
  d->set_seconds(ns.count() / 1000000000);
  d->set_nanos(static_cast<int32_t>(ns.count() % 1000000000));
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* locks = config.mutable_locks();
  SetIfUnset(locks->mutable_default_ttl(), kDefaultTtl);
  SetIfUnset(locks->mutable_blocking_timeout(), kDefaultBlockingTimeout);
  SetIfUnset(locks->mutable_poll_interval(), kDefaultPollInterval);
  if (locks->key_prefix().empty()) {
    locks->set_key_prefix(kDefaultKeyPrefix);
  }

  SetIfUnset(config.mutable_database()->mutable_lock_wait_timeout(), kDefaultLockWaitTimeout);
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }

  if (config.audit().page_size() == 0) {
    config.mutable_audit()->set_page_size(kDefaultAuditPageSize);
  }
  if (config.telemetry().service_name().empty()) {
    config.mutable_telemetry()->set_service_name("flowlock");
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto ttl       = util::FromProto(config.locks().default_ttl());
  const auto blocking  = util::FromProto(config.locks().blocking_timeout());
  const auto poll      = util::FromProto(config.locks().poll_interval());
  const auto lock_wait = util::FromProto(config.database().lock_wait_timeout());

  if (ttl.count() <= 0) {
    throw std::runtime_error("Invalid configuration: locks.default_ttl must be positive");
  }
  if (blocking.count() <= 0) {
    throw std::runtime_error("Invalid configuration: locks.blocking_timeout must be positive");
  }
  if (poll.count() <= 0) {
    throw std::runtime_error("Invalid configuration: locks.poll_interval must be positive");
  }
  if (lock_wait.count() <= 0) {
    throw std::runtime_error("Invalid configuration: database.lock_wait_timeout must be positive");
  }
  // The mutex must never expire while the transaction it guards still waits on a row lock.
  if (lock_wait > ttl) {
    throw std::runtime_error("Invalid configuration: database.lock_wait_timeout must not exceed locks.default_ttl");
  }
  if (config.locks().key_prefix().find(':') != std::string::npos) {
    throw std::runtime_error("Invalid configuration: locks.key_prefix must not contain ':'");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace flowlock::config
