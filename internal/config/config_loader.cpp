#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace capacity::config {

using capacity::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static bool IsIntegerLiteral(const std::string& s) {
  if (s.empty()) return false;
  size_t i = (s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  for (; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

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

  // 64-bit integers do not survive a double; protobuf JSON accepts them quoted
  if (IsIntegerLiteral(scalar_value)) {
    value->set_string_value(scalar_value);
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
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

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
  }

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

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }

  if (config.database().backend_case() == capacity::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("info");
  }

  if (config.observability().service_name().empty()) {
    config.mutable_observability()->set_service_name("capacity-manager");
  }

  auto* auction = config.mutable_auction();
  if (!auction->has_duration()) {
    auction->mutable_duration()->set_seconds(100);
  }
  if (auction->minimal_bid() == 0) {
    auction->set_minimal_bid(100);
  }

  auto* quota = config.mutable_quota();
  if (quota->reference_call_cost() == 0) {
    quota->set_reference_call_cost(35'476'000);
  }
  if (quota->daily_utps() == 0) {
    quota->set_daily_utps(10'000);
  }

  auto* lock = config.mutable_lock();
  if (!lock->has_asset_to_tps_ratio()) {
    lock->mutable_asset_to_tps_ratio()->set_numerator(100);
    lock->mutable_asset_to_tps_ratio()->set_denominator(1);
  }
  if (lock->custodial_account().empty()) {
    lock->set_custodial_account("capacity/lock");
  }

  if (!config.interceptor().has_reservation_ttl()) {
    config.mutable_interceptor()->mutable_reservation_ttl()->set_seconds(60);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& duration = config.auction().duration();
  if (duration.seconds() < 0 || duration.nanos() < 0 || (duration.seconds() == 0 && duration.nanos() == 0)) {
    throw std::invalid_argument("auction.duration must be positive");
  }

  if (config.lock().asset_to_tps_ratio().denominator() == 0) {
    throw std::invalid_argument("lock.asset_to_tps_ratio.denominator must be non-zero");
  }

  const auto& ttl = config.interceptor().reservation_ttl();
  if (ttl.seconds() < 0 || ttl.nanos() < 0 || (ttl.seconds() == 0 && ttl.nanos() == 0)) {
    throw std::invalid_argument("interceptor.reservation_ttl must be positive");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri is required");
  }

  for (const auto& endowment : config.ledger().endowments()) {
    if (endowment.account().empty()) {
      throw std::invalid_argument("ledger.endowments: account is required");
    }
  }

  for (const auto& grant : config.delegations()) {
    if (grant.owner().empty() || grant.delegate().empty()) {
      throw std::invalid_argument("delegations: owner and delegate are required");
    }
    if (grant.owner() == grant.delegate()) {
      throw std::invalid_argument("delegations: owner cannot delegate to itself");
    }
  }
}

} // namespace capacity::config
