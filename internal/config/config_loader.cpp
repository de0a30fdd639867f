#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace research::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static std::string DefaultWorkerId() {
  std::array<char, 256> host{};
  if (gethostname(host.data(), host.size() - 1) != 0 || host[0] == '\0') {
    return "worker:" + std::to_string(getpid());
  }
  return std::string(host.data()) + ":" + std::to_string(getpid());
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ResolveDefaults(research::runtime::config::RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* database = config.mutable_database();
  if (database->backend_case() == research::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(8);
  }

  auto* worker = config.mutable_worker();
  if (worker->worker_id().empty()) worker->set_worker_id(DefaultWorkerId());
  if (worker->sleep_seconds() == 0) worker->set_sleep_seconds(2);
  if (worker->job_max_attempts() == 0) worker->set_job_max_attempts(10);
  if (worker->step_max_attempts() == 0) worker->set_step_max_attempts(5);
  if (worker->source_max_attempts() == 0) worker->set_source_max_attempts(3);
  if (worker->retry_base_seconds() == 0) worker->set_retry_base_seconds(30);
  if (worker->retry_cap_seconds() == 0) worker->set_retry_cap_seconds(300);
  if (worker->job_lock_timeout_seconds() == 0) worker->set_job_lock_timeout_seconds(1800);

  auto* fetch = config.mutable_fetch();
  if (fetch->timeout_seconds() == 0) fetch->set_timeout_seconds(30);
  if (fetch->max_bytes() == 0) fetch->set_max_bytes(2000000);
  if (fetch->user_agent().empty()) fetch->set_user_agent("research-worker/1.0");
  if (fetch->allowed_content_types().empty()) {
    fetch->add_allowed_content_types("text/html");
    fetch->add_allowed_content_types("application/pdf");
    fetch->add_allowed_content_types("text/plain");
  }
  if (fetch->pdftotext_path().empty()) fetch->set_pdftotext_path("pdftotext");

  auto* ranking = config.mutable_ranking();
  if (ranking->relevance_weight() == 0) ranking->set_relevance_weight(0.40);
  if (ranking->evidence_weight() == 0) ranking->set_evidence_weight(0.20);
  if (ranking->hq_weight() == 0) ranking->set_hq_weight(0.10);
  if (ranking->ownership_weight() == 0) ranking->set_ownership_weight(0.10);
  if (ranking->industry_weight() == 0) ranking->set_industry_weight(0.10);
  if (ranking->source_weight() == 0) ranking->set_source_weight(0.02);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

research::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  research::runtime::config::RuntimeConfig config;

  if (!yaml.IsNull()) {
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

  ResolveDefaults(config);
  return config;
}

} // namespace research::config
