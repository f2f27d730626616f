#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace recall::config {

using recall::runtime::config::RuntimeConfig;

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

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // An empty document is a valid, all-defaults config.
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

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults and validation
// ------------------------------------------------------------

template <typename Message, typename T>
static void Default(Message* msg, T (Message::*get)() const, void (Message::*set)(T), T fallback) {
  if ((msg->*get)() == T{}) (msg->*set)(fallback);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  using namespace recall::runtime::config;

  auto* db = config.mutable_database();
  if (db->backend_case() == DatabaseConfig::BACKEND_NOT_SET) {
    db->mutable_sqlite()->set_path("recall.db");
  }
  if (db->has_sqlite() && db->sqlite().path().empty()) {
    db->mutable_sqlite()->set_path("recall.db");
  }
  if (db->has_postgres()) {
    Default<PostgresConfig, uint32_t>(db->mutable_postgres(), &PostgresConfig::max_connections,
                                      &PostgresConfig::set_max_connections, 8);
  }

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");
  if (config.logging().sink().empty()) config.mutable_logging()->set_sink("stdout");

  auto* obs = config.mutable_observability();
  if (obs->service_name().empty()) obs->set_service_name("recall");
  Default<ObservabilityConfig, uint32_t>(obs, &ObservabilityConfig::metrics_export_interval_ms,
                                         &ObservabilityConfig::set_metrics_export_interval_ms, 1000);
  Default<ObservabilityConfig, double>(obs, &ObservabilityConfig::trace_sample_ratio, &ObservabilityConfig::set_trace_sample_ratio, 1.0);

  auto* emb = config.mutable_embedding();
  if (emb->provider().empty()) emb->set_provider("hashing");
  Default<EmbeddingConfig, uint32_t>(emb, &EmbeddingConfig::dimensions, &EmbeddingConfig::set_dimensions, 256);
  Default<EmbeddingConfig, uint32_t>(emb, &EmbeddingConfig::timeout_ms, &EmbeddingConfig::set_timeout_ms, 2000);
  Default<EmbeddingConfig, uint32_t>(emb, &EmbeddingConfig::max_retries, &EmbeddingConfig::set_max_retries, 2);

  for (auto* collaborator : {config.mutable_extraction(), config.mutable_decision()}) {
    Default<CollaboratorConfig, uint32_t>(collaborator, &CollaboratorConfig::timeout_ms,
                                          &CollaboratorConfig::set_timeout_ms, 30000);
    Default<CollaboratorConfig, uint32_t>(collaborator, &CollaboratorConfig::max_retries,
                                          &CollaboratorConfig::set_max_retries, 2);
  }

  auto* update = config.mutable_update_engine();
  Default<UpdateEngineConfig, uint32_t>(update, &UpdateEngineConfig::similar_k, &UpdateEngineConfig::set_similar_k, 10);
  Default<UpdateEngineConfig, double>(update, &UpdateEngineConfig::similarity_threshold,
                                      &UpdateEngineConfig::set_similarity_threshold, 0.5);
  Default<UpdateEngineConfig, uint32_t>(update, &UpdateEngineConfig::max_conflict_retries,
                                        &UpdateEngineConfig::set_max_conflict_retries, 3);
  Default<UpdateEngineConfig, uint32_t>(update, &UpdateEngineConfig::known_entities_limit,
                                        &UpdateEngineConfig::set_known_entities_limit, 50);
  Default<UpdateEngineConfig, uint32_t>(update, &UpdateEngineConfig::max_content_chars,
                                        &UpdateEngineConfig::set_max_content_chars, 2000);

  auto* retrieval = config.mutable_retrieval();
  Default<RetrievalConfig, uint32_t>(retrieval, &RetrievalConfig::default_token_budget,
                                     &RetrievalConfig::set_default_token_budget, 2000);
  Default<RetrievalConfig, uint32_t>(retrieval, &RetrievalConfig::candidate_pool, &RetrievalConfig::set_candidate_pool, 50);
  Default<RetrievalConfig, double>(retrieval, &RetrievalConfig::min_similarity, &RetrievalConfig::set_min_similarity, 0.3);
  Default<RetrievalConfig, double>(retrieval, &RetrievalConfig::min_value_per_token,
                                   &RetrievalConfig::set_min_value_per_token, 0.002);
  Default<RetrievalConfig, double>(retrieval, &RetrievalConfig::recency_half_life_days,
                                   &RetrievalConfig::set_recency_half_life_days, 14.0);
  Default<RetrievalConfig, uint32_t>(retrieval, &RetrievalConfig::max_summary_categories,
                                     &RetrievalConfig::set_max_summary_categories, 3);

  auto* m = config.mutable_maintenance();
  Default<MaintenanceConfig, uint32_t>(m, &MaintenanceConfig::workers, &MaintenanceConfig::set_workers, 2);
  Default<MaintenanceConfig, uint32_t>(m, &MaintenanceConfig::poll_interval_ms, &MaintenanceConfig::set_poll_interval_ms, 1000);
  Default<MaintenanceConfig, uint32_t>(m, &MaintenanceConfig::scheduler_tick_ms, &MaintenanceConfig::set_scheduler_tick_ms,
                                       60000);
  Default<MaintenanceConfig, uint32_t>(m, &MaintenanceConfig::max_attempts, &MaintenanceConfig::set_max_attempts, 3);
  Default<MaintenanceConfig, uint32_t>(m, &MaintenanceConfig::backoff_base_ms, &MaintenanceConfig::set_backoff_base_ms, 1000);

  auto* decay = m->mutable_decay();
  Default<DecayConfig, double>(decay, &DecayConfig::floor, &DecayConfig::set_floor, 0.05);
  Default<DecayConfig, double>(decay, &DecayConfig::pinned_floor, &DecayConfig::set_pinned_floor, 0.7);
  Default<DecayConfig, uint32_t>(decay, &DecayConfig::grace_days, &DecayConfig::set_grace_days, 7);

  Default<ConsolidateConfig, double>(m->mutable_consolidate(), &ConsolidateConfig::similarity_threshold,
                                     &ConsolidateConfig::set_similarity_threshold, 0.85);

  auto* resummarize = m->mutable_resummarize();
  Default<ResummarizeConfig, uint32_t>(resummarize, &ResummarizeConfig::min_new_records,
                                       &ResummarizeConfig::set_min_new_records, 5);
  Default<ResummarizeConfig, uint32_t>(resummarize, &ResummarizeConfig::max_members, &ResummarizeConfig::set_max_members, 20);
  Default<ResummarizeConfig, uint32_t>(resummarize, &ResummarizeConfig::max_chars, &ResummarizeConfig::set_max_chars, 1200);

  auto* cleanup = m->mutable_cleanup();
  Default<CleanupConfig, uint32_t>(cleanup, &CleanupConfig::unused_days, &CleanupConfig::set_unused_days, 180);
  Default<CleanupConfig, double>(cleanup, &CleanupConfig::low_importance_below, &CleanupConfig::set_low_importance_below, 0.3);
}

static void RequireUnit(double value, const char* field) {
  if (value < 0.0 || value > 1.0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must be within [0, 1]");
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  const auto& sink = config.logging().sink();
  if (sink != "stdout" && sink != "stderr") {
    throw std::runtime_error("Invalid configuration: logging.sink must be stdout or stderr, got '" + sink + "'");
  }
  if (config.embedding().provider() != "hashing") {
    throw std::runtime_error("Invalid configuration: unsupported embedding.provider '" + config.embedding().provider() + "'");
  }

  RequireUnit(config.observability().trace_sample_ratio(), "observability.trace_sample_ratio");
  RequireUnit(config.update_engine().similarity_threshold(), "update_engine.similarity_threshold");
  RequireUnit(config.retrieval().min_similarity(), "retrieval.min_similarity");
  RequireUnit(config.maintenance().decay().floor(), "maintenance.decay.floor");
  RequireUnit(config.maintenance().decay().pinned_floor(), "maintenance.decay.pinned_floor");
  RequireUnit(config.maintenance().consolidate().similarity_threshold(), "maintenance.consolidate.similarity_threshold");
  RequireUnit(config.maintenance().cleanup().low_importance_below(), "maintenance.cleanup.low_importance_below");

  if (config.maintenance().decay().pinned_floor() < config.maintenance().decay().floor()) {
    throw std::runtime_error("Invalid configuration: maintenance.decay.pinned_floor must not be below floor");
  }
  if (config.retrieval().recency_half_life_days() <= 0.0) {
    throw std::runtime_error("Invalid configuration: retrieval.recency_half_life_days must be positive");
  }
}

} // namespace recall::config
