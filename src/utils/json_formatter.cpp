#include "json_formatter.hpp"
#include "utils/utils.hpp"

nlohmann::json JsonFormatter::version_to_json_object(const ModelVersion &version) {
  nlohmann::json j;
  j["name"] = version.model_name;
  j["version"] = version.version;
  j["artifact_uri"] = version.artifact_uri;
  j["run_id"] = version.run_id;
  j["metric"] = version.metric;
  j["alias"] = alias_to_string(version.alias);
  j["created_at"] = Utils::format_time_iso8601(version.created_at);
  j["description"] = version.description;
  return j;
}

nlohmann::json JsonFormatter::health_to_json_object(const HealthStatus &health) {
  nlohmann::json j;
  j["status"] = "healthy";
  j["model_loaded"] = health.model_loaded;
  j["model_available"] = health.model_available;
  // null until something is served
  j["model_version"] = health.model_version
                           ? nlohmann::json(*health.model_version)
                           : nlohmann::json(nullptr);
  j["model_name"] = health.model_name;
  return j;
}

nlohmann::json JsonFormatter::model_info_to_json_object(const ModelInfo &info) {
  nlohmann::json j;
  j["model_name"] = info.model_name;
  j["aliases"] = info.aliases;
  j["version_count"] = info.version_count;
  j["serving_version"] = info.serving_version
                             ? nlohmann::json(*info.serving_version)
                             : nlohmann::json(nullptr);

  if (!info.registry_available) {
    j["status"] = "registry_unavailable";
    j["message"] = "Model registry could not be reached: " + info.registry_error;
    return j;
  }

  if (!info.has_production || !info.production) {
    j["status"] = "no_production_model";
    j["message"] = "No model has been promoted to production yet.";
    return j;
  }

  j["status"] = "ok";
  j["production"] = version_to_json_object(*info.production);
  j["metrics"] = info.metrics;
  j["params"] = info.params;
  return j;
}

nlohmann::json
JsonFormatter::promotion_to_json_object(const std::string &model_name,
                                        const PromotionOutcome &outcome) {
  nlohmann::json j;
  j["model_name"] = model_name;
  j["version"] = outcome.version;
  j["promoted"] = outcome.promoted;
  j["alias"] = alias_to_string(outcome.alias);
  j["metric"] = outcome.metric;
  j["baseline"] = outcome.baseline;
  return j;
}
