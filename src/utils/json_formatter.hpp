#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "promotion/promotion_engine.hpp"
#include "registry/model_version.hpp"
#include "serving/model_server.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace JsonFormatter {

nlohmann::json version_to_json_object(const ModelVersion &version);
nlohmann::json health_to_json_object(const HealthStatus &health);
nlohmann::json model_info_to_json_object(const ModelInfo &info);
nlohmann::json promotion_to_json_object(const std::string &model_name,
                                        const PromotionOutcome &outcome);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
