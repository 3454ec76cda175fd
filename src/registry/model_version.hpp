#ifndef MODEL_VERSION_HPP
#define MODEL_VERSION_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

enum class Alias { NONE, PRODUCTION, CHALLENGER };

const char *alias_to_string(Alias alias);
// "production" / "challenger" (case-insensitive); nullopt for anything else
std::optional<Alias> alias_from_string(std::string_view name);

struct ModelVersion {
  std::string model_name;
  uint64_t version = 0;
  std::string artifact_uri;
  std::string run_id;
  double metric = 0.0;
  Alias alias = Alias::NONE;
  std::chrono::system_clock::time_point created_at;
  std::string description;
};

// Metrics and parameters of the training run behind a version
struct RunData {
  std::string run_id;
  std::map<std::string, double> metrics;
  std::map<std::string, std::string> params;
};

struct RegistrationRequest {
  std::string artifact_uri;
  std::string run_id; // generated by backends that own runs when empty
  double metric = 0.0;
  std::string metric_name = "accuracy";
  std::string description;
  std::map<std::string, std::string> params;
};

#endif // MODEL_VERSION_HPP
