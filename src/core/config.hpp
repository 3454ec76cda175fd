#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *MODEL_NAME = "model_name";

// Registry Settings
constexpr const char *REG_BACKEND = "backend";
constexpr const char *REG_FILE_PATH = "file_path";
constexpr const char *REG_TRACKING_URI = "tracking_uri";
constexpr const char *REG_MONGO_URI = "mongo_uri";
constexpr const char *REG_MONGO_DATABASE = "mongo_database";
constexpr const char *REG_METRIC_NAME = "metric_name";
constexpr const char *REG_EXPERIMENT_NAME = "experiment_name";
constexpr const char *REG_REQUEST_TIMEOUT_MS = "request_timeout_ms";
constexpr const char *REG_MAX_RETRIES = "max_retries";
constexpr const char *REG_CB_FAILURE_THRESHOLD =
    "circuit_breaker_failure_threshold";
constexpr const char *REG_CB_RECOVERY_TIMEOUT_SECONDS =
    "circuit_breaker_recovery_timeout_seconds";

// Serving Settings
constexpr const char *SRV_HOST = "host";
constexpr const char *SRV_PORT = "port";
constexpr const char *SRV_WORKER_THREADS = "worker_threads";
constexpr const char *SRV_FEATURE_NAMES = "feature_names";
constexpr const char *SRV_MODEL_FILE_NAME = "model_file_name";
constexpr const char *SRV_ARTIFACT_CACHE_DIR = "artifact_cache_dir";
constexpr const char *SRV_LOAD_WAIT_TIMEOUT_MS = "load_wait_timeout_ms";
constexpr const char *SRV_LOAD_ON_STARTUP = "load_on_startup";

// Retrain Settings
constexpr const char *RT_JOB_COMMAND = "job_command";
constexpr const char *RT_SERVICE_NAME = "service_name";
constexpr const char *RT_JOB_TIMEOUT_SECONDS = "job_timeout_seconds";
constexpr const char *RT_OUTPUT_TAIL_BYTES = "output_tail_bytes";

// Monitor Settings
constexpr const char *MON_ENABLED = "enabled";
constexpr const char *MON_SIGNAL_FILE_PATH = "signal_file_path";
constexpr const char *MON_POLL_INTERVAL_SECONDS = "poll_interval_seconds";
constexpr const char *MON_RELOAD_URL = "reload_url";

// Metrics Settings
constexpr const char *METRICS_ENABLED = "enabled";
constexpr const char *METRICS_PATH = "path";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

// Environment variables honoured on top of the file
namespace Env {
constexpr const char *TRACKING_URI = "MLFLOW_TRACKING_URI";
constexpr const char *SIGNAL_FILE_PATH = "SIGNAL_FILE_PATH";
constexpr const char *CHECK_INTERVAL = "CHECK_INTERVAL";
} // namespace Env

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct RegistryConfig {
  // One of: memory, file, mlflow, mongodb
  std::string backend = "file";
  std::string file_path = "data/registry.json";
  std::string tracking_uri = "http://mlflow:5000";
  std::string mongo_uri = "mongodb://localhost:27017";
  std::string mongo_database = "model_registry";
  std::string metric_name = "accuracy";
  // MLflow experiment that receives runs created on registration
  std::string experiment_name = "iris_classification";
  uint32_t request_timeout_ms = 5000;
  uint32_t max_retries = 2;
  uint32_t circuit_breaker_failure_threshold = 5;
  uint32_t circuit_breaker_recovery_timeout_seconds = 30;
};

struct ServingConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
  uint32_t worker_threads = 8;
  std::vector<std::string> feature_names = {"sepal_length", "sepal_width",
                                            "petal_length", "petal_width"};
  std::string model_file_name = "model.onnx";
  std::string artifact_cache_dir = "data/artifacts";
  uint32_t load_wait_timeout_ms = 2000;
  bool load_on_startup = true;
};

struct RetrainConfig {
  // Whitespace-separated argv; "{service}" is replaced by service_name
  std::string job_command =
      "docker compose --profile pipeline run --rm --no-deps {service}";
  std::string service_name = "train-model";
  uint32_t job_timeout_seconds = 600; // 10 minutes
  size_t output_tail_bytes = 500;
};

struct MonitorConfig {
  bool enabled = false;
  std::string signal_file_path = "data-file/retrain_requested";
  uint32_t poll_interval_seconds = 5;
  // Only used by the standalone monitor process
  std::string reload_url = "http://localhost:8000/model/reload";
};

struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

struct AppConfig {
  std::string model_name = "iris-classifier";

  RegistryConfig registry;
  ServingConfig serving;
  RetrainConfig retrain;
  MonitorConfig monitor;
  MetricsConfig metrics;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_registry_config(const RegistryConfig &config,
                              std::vector<std::string> &errors);
bool validate_serving_config(const ServingConfig &config,
                             std::vector<std::string> &errors);
bool validate_retrain_config(const RetrainConfig &config,
                             std::vector<std::string> &errors);
bool validate_monitor_config(const MonitorConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Sets every component to WARN except CORE, which logs INFO
void apply_default_log_levels(LoggingConfig &config);

enum class CommandLineAction { RUN, SHOW_HELP, USAGE_ERROR };

struct ServerCommandLine {
  CommandLineAction action = CommandLineAction::RUN;
  std::string config_file = "config.ini";
  std::string error;
};

// Accepts --config <file> and --help; anything else is a usage error
ServerCommandLine parse_server_command_line(int argc, const char *const argv[]);

class ConfigManager {
public:
  // Starts from the defaults with the environment overrides applied, so a
  // missing config file still honours them
  ConfigManager();
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
