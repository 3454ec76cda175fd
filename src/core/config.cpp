#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"registry", LogComponent::REGISTRY},
    {"promotion", LogComponent::PROMOTION},
    {"serving", LogComponent::SERVING},
    {"io.http", LogComponent::IO_HTTP},
    {"ml.inference", LogComponent::ML_INFERENCE},
    {"ml.lifecycle", LogComponent::ML_LIFECYCLE},
    {"retrain.monitor", LogComponent::RETRAIN_MONITOR},
    {"retrain.job", LogComponent::RETRAIN_JOB}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

void apply_default_log_levels(LoggingConfig &config) {
  for (const auto &pair : key_to_component_map)
    config.log_levels[pair.second] = LogLevel::WARN;
  config.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

bool validate_registry_config(const RegistryConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  static const std::vector<std::string> backends = {"memory", "file", "mlflow",
                                                    "mongodb"};
  if (std::find(backends.begin(), backends.end(), config.backend) ==
      backends.end()) {
    errors.push_back("Registry backend must be one of memory, file, mlflow, "
                     "mongodb (got '" +
                     config.backend + "')");
    valid = false;
  }

  if (config.backend == "file" && config.file_path.empty()) {
    errors.push_back("Registry file_path is required for the file backend");
    valid = false;
  }

  if (config.backend == "mlflow" &&
      !Utils::starts_with(config.tracking_uri, "http://") &&
      !Utils::starts_with(config.tracking_uri, "https://")) {
    errors.push_back("Registry tracking_uri must start with http:// or "
                     "https://");
    valid = false;
  }

  if (config.backend == "mongodb" &&
      !Utils::starts_with(config.mongo_uri, "mongodb")) {
    errors.push_back("Registry mongo_uri must be a mongodb:// URI");
    valid = false;
  }

  if (config.metric_name.empty()) {
    errors.push_back("Registry metric_name must not be empty");
    valid = false;
  }

  if (config.request_timeout_ms < 100 || config.request_timeout_ms > 300000) {
    errors.push_back(
        "Registry request timeout must be between 100 and 300000 ms");
    valid = false;
  }

  if (config.max_retries > 10) {
    errors.push_back("Registry max_retries must be at most 10");
    valid = false;
  }

  if (config.circuit_breaker_failure_threshold < 1) {
    errors.push_back(
        "Registry circuit breaker failure threshold must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_serving_config(const ServingConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 0 || config.port > 65535) {
    errors.push_back("Serving port must be between 0 and 65535");
    valid = false;
  }

  if (config.worker_threads < 1 || config.worker_threads > 256) {
    errors.push_back("Serving worker_threads must be between 1 and 256");
    valid = false;
  }

  if (config.feature_names.empty()) {
    errors.push_back("Serving feature_names must list at least one feature");
    valid = false;
  }

  if (config.model_file_name.empty()) {
    errors.push_back("Serving model_file_name must not be empty");
    valid = false;
  }

  if (config.load_wait_timeout_ms > 60000) {
    errors.push_back("Serving load_wait_timeout_ms must be at most 60000");
    valid = false;
  }

  return valid;
}

bool validate_retrain_config(const RetrainConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (Utils::split_whitespace(config.job_command).empty()) {
    errors.push_back("Retrain job_command must not be empty");
    valid = false;
  }

  if (config.job_timeout_seconds < 1 || config.job_timeout_seconds > 86400) {
    errors.push_back(
        "Retrain job timeout must be between 1 and 86400 seconds");
    valid = false;
  }

  return valid;
}

bool validate_monitor_config(const MonitorConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.signal_file_path.empty()) {
    errors.push_back("Monitor signal_file_path must not be empty");
    valid = false;
  }

  if (config.poll_interval_seconds < 1 ||
      config.poll_interval_seconds > 3600) {
    errors.push_back(
        "Monitor poll interval must be between 1 and 3600 seconds");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.model_name.empty()) {
    errors.push_back("model_name must not be empty");
    valid = false;
  }

  valid &= validate_registry_config(config.registry, errors);
  valid &= validate_serving_config(config.serving, errors);
  valid &= validate_retrain_config(config.retrain, errors);
  valid &= validate_monitor_config(config.monitor, errors);

  if (config.metrics.path.empty() || config.metrics.path[0] != '/') {
    errors.push_back("Metrics path must start with '/'");
    valid = false;
  }

  return valid;
}

void apply_environment_overrides(AppConfig &config) {
  if (const char *uri = std::getenv(Env::TRACKING_URI); uri && *uri)
    config.registry.tracking_uri = uri;
  if (const char *path = std::getenv(Env::SIGNAL_FILE_PATH); path && *path)
    config.monitor.signal_file_path = path;
  if (const char *interval = std::getenv(Env::CHECK_INTERVAL);
      interval && *interval)
    config.monitor.poll_interval_seconds =
        Utils::string_to_number<uint32_t>(Utils::trim_copy(interval))
            .value_or(config.monitor.poll_interval_seconds);
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    if (current_section.empty()) {
      if (key == Keys::MODEL_NAME)
        config.model_name = value;
      else
        config.custom_settings[key] = value;

    } else if (current_section == "Registry") {
      if (key == Keys::REG_BACKEND)
        config.registry.backend = Utils::to_lower_copy(value);
      else if (key == Keys::REG_FILE_PATH)
        config.registry.file_path = value;
      else if (key == Keys::REG_TRACKING_URI)
        config.registry.tracking_uri = value;
      else if (key == Keys::REG_MONGO_URI)
        config.registry.mongo_uri = value;
      else if (key == Keys::REG_MONGO_DATABASE)
        config.registry.mongo_database = value;
      else if (key == Keys::REG_METRIC_NAME)
        config.registry.metric_name = value;
      else if (key == Keys::REG_EXPERIMENT_NAME)
        config.registry.experiment_name = value;
      else if (key == Keys::REG_REQUEST_TIMEOUT_MS)
        config.registry.request_timeout_ms =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.registry.request_timeout_ms);
      else if (key == Keys::REG_MAX_RETRIES)
        config.registry.max_retries =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.registry.max_retries);
      else if (key == Keys::REG_CB_FAILURE_THRESHOLD)
        config.registry.circuit_breaker_failure_threshold =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.registry.circuit_breaker_failure_threshold);
      else if (key == Keys::REG_CB_RECOVERY_TIMEOUT_SECONDS)
        config.registry.circuit_breaker_recovery_timeout_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.registry.circuit_breaker_recovery_timeout_seconds);

    } else if (current_section == "Serving") {
      if (key == Keys::SRV_HOST)
        config.serving.host = value;
      else if (key == Keys::SRV_PORT)
        config.serving.port = Utils::string_to_number<int>(value).value_or(
            config.serving.port);
      else if (key == Keys::SRV_WORKER_THREADS)
        config.serving.worker_threads =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.serving.worker_threads);
      else if (key == Keys::SRV_FEATURE_NAMES) {
        std::vector<std::string> names = Utils::split_string(value, ',');
        if (!names.empty())
          config.serving.feature_names = names;
      } else if (key == Keys::SRV_MODEL_FILE_NAME)
        config.serving.model_file_name = value;
      else if (key == Keys::SRV_ARTIFACT_CACHE_DIR)
        config.serving.artifact_cache_dir = value;
      else if (key == Keys::SRV_LOAD_WAIT_TIMEOUT_MS)
        config.serving.load_wait_timeout_ms =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.serving.load_wait_timeout_ms);
      else if (key == Keys::SRV_LOAD_ON_STARTUP)
        config.serving.load_on_startup = string_to_bool(value);

    } else if (current_section == "Retrain") {
      if (key == Keys::RT_JOB_COMMAND)
        config.retrain.job_command = value;
      else if (key == Keys::RT_SERVICE_NAME)
        config.retrain.service_name = value;
      else if (key == Keys::RT_JOB_TIMEOUT_SECONDS)
        config.retrain.job_timeout_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.retrain.job_timeout_seconds);
      else if (key == Keys::RT_OUTPUT_TAIL_BYTES)
        config.retrain.output_tail_bytes =
            Utils::string_to_number<size_t>(value).value_or(
                config.retrain.output_tail_bytes);

    } else if (current_section == "Monitor") {
      if (key == Keys::MON_ENABLED)
        config.monitor.enabled = string_to_bool(value);
      else if (key == Keys::MON_SIGNAL_FILE_PATH)
        config.monitor.signal_file_path = value;
      else if (key == Keys::MON_POLL_INTERVAL_SECONDS)
        config.monitor.poll_interval_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.monitor.poll_interval_seconds);
      else if (key == Keys::MON_RELOAD_URL)
        config.monitor.reload_url = value;

    } else if (current_section == "Metrics") {
      if (key == Keys::METRICS_ENABLED)
        config.metrics.enabled = string_to_bool(value);
      else if (key == Keys::METRICS_PATH)
        config.metrics.path = value;

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "retrain.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        } else {
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
        }
      }
    } else {
      std::cerr << "Warning (Config Line " << line_num
                << "): Unknown section '" << current_section << "'"
                << std::endl;
    }
  }

  return true;
}

ServerCommandLine parse_server_command_line(int argc,
                                            const char *const argv[]) {
  ServerCommandLine result;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        result.action = CommandLineAction::USAGE_ERROR;
        result.error = "--config requires a file path";
        return result;
      }
      result.config_file = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      result.action = CommandLineAction::SHOW_HELP;
      return result;
    } else {
      result.action = CommandLineAction::USAGE_ERROR;
      result.error = "Unknown argument: " + arg;
      return result;
    }
  }
  return result;
}

ConfigManager::ConfigManager() {
  auto defaults = std::make_shared<AppConfig>();
  apply_default_log_levels(defaults->logging);
  apply_environment_overrides(*defaults);

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*defaults, validation_errors)) {
    std::cerr << "Environment overrides are invalid, ignoring them:"
              << std::endl;
    for (const auto &error : validation_errors)
      std::cerr << "  - " << error << std::endl;
    defaults = std::make_shared<AppConfig>();
    apply_default_log_levels(defaults->logging);
  }
  current_config_ = defaults;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  apply_environment_overrides(*new_config);

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
