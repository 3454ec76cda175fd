#include "registry/registry_factory.hpp"
#include "core/logger.hpp"
#include "io/db/mongo_manager.hpp"
#include "registry/in_memory_registry.hpp"
#include "registry/mlflow_registry_client.hpp"
#include "registry/mongo_registry_client.hpp"

#include <stdexcept>

std::shared_ptr<IRegistryClient>
make_registry_client(const Config::RegistryConfig &config) {
  std::shared_ptr<IRegistryClient> client;

  if (config.backend == "memory") {
    client = std::make_shared<InMemoryRegistry>();
  } else if (config.backend == "file") {
    client = std::make_shared<InMemoryRegistry>(config.file_path);
  } else if (config.backend == "mlflow") {
    MlflowClientConfig mlflow_config;
    mlflow_config.tracking_uri = config.tracking_uri;
    mlflow_config.metric_name = config.metric_name;
    mlflow_config.experiment_name = config.experiment_name;
    mlflow_config.timeout = std::chrono::milliseconds(config.request_timeout_ms);
    mlflow_config.max_retries = static_cast<int>(config.max_retries);
    mlflow_config.circuit_breaker_threshold =
        config.circuit_breaker_failure_threshold;
    mlflow_config.circuit_breaker_recovery =
        std::chrono::seconds(config.circuit_breaker_recovery_timeout_seconds);
    client = std::make_shared<MlflowRegistryClient>(mlflow_config);
  } else if (config.backend == "mongodb") {
    auto mongo_manager = std::make_shared<MongoManager>(
        config.mongo_uri, config.request_timeout_ms);
    client = std::make_shared<MongoRegistryClient>(mongo_manager,
                                                   config.mongo_database);
  } else {
    throw std::invalid_argument("Unknown registry backend '" + config.backend +
                                "'");
  }

  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Using '" << client->get_name() << "' model registry");
  return client;
}
