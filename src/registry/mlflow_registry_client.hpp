#ifndef MLFLOW_REGISTRY_CLIENT_HPP
#define MLFLOW_REGISTRY_CLIENT_HPP

#include "registry/registry_client.hpp"
#include "utils/circuit_breaker.hpp"

#include <chrono>
#include <functional>
#include <httplib.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

struct MlflowClientConfig {
  std::string tracking_uri; // e.g. "http://mlflow:5000"
  std::string metric_name = "accuracy";
  std::string experiment_name = "iris_classification";
  std::chrono::milliseconds timeout{5000}; // connect and read timeout
  int max_retries{2};                      // extra attempts, idempotent calls
  size_t circuit_breaker_threshold{5};     // failures before opening circuit
  std::chrono::seconds circuit_breaker_recovery{30};
};

// IRegistryClient over the MLflow tracking server's REST API (api/2.0).
//
// Transport failures, timeouts and 5xx answers are counted by a circuit
// breaker and reported as RegistryUnavailableError; RESOURCE_DOES_NOT_EXIST
// becomes std::nullopt; any other 4xx is a RegistryError. Reads are retried
// with linear backoff, writes that are not idempotent are not.
class MlflowRegistryClient : public IRegistryClient {
public:
  explicit MlflowRegistryClient(const MlflowClientConfig &config);
  ~MlflowRegistryClient() override = default;

  std::optional<ModelVersion> get_version_by_alias(const std::string &model_name,
                                                   Alias alias) override;
  std::optional<RunData> get_run(const std::string &run_id) override;
  ModelVersion register_version(const std::string &model_name,
                                const RegistrationRequest &request) override;
  void set_alias(const std::string &model_name, Alias alias,
                 uint64_t version) override;
  std::vector<ModelVersion>
  list_versions(const std::string &model_name) override;
  std::map<std::string, uint64_t>
  get_aliases(const std::string &model_name) override;

  const char *get_name() const override { return "mlflow"; }

  const MlflowClientConfig &get_config() const { return config_; }
  circuit_breaker::State get_circuit_state() const {
    return breaker_.get_state();
  }

private:
  struct Response {
    int status = 0;
    nlohmann::json body;

    bool ok() const { return status >= 200 && status < 300; }
    std::string error_code() const;
  };

  Response get(const std::string &path, const httplib::Params &params);
  Response post(const std::string &path, const nlohmann::json &body,
                bool idempotent);
  Response send(const std::string &description, bool idempotent,
                const std::function<httplib::Result(httplib::Client &)> &call);

  std::unique_ptr<httplib::Client> make_client() const;

  // Throws RegistryError for a non-2xx answer
  static void expect_ok(const Response &response, const std::string &context);

  ModelVersion parse_model_version(const nlohmann::json &mv);
  std::optional<double> lookup_run_metric(const std::string &run_id);
  std::string create_run(const RegistrationRequest &request);
  std::string ensure_experiment();

  MlflowClientConfig config_;
  circuit_breaker::CircuitBreaker breaker_;
};

#endif // MLFLOW_REGISTRY_CLIENT_HPP
