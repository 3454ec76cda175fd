#ifndef MODEL_SERVER_HPP
#define MODEL_SERVER_HPP

#include "registry/registry_client.hpp"
#include "serving/model_loader.hpp"
#include "serving/reload_target.hpp"
#include "serving/serving_state.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct HealthStatus {
  bool model_loaded = false;
  bool model_available = false;
  std::optional<uint64_t> model_version;
  std::string model_name;
};

struct ModelInfo {
  std::string model_name;
  bool has_production = false;
  std::optional<ModelVersion> production;
  std::map<std::string, double> metrics;
  std::map<std::string, std::string> params;
  std::map<std::string, uint64_t> aliases;
  size_t version_count = 0;
  // Version this process is serving, which may lag behind production
  std::optional<uint64_t> serving_version;
  // False when the registry could not be queried; only model_name and
  // serving_version are meaningful then
  bool registry_available = true;
  std::string registry_error;
};

struct ModelServerConfig {
  std::string model_name;
  // 0 accepts whatever arity the loaded model declares
  size_t feature_count = 0;
  // How long health() waits for a load already in progress
  std::chrono::milliseconds load_wait_timeout{2000};
};

// Serves predictions from the production version of one registered model.
// Loads lazily on first use, reloads on demand and never replaces a working
// model with a broken one.
class ModelServer : public IReloadTarget {
public:
  ModelServer(std::shared_ptr<IRegistryClient> registry,
               std::shared_ptr<IModelLoader> loader, ModelServerConfig config);

  // Throws ModelUnavailableError when nothing is loaded and nothing can be,
  // std::invalid_argument on a wrong feature count
  int predict(const std::vector<double> &features);

  // Never throws
  HealthStatus health();

  // Never throws; registry failures are reported in the result
  ModelInfo model_info();

  bool reload() override;

  std::shared_ptr<const ServingSnapshot> snapshot() const {
    return state_.get();
  }
  const ModelServerConfig &get_config() const { return config_; }

private:
  // Requires load_mutex_. force=false keeps an already loaded model.
  bool load_production_locked(bool force);
  // Loads unless something is already served; waits at most `wait` for a
  // concurrent load (forever when nullopt)
  bool ensure_loaded(std::optional<std::chrono::milliseconds> wait);

  std::shared_ptr<IRegistryClient> registry_;
  std::shared_ptr<IModelLoader> loader_;
  ModelServerConfig config_;

  ServingState state_;
  std::timed_mutex load_mutex_;
};

#endif // MODEL_SERVER_HPP
