#include "serving/model_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"

#include <stdexcept>

ModelServer::ModelServer(std::shared_ptr<IRegistryClient> registry,
                         std::shared_ptr<IModelLoader> loader,
                         ModelServerConfig config)
    : registry_(std::move(registry)), loader_(std::move(loader)),
      config_(std::move(config)) {
  if (!registry_ || !loader_)
    throw std::invalid_argument("ModelServer needs a registry and a loader");
  LOG(LogLevel::INFO, LogComponent::SERVING,
      "ModelServer created for model '" << config_.model_name << "'");
}

bool ModelServer::load_production_locked(bool force) {
  auto &metrics = LifecycleMetrics::instance();
  auto current = state_.get();
  if (!force && current)
    return true;

  std::optional<ModelVersion> production;
  try {
    production =
        registry_->get_version_by_alias(config_.model_name, Alias::PRODUCTION);
  } catch (const RegistryError &e) {
    LOG(LogLevel::ERROR, LogComponent::ML_LIFECYCLE,
        "Registry lookup failed, keeping current model: " << e.what());
    metrics.reloads.Add({{"result", "failure"}}).Increment();
    return false;
  }

  if (!production) {
    LOG(LogLevel::WARN, LogComponent::ML_LIFECYCLE,
        "No production version registered for '" << config_.model_name
                                                 << "'");
    metrics.reloads.Add({{"result", "failure"}}).Increment();
    return false;
  }

  if (current && current->version.version == production->version) {
    LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
        "Production version " << production->version
                              << " is already being served");
    metrics.reloads.Add({{"result", "unchanged"}}).Increment();
    return true;
  }

  std::shared_ptr<const IClassifierModel> model;
  try {
    model = loader_->load(*production);
  } catch (const ModelLoadError &e) {
    LOG(LogLevel::ERROR, LogComponent::ML_LIFECYCLE,
        "Could not load version " << production->version
                                  << ", keeping current model: " << e.what());
    metrics.reloads.Add({{"result", "failure"}}).Increment();
    return false;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::ML_LIFECYCLE,
        "Unexpected error loading version " << production->version
                                            << ": " << e.what());
    metrics.reloads.Add({{"result", "failure"}}).Increment();
    return false;
  }

  if (!model ||
      (config_.feature_count && model->feature_count() != config_.feature_count)) {
    LOG(LogLevel::ERROR, LogComponent::ML_LIFECYCLE,
        "Version " << production->version << " expects "
                   << (model ? model->feature_count() : 0) << " features, "
                   << config_.feature_count
                   << " are configured; keeping current model");
    metrics.reloads.Add({{"result", "failure"}}).Increment();
    return false;
  }

  auto snapshot = std::make_shared<ServingSnapshot>();
  snapshot->model = std::move(model);
  snapshot->version = *production;
  snapshot->loaded_at = std::chrono::system_clock::now();
  state_.swap(snapshot);

  metrics.serving_model_version.Set(static_cast<double>(production->version));
  metrics.reloads.Add({{"result", "success"}}).Increment();
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Now serving " << config_.model_name << " v" << production->version
                     << " (" << snapshot->model->get_kind() << ")");
  return true;
}

bool ModelServer::ensure_loaded(std::optional<std::chrono::milliseconds> wait) {
  if (state_.get())
    return true;

  std::unique_lock<std::timed_mutex> lock(load_mutex_, std::defer_lock);
  if (wait) {
    if (!lock.try_lock_for(*wait)) {
      LOG(LogLevel::DEBUG, LogComponent::SERVING,
          "Gave up waiting for an in-progress model load");
      return state_.get() != nullptr;
    }
  } else {
    lock.lock();
  }
  // Another caller may have finished the load while we waited
  return load_production_locked(false);
}

int ModelServer::predict(const std::vector<double> &features) {
  auto snapshot = state_.get();
  if (!snapshot) {
    ensure_loaded(std::nullopt);
    snapshot = state_.get();
  }
  if (!snapshot)
    throw ModelUnavailableError(
        "Model not available. Please train the model first.");

  auto &metrics = LifecycleMetrics::instance();
  metrics.prediction_requests.Increment();

  ScopedTimer timer(metrics.inference_duration);
  int label = snapshot->model->predict(features);
  LOG(LogLevel::TRACE, LogComponent::ML_INFERENCE,
      "v" << snapshot->version.version << " predicted " << label);
  return label;
}

HealthStatus ModelServer::health() {
  HealthStatus status;
  status.model_name = config_.model_name;
  status.model_available = ensure_loaded(config_.load_wait_timeout);

  auto snapshot = state_.get();
  status.model_loaded = snapshot != nullptr;
  if (snapshot)
    status.model_version = snapshot->version.version;
  return status;
}

ModelInfo ModelServer::model_info() {
  ModelInfo info;
  info.model_name = config_.model_name;

  if (auto snapshot = state_.get())
    info.serving_version = snapshot->version.version;

  try {
    info.aliases = registry_->get_aliases(config_.model_name);
    info.version_count = registry_->list_versions(config_.model_name).size();
    info.production =
        registry_->get_version_by_alias(config_.model_name, Alias::PRODUCTION);
    info.has_production = info.production.has_value();

    if (info.production) {
      if (auto run = registry_->get_run(info.production->run_id)) {
        info.metrics = run->metrics;
        info.params = run->params;
      }
    }
  } catch (const RegistryError &e) {
    LOG(LogLevel::WARN, LogComponent::SERVING,
        "Model info for '" << config_.model_name
                           << "' is partial, registry query failed: "
                           << e.what());
    ModelInfo partial;
    partial.model_name = info.model_name;
    partial.serving_version = info.serving_version;
    partial.registry_available = false;
    partial.registry_error = e.what();
    return partial;
  }
  return info;
}

bool ModelServer::reload() {
  std::lock_guard<std::timed_mutex> lock(load_mutex_);
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Reloading production model for '" << config_.model_name << "'");
  return load_production_locked(true);
}
