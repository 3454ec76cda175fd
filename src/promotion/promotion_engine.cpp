#include "promotion/promotion_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

PromotionEngine::PromotionEngine(std::shared_ptr<IRegistryClient> registry,
                                 std::string metric_name)
    : registry_(std::move(registry)), metric_name_(std::move(metric_name)) {
  if (!registry_)
    throw std::invalid_argument("PromotionEngine needs a registry client");
}

double PromotionEngine::current_production_metric(const std::string &model_name) {
  auto production = registry_->get_version_by_alias(model_name, Alias::PRODUCTION);
  if (!production) {
    LOG(LogLevel::INFO, LogComponent::PROMOTION,
        "No production model found for " << model_name
                                         << ", baseline is 0.0");
    return 0.0;
  }

  double metric = production->metric;
  if (auto run = registry_->get_run(production->run_id)) {
    auto it = run->metrics.find(metric_name_);
    if (it != run->metrics.end())
      metric = it->second;
  }

  LOG(LogLevel::INFO, LogComponent::PROMOTION,
      "Current production model (v" << production->version << ") "
                                    << metric_name_ << ": " << std::fixed
                                    << std::setprecision(4) << metric);
  return metric;
}

PromotionOutcome
PromotionEngine::register_and_decide(const std::string &model_name,
                                     RegistrationRequest request) {
  request.metric_name = metric_name_;
  if (request.description.empty()) {
    std::ostringstream description;
    description << "Accuracy: " << std::fixed << std::setprecision(4)
                << request.metric;
    request.description = description.str();
  }

  ModelVersion registered = registry_->register_version(model_name, request);

  PromotionOutcome outcome;
  outcome.version = registered.version;
  outcome.metric = request.metric;
  outcome.baseline = current_production_metric(model_name);
  outcome.promoted = should_promote(outcome.metric, outcome.baseline);
  outcome.alias = outcome.promoted ? Alias::PRODUCTION : Alias::CHALLENGER;

  registry_->set_alias(model_name, outcome.alias, outcome.version);

  LifecycleMetrics::instance()
      .promotions.Add({{"outcome", outcome.promoted ? "promoted" : "challenger"}})
      .Increment();

  if (outcome.promoted) {
    LOG(LogLevel::INFO, LogComponent::PROMOTION,
        "New model (v" << outcome.version << ") promoted to production: "
                       << std::fixed << std::setprecision(4) << outcome.metric
                       << " > " << outcome.baseline);
  } else {
    LOG(LogLevel::INFO, LogComponent::PROMOTION,
        "New model (v" << outcome.version << ") kept as challenger: "
                       << std::fixed << std::setprecision(4) << outcome.metric
                       << " <= " << outcome.baseline);
  }
  return outcome;
}
