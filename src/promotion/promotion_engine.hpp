#ifndef PROMOTION_ENGINE_HPP
#define PROMOTION_ENGINE_HPP

#include "registry/registry_client.hpp"

#include <cstdint>
#include <memory>
#include <string>

struct PromotionOutcome {
  uint64_t version = 0;
  bool promoted = false;
  double metric = 0.0;
  double baseline = 0.0;
  // Alias the new version ended up with
  Alias alias = Alias::NONE;
};

// Decides whether a freshly registered version replaces the production one
// and records the decision as an alias in the registry.
class PromotionEngine {
public:
  PromotionEngine(std::shared_ptr<IRegistryClient> registry,
                  std::string metric_name);

  // Strict: equal quality never promotes
  static bool should_promote(double metric, double baseline) {
    return metric > baseline;
  }

  // Metric of the version holding the production alias, read from its run
  // and falling back to the version's own metric; 0.0 without a production
  // version.
  double current_production_metric(const std::string &model_name);

  // Registers the candidate (alias none), then moves exactly one alias onto
  // it: production when it beats the baseline, challenger otherwise. If the
  // alias step fails the version stays registered with alias none.
  PromotionOutcome register_and_decide(const std::string &model_name,
                                       RegistrationRequest request);

private:
  std::shared_ptr<IRegistryClient> registry_;
  std::string metric_name_;
};

#endif // PROMOTION_ENGINE_HPP
