#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help);

  // Prometheus text exposition of everything registered so far
  std::string serialize_text();

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

// Process-wide lifecycle metrics, registered once on first use
struct LifecycleMetrics {
  static LifecycleMetrics &instance();

  prometheus::Counter &prediction_requests;
  prometheus::Counter &retrain_requests;
  prometheus::Family<prometheus::Counter> &reloads;
  prometheus::Family<prometheus::Counter> &promotions;
  prometheus::Family<prometheus::Counter> &retrain_jobs;
  prometheus::Gauge &serving_model_version;
  prometheus::Histogram &inference_duration;

private:
  LifecycleMetrics();
};

#endif // METRICS_REGISTRY_HPP
