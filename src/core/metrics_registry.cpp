#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add({});
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {

  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add({});
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {

  auto &histogram_family =
      prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);

  return histogram_family.Add({}, bucket_boundaries);
}

prometheus::Family<prometheus::Counter> &
MetricsRegistry::create_counter_family(const std::string &name,
                                       const std::string &help) {
  return prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
}

std::string MetricsRegistry::serialize_text() {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}

LifecycleMetrics &LifecycleMetrics::instance() {
  static LifecycleMetrics metrics;
  return metrics;
}

LifecycleMetrics::LifecycleMetrics()
    : prediction_requests(MetricsRegistry::instance().create_counter(
          "prediction_requests_total", "Total prediction requests")),
      retrain_requests(MetricsRegistry::instance().create_counter(
          "model_retrain_total", "Total model retrain requests")),
      reloads(MetricsRegistry::instance().create_counter_family(
          "model_reloads_total", "Serving model reload attempts by result")),
      promotions(MetricsRegistry::instance().create_counter_family(
          "model_promotions_total",
          "Promotion decisions by outcome (promoted or challenger)")),
      retrain_jobs(MetricsRegistry::instance().create_counter_family(
          "retrain_jobs_total", "Retrain job runs by final status")),
      serving_model_version(MetricsRegistry::instance().create_gauge(
          "serving_model_version",
          "Registry version currently served, 0 when nothing is loaded")),
      inference_duration(MetricsRegistry::instance().create_histogram(
          "model_inference_duration_seconds",
          "Latency of a single model prediction call.",
          {0.0001, 0.0005, 0.001, 0.005, 0.01, 0.05, 0.1})) {}
