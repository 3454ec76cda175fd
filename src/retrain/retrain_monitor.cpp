#include "retrain/retrain_monitor.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <stdexcept>

RetrainMonitor::RetrainMonitor(std::string signal_file_path,
                               std::shared_ptr<RetrainCoordinator> coordinator,
                               std::chrono::seconds poll_interval)
    : signal_(std::move(signal_file_path)),
      coordinator_(std::move(coordinator)), poll_interval_(poll_interval) {
  if (!coordinator_)
    throw std::invalid_argument("RetrainMonitor needs a coordinator");
  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Initialized retraining monitor with signal file: "
          << signal_.get_path() << ", check interval: "
          << poll_interval_.count() << " seconds");
}

RetrainMonitor::~RetrainMonitor() { stop(); }

void RetrainMonitor::start() {
  if (thread_.joinable())
    return;
  shutdown_flag_ = false;
  thread_ = std::thread(&RetrainMonitor::run, this);
}

void RetrainMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(cv_mutex_);
    shutdown_flag_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    LOG(LogLevel::DEBUG, LogComponent::RETRAIN_MONITOR,
        "Monitor thread joined successfully.");
  }
}

bool RetrainMonitor::poll_once() {
  if (!signal_.exists()) {
    LOG(LogLevel::DEBUG, LogComponent::RETRAIN_MONITOR,
        "No signal file found at " << signal_.get_path());
    return false;
  }

  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Retraining signal file detected: " << signal_.get_path());

  // Another observer may have claimed it between the check and the claim
  auto signal = signal_.claim();
  if (!signal)
    return false;

  LifecycleMetrics::instance().retrain_requests.Increment();
  processed_signals_++;
  coordinator_->run({signal->payload, "signal"});
  return true;
}

void RetrainMonitor::run() {
  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Watching for signal file: " << signal_.get_path());

  while (!shutdown_flag_) {
    try {
      poll_once();
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
          "Error while handling retrain signal: " << e.what());
    }

    // Sleep for the poll interval, but allow shutdown to interrupt it
    std::unique_lock<std::mutex> lock(cv_mutex_);
    if (cv_.wait_for(lock, poll_interval_,
                     [this] { return shutdown_flag_.load(); }))
      break;
  }
  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Retraining monitor stopped.");
}
