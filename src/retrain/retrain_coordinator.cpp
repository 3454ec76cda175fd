#include "retrain/retrain_coordinator.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <stdexcept>

namespace {

// Clears the running flag however run() leaves
class RunningFlag {
public:
  explicit RunningFlag(std::atomic<bool> &flag) : flag_(flag) { flag_ = true; }
  ~RunningFlag() { flag_ = false; }

  RunningFlag(const RunningFlag &) = delete;
  RunningFlag &operator=(const RunningFlag &) = delete;

private:
  std::atomic<bool> &flag_;
};

} // namespace

const char *submit_status_to_string(SubmitStatus status) {
  switch (status) {
  case SubmitStatus::ACCEPTED:
    return "accepted";
  case SubmitStatus::COALESCED:
    return "coalesced";
  case SubmitStatus::REJECTED:
    return "rejected";
  }
  return "unknown";
}

RetrainCoordinator::RetrainCoordinator(
    std::shared_ptr<IJobRunner> runner,
    std::shared_ptr<IReloadTarget> reload_target,
    RetrainCoordinatorConfig config)
    : runner_(std::move(runner)), reload_target_(std::move(reload_target)),
      config_(std::move(config)) {
  if (!runner_ || !reload_target_)
    throw std::invalid_argument(
        "RetrainCoordinator needs a job runner and a reload target");
  worker_ = std::thread(&RetrainCoordinator::worker_loop, this);
}

RetrainCoordinator::~RetrainCoordinator() { shutdown(); }

void RetrainCoordinator::shutdown() {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (shutdown_requested_ && !worker_.joinable())
      return;
    shutdown_requested_ = true;
    if (pending_) {
      LOG(LogLevel::WARN, LogComponent::RETRAIN_JOB,
          "Dropping pending retrain request (" << pending_->source
                                               << ") on shutdown");
      pending_.reset();
    }
  }
  pending_cv_.notify_all();
  if (worker_.joinable()) {
    if (running_)
      LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
          "Waiting for the in-flight retrain job to finish...");
    worker_.join();
  }
}

RetrainReport RetrainCoordinator::run(const RetrainRequest &request) {
  std::lock_guard<std::mutex> lock(run_mutex_);
  RunningFlag running(running_);

  LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
      "Starting model retraining (" << request.source << "): "
                                    << request.reason);

  RetrainReport report;
  try {
    report.outcome = runner_->trigger(config_.service_name, config_.job_timeout);
  } catch (const std::exception &e) {
    report.outcome = JobOutcome{};
    report.outcome.status = JobStatus::LAUNCH_FAILED;
    report.outcome.error = e.what();
  }
  const JobOutcome &outcome = report.outcome;

  LifecycleMetrics::instance()
      .retrain_jobs.Add({{"status", job_status_to_string(outcome.status)}})
      .Increment();

  switch (outcome.status) {
  case JobStatus::SUCCEEDED:
    LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
        "Pipeline completed successfully in " << outcome.elapsed.count()
                                              << " ms");
    LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
        "Output: " << outcome.output_tail);
    break;
  case JobStatus::FAILED:
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
        "Pipeline failed with code " << outcome.exit_code);
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
        "Error: " << outcome.output_tail);
    break;
  case JobStatus::TIMED_OUT:
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
        "Pipeline timed out after " << config_.job_timeout.count()
                                    << " seconds");
    break;
  case JobStatus::LAUNCH_FAILED:
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
        "Pipeline could not be started: " << outcome.error);
    break;
  }

  // A failed retrain leaves production untouched, so this is a no-op then
  try {
    report.reloaded = reload_target_->reload();
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
        "Reload after retraining threw: " << e.what());
    report.reloaded = false;
  }
  if (report.reloaded)
    LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
        "Model reloaded after retraining");
  else
    LOG(LogLevel::WARN, LogComponent::RETRAIN_JOB,
        "Reload after retraining failed; previous model stays active");

  completed_runs_++;
  return report;
}

SubmitStatus RetrainCoordinator::submit(RetrainRequest request) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (shutdown_requested_)
      return SubmitStatus::REJECTED;
    if (pending_) {
      LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
          "Retrain already pending, coalescing request from "
              << request.source);
      return SubmitStatus::COALESCED;
    }
    pending_ = std::move(request);
  }
  pending_cv_.notify_one();
  return SubmitStatus::ACCEPTED;
}

void RetrainCoordinator::worker_loop() {
  while (true) {
    RetrainRequest request;
    {
      std::unique_lock<std::mutex> lock(pending_mutex_);
      pending_cv_.wait(lock,
                       [this] { return pending_ || shutdown_requested_; });
      if (shutdown_requested_)
        break;
      request = std::move(*pending_);
      pending_.reset();
    }

    try {
      run(request);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
          "Error during model retraining: " << e.what());
    }
  }
  LOG(LogLevel::DEBUG, LogComponent::RETRAIN_JOB,
      "Retrain worker thread finished.");
}
