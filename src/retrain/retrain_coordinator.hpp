#ifndef RETRAIN_COORDINATOR_HPP
#define RETRAIN_COORDINATOR_HPP

#include "retrain/job_runner.hpp"
#include "serving/reload_target.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct RetrainRequest {
  std::string reason;
  std::string source; // "signal", "http", ...
};

struct RetrainReport {
  JobOutcome outcome;
  bool reloaded = false;
};

enum class SubmitStatus { ACCEPTED, COALESCED, REJECTED };

const char *submit_status_to_string(SubmitStatus status);

struct RetrainCoordinatorConfig {
  std::string service_name = "train-model";
  std::chrono::seconds job_timeout{600};
};

// Single-flight guard around "run the retrain job, then reload".
//
// run() executes a request on the calling thread; concurrent callers queue
// on the run lock so jobs never overlap. submit() hands a request to the
// coordinator's own worker and returns at once. While a submitted request
// is still waiting to start, further submissions are folded into it.
class RetrainCoordinator {
public:
  RetrainCoordinator(std::shared_ptr<IJobRunner> runner,
                     std::shared_ptr<IReloadTarget> reload_target,
                     RetrainCoordinatorConfig config);
  ~RetrainCoordinator();

  RetrainCoordinator(const RetrainCoordinator &) = delete;
  RetrainCoordinator &operator=(const RetrainCoordinator &) = delete;

  RetrainReport run(const RetrainRequest &request);
  SubmitStatus submit(RetrainRequest request);

  bool is_running() const { return running_.load(); }
  uint64_t completed_runs() const { return completed_runs_.load(); }

  // Drops a pending submission and waits for the in-flight job, if any
  void shutdown();

private:
  void worker_loop();

  std::shared_ptr<IJobRunner> runner_;
  std::shared_ptr<IReloadTarget> reload_target_;
  RetrainCoordinatorConfig config_;

  std::mutex run_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> completed_runs_{0};

  std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::optional<RetrainRequest> pending_;
  bool shutdown_requested_ = false;
  std::thread worker_;
};

#endif // RETRAIN_COORDINATOR_HPP
