#ifndef JOB_RUNNER_HPP
#define JOB_RUNNER_HPP

#include <chrono>
#include <string>

enum class JobStatus { SUCCEEDED, FAILED, TIMED_OUT, LAUNCH_FAILED };

inline const char *job_status_to_string(JobStatus status) {
  switch (status) {
  case JobStatus::SUCCEEDED:
    return "succeeded";
  case JobStatus::FAILED:
    return "failed";
  case JobStatus::TIMED_OUT:
    return "timed_out";
  case JobStatus::LAUNCH_FAILED:
    return "launch_failed";
  }
  return "unknown";
}

struct JobOutcome {
  JobStatus status = JobStatus::LAUNCH_FAILED;
  int exit_code = -1; // -1 when the job never exited under our watch
  std::chrono::milliseconds elapsed{0};
  std::string output_tail; // last bytes of combined stdout and stderr
  std::string error;       // launch failure reason
};

// Executes the retraining job behind a name. Failures are reported in the
// outcome, not thrown.
class IJobRunner {
public:
  virtual ~IJobRunner() = default;
  virtual JobOutcome trigger(const std::string &name,
                             std::chrono::seconds timeout) = 0;
};

#endif // JOB_RUNNER_HPP
