#ifndef PROCESS_JOB_RUNNER_HPP
#define PROCESS_JOB_RUNNER_HPP

#include "retrain/job_runner.hpp"

#include <string>
#include <vector>

struct ProcessJobConfig {
  // Whitespace-separated argv; "{service}" is replaced by the trigger name
  std::string command_template;
  size_t output_tail_bytes = 500;
};

// Runs the configured command as a child process. On timeout the child is
// not killed: it is handed to a detached reaper that drains its output and
// collects its exit status, and the caller gets TIMED_OUT immediately.
class ProcessJobRunner : public IJobRunner {
public:
  explicit ProcessJobRunner(ProcessJobConfig config);

  JobOutcome trigger(const std::string &name,
                     std::chrono::seconds timeout) override;

  std::vector<std::string> build_argv(const std::string &name) const;

private:
  ProcessJobConfig config_;
};

#endif // PROCESS_JOB_RUNNER_HPP
