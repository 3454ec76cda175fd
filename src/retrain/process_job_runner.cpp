#include "retrain/process_job_runner.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

extern char **environ;

namespace {

// Appends `data` keeping only the last `limit` bytes
void append_tail(std::string &tail, const char *data, size_t len,
                 size_t limit) {
  tail.append(data, len);
  if (tail.size() > limit)
    tail.erase(0, tail.size() - limit);
}

// Reads whatever is available without blocking. Returns false on EOF.
bool drain_available(int fd, std::string &tail, size_t limit) {
  char buffer[4096];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      append_tail(tail, buffer, static_cast<size_t>(n), limit);
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    // EAGAIN: nothing more right now
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

int decode_wait_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

// Keeps draining and reaping a job whose caller stopped waiting for it
void reap_abandoned(pid_t pid, int fd) {
  std::thread([pid, fd] {
    std::string discarded;
    bool output_open = true;
    int status = 0;
    while (true) {
      pid_t waited = ::waitpid(pid, &status, WNOHANG);
      if (waited == pid || (waited < 0 && errno != EINTR))
        break;
      if (output_open) {
        struct pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, 500) > 0)
          output_open = drain_available(fd, discarded, 1);
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
      }
    }
    ::close(fd);
    LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
        "Abandoned job (pid " << pid << ") finished with code "
                              << decode_wait_status(status));
  }).detach();
}

} // namespace

ProcessJobRunner::ProcessJobRunner(ProcessJobConfig config)
    : config_(std::move(config)) {}

std::vector<std::string>
ProcessJobRunner::build_argv(const std::string &name) const {
  static const std::string placeholder = "{service}";
  std::vector<std::string> argv = Utils::split_whitespace(config_.command_template);
  for (auto &arg : argv) {
    size_t pos = 0;
    while ((pos = arg.find(placeholder, pos)) != std::string::npos) {
      arg.replace(pos, placeholder.size(), name);
      pos += name.size();
    }
  }
  return argv;
}

JobOutcome ProcessJobRunner::trigger(const std::string &name,
                                     std::chrono::seconds timeout) {
  JobOutcome outcome;
  const auto start = std::chrono::steady_clock::now();
  auto finish = [&outcome, start]() -> JobOutcome & {
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return outcome;
  };

  std::vector<std::string> args = build_argv(name);
  if (args.empty()) {
    outcome.status = JobStatus::LAUNCH_FAILED;
    outcome.error = "Empty job command";
    return finish();
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    outcome.status = JobStatus::LAUNCH_FAILED;
    outcome.error = std::string("pipe2: ") + std::strerror(errno);
    return finish();
  }
  const int read_fd = fds[0];
  const int write_fd = fds[1];

  posix_spawn_file_actions_t actions;
  if (::posix_spawn_file_actions_init(&actions) != 0) {
    ::close(read_fd);
    ::close(write_fd);
    outcome.status = JobStatus::LAUNCH_FAILED;
    outcome.error = "posix_spawn_file_actions_init failed";
    return finish();
  }
  // stdout and stderr both feed the pipe; both pipe ends close on exec
  if (::posix_spawn_file_actions_adddup2(&actions, write_fd, STDOUT_FILENO) != 0 ||
      ::posix_spawn_file_actions_adddup2(&actions, write_fd, STDERR_FILENO) != 0) {
    ::posix_spawn_file_actions_destroy(&actions);
    ::close(read_fd);
    ::close(write_fd);
    outcome.status = JobStatus::LAUNCH_FAILED;
    outcome.error = "posix_spawn_file_actions_adddup2 failed";
    return finish();
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &arg : args)
    argv.push_back(arg.data());
  argv.push_back(nullptr);

  LOG(LogLevel::INFO, LogComponent::RETRAIN_JOB,
      "Starting retrain job '" << name << "': " << config_.command_template);

  pid_t pid = -1;
  const int spawn_rc =
      ::posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
  ::posix_spawn_file_actions_destroy(&actions);
  ::close(write_fd);

  if (spawn_rc != 0 || pid <= 0) {
    ::close(read_fd);
    outcome.status = JobStatus::LAUNCH_FAILED;
    outcome.error = std::string("Could not start '") + args[0] +
                    "': " + std::strerror(spawn_rc);
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB, outcome.error);
    return finish();
  }

  int flags = ::fcntl(read_fd, F_GETFL);
  if (flags >= 0)
    ::fcntl(read_fd, F_SETFL, flags | O_NONBLOCK);

  const size_t limit = std::max<size_t>(1, config_.output_tail_bytes);
  const auto deadline = start + timeout;
  bool output_open = true;
  bool exited = false;
  bool lost_child = false;
  int status = 0;

  while (true) {
    pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      exited = true;
    } else if (waited < 0 && errno != EINTR) {
      LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
          "waitpid failed: " << std::strerror(errno));
      lost_child = true;
      break;
    }

    if (exited) {
      // Grandchildren may still hold the pipe; take what is there and stop
      if (output_open)
        drain_available(read_fd, outcome.output_tail, limit);
      break;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      break;

    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    int wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), 200));

    if (output_open) {
      struct pollfd pfd{read_fd, POLLIN, 0};
      int ready = ::poll(&pfd, 1, wait_ms);
      if (ready > 0)
        output_open = drain_available(read_fd, outcome.output_tail, limit);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }
  }

  if (lost_child) {
    ::close(read_fd);
    outcome.status = JobStatus::FAILED;
    outcome.error = "Lost track of the job process";
    return finish();
  }

  if (!exited) {
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_JOB,
        "Retrain job '" << name << "' timed out after " << timeout.count()
                        << " seconds; no longer tracking pid " << pid);
    reap_abandoned(pid, read_fd);
    outcome.status = JobStatus::TIMED_OUT;
    return finish();
  }

  ::close(read_fd);
  outcome.exit_code = decode_wait_status(status);
  outcome.status =
      outcome.exit_code == 0 ? JobStatus::SUCCEEDED : JobStatus::FAILED;
  return finish();
}
