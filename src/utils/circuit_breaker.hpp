#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace circuit_breaker {

enum class State {
  CLOSED,   // Normal operation
  OPEN,     // Circuit breaker open, rejecting calls
  HALF_OPEN // Testing if service has recovered
};

class CircuitBreaker {
public:
  struct Config {
    size_t failure_threshold;
    // How long the circuit stays OPEN before a trial call is let through
    std::chrono::milliseconds timeout;
    size_t success_threshold;

    Config()
        : failure_threshold(5), timeout(std::chrono::milliseconds(30000)),
          success_threshold(1) {}
  };

  explicit CircuitBreaker(const std::string &name,
                          const Config &config = Config{});
  ~CircuitBreaker() = default;

  // False while OPEN; moves OPEN -> HALF_OPEN once the timeout has elapsed
  bool allow_request();

  void record_success();
  void record_failure();

  State get_state() const;
  std::string get_state_string() const;
  size_t get_failure_count() const;
  const std::string &get_name() const { return name_; }

  void reset();

private:
  void transition_to_state(State new_state);

  const std::string name_;
  const Config config_;

  mutable std::mutex mutex_;
  State state_ = State::CLOSED;
  size_t failure_count_ = 0;
  size_t consecutive_failures_ = 0;
  size_t consecutive_successes_ = 0;
  std::chrono::steady_clock::time_point state_change_time_;
};

} // namespace circuit_breaker
