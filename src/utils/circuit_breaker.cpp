#include "circuit_breaker.hpp"
#include "core/logger.hpp"

namespace circuit_breaker {

CircuitBreaker::CircuitBreaker(const std::string &name, const Config &config)
    : name_(name), config_(config),
      state_change_time_(std::chrono::steady_clock::now()) {}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::OPEN)
    return true;

  if (std::chrono::steady_clock::now() - state_change_time_ >=
      config_.timeout) {
    transition_to_state(State::HALF_OPEN);
    return true;
  }
  return false;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  consecutive_failures_ = 0;
  consecutive_successes_++;

  // Transition from HALF_OPEN to CLOSED after enough successes
  if (state_ == State::HALF_OPEN &&
      consecutive_successes_ >= config_.success_threshold) {
    transition_to_state(State::CLOSED);
  }
}

void CircuitBreaker::record_failure() {
  std::lock_guard<std::mutex> lock(mutex_);
  consecutive_successes_ = 0;
  consecutive_failures_++;
  failure_count_++;

  // A failed trial call re-opens immediately
  if (state_ == State::HALF_OPEN ||
      (state_ == State::CLOSED &&
       consecutive_failures_ >= config_.failure_threshold)) {
    transition_to_state(State::OPEN);
  }
}

State CircuitBreaker::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string CircuitBreaker::get_state_string() const {
  switch (get_state()) {
  case State::CLOSED:
    return "CLOSED";
  case State::OPEN:
    return "OPEN";
  case State::HALF_OPEN:
    return "HALF_OPEN";
  }
  return "UNKNOWN";
}

size_t CircuitBreaker::get_failure_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_count_;
}

void CircuitBreaker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_count_ = 0;
  consecutive_failures_ = 0;
  consecutive_successes_ = 0;
  transition_to_state(State::CLOSED);
}

// Caller holds mutex_
void CircuitBreaker::transition_to_state(State new_state) {
  if (state_ == new_state)
    return;
  state_ = new_state;
  state_change_time_ = std::chrono::steady_clock::now();
  LOG(LogLevel::WARN, LogComponent::REGISTRY,
      "Circuit breaker '" << name_ << "' is now "
                          << (new_state == State::OPEN
                                  ? "OPEN"
                                  : (new_state == State::HALF_OPEN
                                         ? "HALF_OPEN"
                                         : "CLOSED")));
}

} // namespace circuit_breaker
