#include "utils/circuit_breaker.hpp"
#include <gtest/gtest.h>
#include <thread>

using circuit_breaker::CircuitBreaker;
using circuit_breaker::State;

namespace {
CircuitBreaker::Config make_config(size_t threshold,
                                   std::chrono::milliseconds timeout) {
  CircuitBreaker::Config config;
  config.failure_threshold = threshold;
  config.timeout = timeout;
  return config;
}
} // namespace

TEST(CircuitBreakerTest, OpensAfterConsecutiveFailures) {
  CircuitBreaker breaker("test", make_config(3, std::chrono::seconds(60)));
  breaker.record_failure();
  breaker.record_failure();
  EXPECT_EQ(breaker.get_state(), State::CLOSED);
  EXPECT_TRUE(breaker.allow_request());

  breaker.record_failure();
  EXPECT_EQ(breaker.get_state(), State::OPEN);
  EXPECT_FALSE(breaker.allow_request());
  EXPECT_EQ(breaker.get_failure_count(), 3u);
}

TEST(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
  CircuitBreaker breaker("test", make_config(2, std::chrono::seconds(60)));
  breaker.record_failure();
  breaker.record_success();
  breaker.record_failure();
  EXPECT_EQ(breaker.get_state(), State::CLOSED);
}

TEST(CircuitBreakerTest, HalfOpenTrialDecidesNextState) {
  CircuitBreaker breaker("test", make_config(1, std::chrono::milliseconds(20)));
  breaker.record_failure();
  ASSERT_EQ(breaker.get_state(), State::OPEN);

  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  EXPECT_TRUE(breaker.allow_request());
  EXPECT_EQ(breaker.get_state(), State::HALF_OPEN);

  // Failed trial re-opens at once
  breaker.record_failure();
  EXPECT_EQ(breaker.get_state(), State::OPEN);

  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  EXPECT_TRUE(breaker.allow_request());
  breaker.record_success();
  EXPECT_EQ(breaker.get_state(), State::CLOSED);
  EXPECT_EQ(breaker.get_state_string(), "CLOSED");
}

TEST(CircuitBreakerTest, Reset) {
  CircuitBreaker breaker("test", make_config(1, std::chrono::seconds(60)));
  breaker.record_failure();
  breaker.reset();
  EXPECT_EQ(breaker.get_state(), State::CLOSED);
  EXPECT_EQ(breaker.get_failure_count(), 0u);
}
