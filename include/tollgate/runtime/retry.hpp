#pragma once

#include "tollgate/breaker/circuit_breaker.hpp"
#include "tollgate/common/clock.hpp"
#include "tollgate/ratelimit/rate_limiter.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <variant>

namespace tollgate::runtime {

/// The rate limiter gave up waiting (max wait reached, or the daily cap is spent).
struct AdmissionTimeout {
  std::string provider;

  [[nodiscard]] std::string message() const;
};

struct GuardError {
  std::variant<ratelimit::RateLimitExceededError, AdmissionTimeout, breaker::CircuitOpenError,
               breaker::Failure>
      detail;

  [[nodiscard]] static GuardError from(const breaker::CallError &error);

  [[nodiscard]] bool circuit_open() const {
    return std::holds_alternative<breaker::CircuitOpenError>(detail);
  }
  [[nodiscard]] bool rate_limited() const {
    return std::holds_alternative<ratelimit::RateLimitExceededError>(detail) ||
           std::holds_alternative<AdmissionTimeout>(detail);
  }
  [[nodiscard]] const breaker::Failure *failure() const {
    return std::get_if<breaker::Failure>(&detail);
  }
  [[nodiscard]] std::string message() const;
};

struct RetryPolicy {
  std::uint32_t max_retries = 2;
  std::uint64_t backoff_ms = 500;
};

/// Transient, timeout, rate-limited and unknown failures are worth another attempt.
[[nodiscard]] bool is_retryable(const breaker::Failure &failure);
/// Rejections by an open circuit or by the rate limiter are returned to the caller as is.
[[nodiscard]] bool is_retryable(const breaker::CallError &error);
[[nodiscard]] bool is_retryable(const GuardError &error);

/// backoff_ms * 2^attempt. Doubling stops at attempt 20 and the product saturates.
[[nodiscard]] std::chrono::milliseconds backoff_delay(const RetryPolicy &policy,
                                                      std::uint32_t attempt);

/// Runs fn up to 1 + max_retries times with exponential backoff on the given clock. Stops at the
/// first success or non-retryable error and returns the last outcome.
template <typename Fn>
auto call_with_retries(Fn &&fn, const RetryPolicy &policy, common::Clock &clock) {
  using Outcome = std::invoke_result_t<Fn &>;
  for (std::uint32_t attempt = 0;; ++attempt) {
    Outcome outcome = std::invoke(fn);
    if (outcome.ok() || attempt >= policy.max_retries || !is_retryable(outcome.error())) {
      return outcome;
    }
    clock.sleep_for(backoff_delay(policy, attempt));
  }
}

} // namespace tollgate::runtime
