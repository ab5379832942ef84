#include "tollgate/runtime/retry.hpp"

#include <algorithm>

namespace tollgate::runtime {

std::string AdmissionTimeout::message() const {
  return "Rate limiter for " + provider + " did not admit the call within its wait limit";
}

GuardError GuardError::from(const breaker::CallError &error) {
  if (const auto *open = error.open_error(); open != nullptr) {
    return GuardError{*open};
  }
  return GuardError{*error.failure()};
}

std::string GuardError::message() const {
  return std::visit(
      [](const auto &value) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(value)>, breaker::Failure>) {
          return value.describe();
        } else {
          return value.message();
        }
      },
      detail);
}

bool is_retryable(const breaker::Failure &failure) {
  switch (failure.kind) {
  case breaker::FailureKind::Transient:
  case breaker::FailureKind::Timeout:
  case breaker::FailureKind::RateLimited:
  case breaker::FailureKind::Unknown:
    return true;
  case breaker::FailureKind::Validation:
  case breaker::FailureKind::Authentication:
  case breaker::FailureKind::Fatal:
    return false;
  }
  return false;
}

bool is_retryable(const breaker::CallError &error) {
  const auto *failure = error.failure();
  return failure != nullptr && is_retryable(*failure);
}

std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, const std::uint32_t attempt) {
  constexpr std::uint32_t MAX_DOUBLINGS = 20;
  const auto limit = static_cast<std::uint64_t>(std::chrono::milliseconds::max().count());
  const std::uint32_t shift = std::min(attempt, MAX_DOUBLINGS);
  if (policy.backoff_ms > (limit >> shift)) {
    return std::chrono::milliseconds::max();
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(policy.backoff_ms << shift));
}

bool is_retryable(const GuardError &error) {
  const auto *failure = error.failure();
  return failure != nullptr && is_retryable(*failure);
}

} // namespace tollgate::runtime
