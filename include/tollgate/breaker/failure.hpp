#pragma once

#include <optional>
#include <string>

namespace tollgate::breaker {

/// Closed set of failure categories. Breakers can be configured to ignore some of them,
/// typically `validation` (a bad request says nothing about the service's health).
enum class FailureKind { Transient, Timeout, RateLimited, Validation, Authentication, Fatal, Unknown };

[[nodiscard]] std::string failure_kind_to_string(FailureKind kind);
[[nodiscard]] std::optional<FailureKind> parse_failure_kind(const std::string &value);

struct Failure {
  FailureKind kind = FailureKind::Unknown;
  std::string message;

  [[nodiscard]] std::string describe() const;
  [[nodiscard]] std::string message_or_kind() const;
};

} // namespace tollgate::breaker
