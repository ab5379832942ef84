#include "tollgate/breaker/failure.hpp"

#include "tollgate/common/strings.hpp"

#include <array>
#include <utility>

namespace tollgate::breaker {

namespace {

constexpr std::array<std::pair<FailureKind, const char *>, 7> KIND_NAMES = {{
    {FailureKind::Transient, "transient"},
    {FailureKind::Timeout, "timeout"},
    {FailureKind::RateLimited, "rate_limited"},
    {FailureKind::Validation, "validation"},
    {FailureKind::Authentication, "authentication"},
    {FailureKind::Fatal, "fatal"},
    {FailureKind::Unknown, "unknown"},
}};

} // namespace

std::string failure_kind_to_string(const FailureKind kind) {
  for (const auto &[candidate, name] : KIND_NAMES) {
    if (candidate == kind) {
      return name;
    }
  }
  return "unknown";
}

std::optional<FailureKind> parse_failure_kind(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const auto &[kind, name] : KIND_NAMES) {
    if (normalized == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string Failure::describe() const {
  return failure_kind_to_string(kind) + ": " + message_or_kind();
}

std::string Failure::message_or_kind() const {
  return message.empty() ? failure_kind_to_string(kind) : message;
}

} // namespace tollgate::breaker
