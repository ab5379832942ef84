#pragma once

#include "tollgate/common/clock.hpp"

#include <map>
#include <optional>
#include <string>

namespace tollgate::alerts {

enum class AlertLevel { Info, Warning, Error, Critical };

[[nodiscard]] std::string level_to_string(AlertLevel level);
[[nodiscard]] std::optional<AlertLevel> parse_level(const std::string &value);

struct Alert {
  AlertLevel level = AlertLevel::Info;
  std::string source;
  std::string message;
  std::map<std::string, std::string> metadata;
  common::TimePoint timestamp{};
  /// First 12 hex chars of SHA-256("level:source:message"); equal alerts share it.
  std::string fingerprint;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] std::string sha256_hex(const std::string &text);

[[nodiscard]] Alert make_alert(AlertLevel level, std::string source, std::string message,
                               std::map<std::string, std::string> metadata,
                               common::TimePoint timestamp);

} // namespace tollgate::alerts
