#include "tollgate/alerts/alert.hpp"

#include "tollgate/common/json.hpp"
#include "tollgate/common/strings.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace tollgate::alerts {

namespace {

constexpr std::size_t FINGERPRINT_LENGTH = 12;

} // namespace

std::string level_to_string(const AlertLevel level) {
  switch (level) {
  case AlertLevel::Info:
    return "info";
  case AlertLevel::Warning:
    return "warning";
  case AlertLevel::Error:
    return "error";
  case AlertLevel::Critical:
    return "critical";
  }
  return "info";
}

std::optional<AlertLevel> parse_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "info") {
    return AlertLevel::Info;
  }
  if (normalized == "warning" || normalized == "warn") {
    return AlertLevel::Warning;
  }
  if (normalized == "error") {
    return AlertLevel::Error;
  }
  if (normalized == "critical") {
    return AlertLevel::Critical;
  }
  return std::nullopt;
}

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    out << std::setw(2) << static_cast<int>(c);
  }
  return out.str();
}

Alert make_alert(const AlertLevel level, std::string source, std::string message,
                 std::map<std::string, std::string> metadata, const common::TimePoint timestamp) {
  Alert alert{.level = level,
              .source = std::move(source),
              .message = std::move(message),
              .metadata = std::move(metadata),
              .timestamp = timestamp};
  alert.fingerprint =
      sha256_hex(level_to_string(alert.level) + ":" + alert.source + ":" + alert.message)
          .substr(0, FINGERPRINT_LENGTH);
  return alert;
}

std::string Alert::to_json() const {
  std::ostringstream out;
  out << "{\"fingerprint\":" << common::json_quote(fingerprint)
      << ",\"level\":" << common::json_quote(level_to_string(level))
      << ",\"source\":" << common::json_quote(source)
      << ",\"message\":" << common::json_quote(message)
      << ",\"timestamp\":" << common::json_quote(common::format_utc(timestamp))
      << ",\"metadata\":{";
  bool first = true;
  for (const auto &[key, value] : metadata) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(key) << ":" << common::json_quote(value);
  }
  out << "}}";
  return out.str();
}

} // namespace tollgate::alerts
