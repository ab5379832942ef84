#pragma once

#include "tollgate/config/schema.hpp"

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

[[nodiscard]] std::string check_status_to_string(CheckStatus status);

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;

  [[nodiscard]] bool healthy() const { return failed == 0; }
  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config);
void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out);
void print_diagnostics_report(const DiagnosticsReport &report);

} // namespace tollgate::doctor
