#include "tollgate/doctor/diagnostics.hpp"

#include "tollgate/alerts/sink.hpp"
#include "tollgate/common/json.hpp"
#include "tollgate/common/strings.hpp"
#include "tollgate/config/config.hpp"
#include "tollgate/cost/ledger.hpp"
#include "tollgate/cost/pricing.hpp"
#include "tollgate/runtime/governor.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace tollgate::doctor {

namespace {

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    if (validation.value().size() > 1) {
      check.message += " (+" + std::to_string(validation.value().size() - 1) + " more)";
    }
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "valid";
  return check;
}

DiagnosticCheck check_config_file() {
  DiagnosticCheck check;
  check.name = "Config file";
  auto path = config::config_path();
  if (!path.ok()) {
    check.status = CheckStatus::Fail;
    check.message = path.error();
    return check;
  }
  if (!config::config_exists()) {
    check.status = CheckStatus::Warn;
    check.message = "not found, using built-in defaults (" + path.value().string() + ")";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = path.value().string();
  return check;
}

DiagnosticCheck check_pricing(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Pricing";
  const cost::PriceTable prices(config.pricing);
  const auto &fallback = prices.default_price();
  if (fallback.input_per_million <= 0.0 && fallback.output_per_million <= 0.0) {
    check.status = CheckStatus::Warn;
    check.message = "default price is zero, unknown models are tracked as free";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = std::to_string(prices.models().size()) + " models, default $" +
                  common::format_fixed(fallback.input_per_million, 2) + "/$" +
                  common::format_fixed(fallback.output_per_million, 2) + " per 1M tokens";
  return check;
}

DiagnosticCheck check_ledger(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Ledger";
  if (!config.ledger.enabled) {
    check.status = CheckStatus::Pass;
    check.message = "disabled";
    return check;
  }

  const auto start = std::chrono::steady_clock::now();
  cost::UsageLedger ledger(config::expand_path(config.ledger.path));
  if (!ledger.is_open()) {
    check.status = CheckStatus::Fail;
    check.message = "cannot open " + ledger.path().string() + ": " + ledger.open_error();
    return check;
  }
  const auto rows = ledger.count();
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (!rows.ok()) {
    check.status = CheckStatus::Fail;
    check.message = rows.error();
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = ledger.path().string() + " records=" + std::to_string(rows.value());
  return check;
}

DiagnosticCheck check_governor(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Governor";

  auto ledger_off = config;
  ledger_off.ledger.enabled = false;
  runtime::Governor governor(std::move(ledger_off), nullptr,
                             std::make_shared<alerts::NoopAlertSink>());
  for (const auto &[service, _] : governor.config().breakers) {
    (void)governor.breakers().get_or_create(service);
  }
  for (const auto &[provider, _] : governor.config().rate_limits) {
    (void)governor.rate_limiters().get_or_create(provider);
  }
  (void)governor.global_tracker();

  const auto snapshot = governor.snapshot();
  const auto &health = snapshot.system_health;
  check.message = metrics::health_to_string(health.status) + " (" +
                  std::to_string(snapshot.circuit_breakers.total_breakers) + " breakers, " +
                  std::to_string(snapshot.rate_limits.by_provider.size()) + " rate limiters)";
  switch (health.status) {
  case metrics::HealthStatus::Healthy:
    check.status = CheckStatus::Pass;
    break;
  case metrics::HealthStatus::Degraded:
    check.status = CheckStatus::Warn;
    break;
  case metrics::HealthStatus::Unhealthy:
    check.status = CheckStatus::Fail;
    if (!health.issues.empty()) {
      check.message += ": " + health.issues.front();
    }
    break;
  }
  return check;
}

} // namespace

std::string check_status_to_string(const CheckStatus status) {
  switch (status) {
  case CheckStatus::Pass:
    return "pass";
  case CheckStatus::Fail:
    return "fail";
  case CheckStatus::Warn:
    return "warn";
  }
  return "unknown";
}

std::string DiagnosticsReport::to_json() const {
  std::ostringstream out;
  out << "{\"healthy\":" << (healthy() ? "true" : "false") << ",\"passed\":" << passed
      << ",\"failed\":" << failed << ",\"warnings\":" << warnings << ",\"checks\":[";
  for (std::size_t i = 0; i < checks.size(); ++i) {
    const auto &check = checks[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"name\":" << common::json_quote(check.name)
        << ",\"status\":" << common::json_quote(check_status_to_string(check.status))
        << ",\"message\":" << common::json_quote(check.message) << ",\"latency_ms\":";
    if (check.latency.has_value()) {
      out << check.latency->count();
    } else {
      out << "null";
    }
    out << "}";
  }
  out << "]}";
  return out.str();
}

DiagnosticsReport run_diagnostics(const config::Config &config) {
  DiagnosticsReport report;

  add_check(report, check_config_file());
  add_check(report, check_config(config));
  add_check(report, check_pricing(config));
  add_check(report, check_ledger(config));
  add_check(report, check_governor(config));
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    out << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      out << " (" << check.latency->count() << "ms)";
    }
    out << "\n";
  }

  out << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
      << report.warnings << " warnings\n";
}

void print_diagnostics_report(const DiagnosticsReport &report) {
  print_diagnostics_report(report, std::cout);
}

} // namespace tollgate::doctor
