#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::config {

struct ObservabilityConfig {
  std::string backend = "log";
};

struct AlertsConfig {
  std::string sink = "log";
  double budget_warning_percent = 80.0;
  double budget_critical_percent = 90.0;
  double rate_limit_warning_percent = 90.0;
};

struct BreakerConfig {
  std::uint32_t failure_threshold = 5;
  std::uint32_t success_threshold = 3;
  std::uint64_t recovery_timeout_ms = 30'000;
  std::uint32_t half_open_max_calls = 3;
  double failure_rate_threshold = 0.5;
  std::uint32_t min_calls_for_rate = 10;
  std::vector<std::string> excluded_failure_kinds;
};

struct RateLimitConfig {
  std::uint32_t requests_per_minute = 60;
  std::optional<std::uint64_t> daily_limit;
  bool allow_wait = true;
  std::uint64_t max_wait_ms = 60'000;
};

struct BudgetConfig {
  std::optional<double> budget_usd = 100.0;
  bool enforce = false;
};

struct ModelPrice {
  double input_per_million = 0.0;
  double output_per_million = 0.0;
};

struct PricingConfig {
  ModelPrice default_price{.input_per_million = 2.0, .output_per_million = 8.0};
  std::map<std::string, ModelPrice> models;
};

struct LedgerConfig {
  bool enabled = false;
  std::string path = "~/.tollgate/usage.db";
};

[[nodiscard]] std::map<std::string, BreakerConfig> default_breakers();
[[nodiscard]] std::map<std::string, RateLimitConfig> default_rate_limits();

struct Config {
  ObservabilityConfig observability;
  AlertsConfig alerts;
  BreakerConfig breaker_defaults;
  std::map<std::string, BreakerConfig> breakers = default_breakers();
  RateLimitConfig rate_limit_defaults;
  std::map<std::string, RateLimitConfig> rate_limits = default_rate_limits();
  BudgetConfig budget;
  PricingConfig pricing;
  LedgerConfig ledger;

  [[nodiscard]] BreakerConfig breaker_for(const std::string &service) const;
  [[nodiscard]] RateLimitConfig rate_limit_for(const std::string &provider) const;
};

} // namespace tollgate::config
