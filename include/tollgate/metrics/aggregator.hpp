#pragma once

#include "tollgate/breaker/circuit_breaker.hpp"
#include "tollgate/common/clock.hpp"
#include "tollgate/common/registry.hpp"
#include "tollgate/cost/cost_tracker.hpp"
#include "tollgate/cost/registry.hpp"
#include "tollgate/ratelimit/rate_limiter.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::metrics {

struct TokenMetrics {
  std::uint64_t total_input_tokens = 0;
  std::uint64_t total_output_tokens = 0;
  double total_cost_usd = 0.0;
  std::map<std::string, cost::UsageBreakdown> by_tracker;
  std::map<std::string, cost::UsageBreakdown> by_provider;
  std::map<std::string, cost::UsageBreakdown> by_layer;

  [[nodiscard]] std::string to_json() const;
};

struct ProviderRateMetrics {
  std::uint64_t total_requests = 0;
  std::uint64_t requests_today = 0;
  std::uint64_t requests_this_minute = 0;
  std::uint64_t waits_count = 0;
  std::chrono::milliseconds wait_time{0};
  std::optional<std::uint64_t> remaining_daily;
  std::optional<std::uint64_t> daily_limit;
  std::uint32_t requests_per_minute = 0;
};

struct RateLimitMetrics {
  std::uint64_t total_requests = 0;
  std::uint64_t total_waits = 0;
  std::chrono::milliseconds total_wait_time{0};
  std::map<std::string, ProviderRateMetrics> by_provider;

  [[nodiscard]] std::string to_json() const;
};

struct ServiceBreakerMetrics {
  breaker::CircuitState state = breaker::CircuitState::Closed;
  std::uint64_t total_calls = 0;
  std::uint64_t failed_calls = 0;
  std::uint64_t rejected_calls = 0;
  std::uint32_t consecutive_failures = 0;
  std::optional<std::string> last_failure_reason;
  std::chrono::milliseconds time_remaining{0};
};

struct CircuitBreakerMetrics {
  std::uint64_t total_breakers = 0;
  std::uint64_t open_breakers = 0;
  std::uint64_t half_open_breakers = 0;
  std::uint64_t closed_breakers = 0;
  std::uint64_t total_calls = 0;
  std::uint64_t total_failures = 0;
  std::uint64_t total_rejections = 0;
  std::map<std::string, ServiceBreakerMetrics> by_service;

  [[nodiscard]] std::string to_json() const;
};

struct BudgetMetrics {
  /// Unset when any tracker is unlimited or no tracker has a budget.
  std::optional<double> total_budget_usd;
  double total_used_usd = 0.0;
  std::optional<double> total_remaining_usd;
  std::optional<double> overall_used_percent;
  std::uint64_t trackers_exceeded = 0;
  std::uint64_t trackers_warning = 0;
  std::uint64_t trackers_critical = 0;
  std::map<std::string, cost::BudgetStatus> by_tracker;

  [[nodiscard]] std::string to_json() const;
};

enum class HealthStatus { Healthy, Degraded, Unhealthy };

[[nodiscard]] std::string health_to_string(HealthStatus status);

struct SystemHealth {
  HealthStatus status = HealthStatus::Healthy;
  std::vector<std::string> issues;
  std::vector<std::string> warnings;

  void add_issue(std::string issue);
  void add_warning(std::string warning);
  [[nodiscard]] std::string to_json() const;
};

struct MetricsSnapshot {
  common::TimePoint timestamp{};
  double uptime_seconds = 0.0;
  SystemHealth system_health;
  TokenMetrics tokens;
  RateLimitMetrics rate_limits;
  CircuitBreakerMetrics circuit_breakers;
  BudgetMetrics budget;

  [[nodiscard]] std::string to_json() const;
};

struct CostHistory {
  cost::CostPeriod period = cost::CostPeriod::Hourly;
  std::vector<cost::CostBucket> buckets;
  double total_cost_usd = 0.0;
  double average_cost_usd = 0.0;
  double peak_cost_usd = 0.0;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] CostHistory make_cost_history(cost::CostPeriod period,
                                            std::vector<cost::CostBucket> buckets);

/// Read-only roll-up of the three registries into one health snapshot. A source that fails
/// becomes a health issue instead of an error.
class MetricsAggregator {
public:
  MetricsAggregator(const common::IStatsSource<breaker::BreakerSnapshot> &breakers,
                    const common::IStatsSource<ratelimit::RateLimitSnapshot> &rate_limits,
                    const common::IStatsSource<cost::TrackerSnapshot> &trackers,
                    std::shared_ptr<common::Clock> clock = nullptr,
                    double rate_warning_percent = 90.0,
                    const cost::ICostHistorySource *history = nullptr);

  [[nodiscard]] MetricsSnapshot snapshot() const;
  [[nodiscard]] common::Result<CostHistory> cost_history(cost::CostPeriod period,
                                                         std::size_t count) const;

  void reset();

private:
  const common::IStatsSource<breaker::BreakerSnapshot> &breakers_;
  const common::IStatsSource<ratelimit::RateLimitSnapshot> &rate_limits_;
  const common::IStatsSource<cost::TrackerSnapshot> &trackers_;
  const cost::ICostHistorySource *history_;
  std::shared_ptr<common::Clock> clock_;
  double rate_warning_percent_;
  common::TimePoint started_at_;
};

[[nodiscard]] TokenMetrics token_metrics(const std::vector<cost::TrackerSnapshot> &trackers);
[[nodiscard]] BudgetMetrics budget_metrics(const std::vector<cost::TrackerSnapshot> &trackers);
[[nodiscard]] RateLimitMetrics
rate_limit_metrics(const std::vector<ratelimit::RateLimitSnapshot> &limiters);
[[nodiscard]] CircuitBreakerMetrics
circuit_breaker_metrics(const std::vector<breaker::BreakerSnapshot> &breakers);

} // namespace tollgate::metrics
