#include "tollgate/metrics/aggregator.hpp"

#include "tollgate/common/json.hpp"
#include "tollgate/common/strings.hpp"
#include "tollgate/observability/global.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace tollgate::metrics {

namespace {

void add_to(cost::UsageBreakdown &target, const cost::UsageBreakdown &source) {
  target.input_tokens += source.input_tokens;
  target.output_tokens += source.output_tokens;
  target.cost_usd += source.cost_usd;
  target.calls += source.calls;
}

void breakdown_json(std::ostringstream &out,
                    const std::map<std::string, cost::UsageBreakdown> &groups) {
  out << "{";
  bool first = true;
  for (const auto &[key, group] : groups) {
    out << (first ? "" : ",") << common::json_quote(key)
        << ":{\"input_tokens\":" << group.input_tokens
        << ",\"output_tokens\":" << group.output_tokens
        << ",\"cost_usd\":" << common::json_number(group.cost_usd, 4)
        << ",\"calls\":" << group.calls << "}";
    first = false;
  }
  out << "}";
}

std::string optional_number(const std::optional<double> &value, const int decimals) {
  return value.has_value() ? common::json_number(*value, decimals) : "null";
}

std::string optional_count(const std::optional<std::uint64_t> &value) {
  return value.has_value() ? std::to_string(*value) : "null";
}

std::string string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    out += (i == 0 ? "" : ",") + common::json_quote(values[i]);
  }
  return out + "]";
}

double seconds(const std::chrono::milliseconds value) {
  return static_cast<double>(value.count()) / 1000.0;
}

template <typename Snapshot>
std::vector<Snapshot> collect(const common::IStatsSource<Snapshot> &source,
                              const std::string &component, SystemHealth &health) {
  try {
    auto stats = source.all_stats();
    if (stats.ok()) {
      return std::move(stats.value());
    }
    health.add_issue("health check error: " + component + ": " + stats.error());
    observability::record_error("metrics", component + ": " + stats.error());
  } catch (const std::exception &e) {
    health.add_issue("health check error: " + component + ": " + e.what());
    observability::record_error("metrics", component + ": " + e.what());
  }
  return {};
}

void check_breakers(const CircuitBreakerMetrics &breakers, SystemHealth &health) {
  for (const auto &[service, data] : breakers.by_service) {
    if (data.state == breaker::CircuitState::Open) {
      health.add_issue("Circuit breaker '" + service +
                       "' is OPEN: " + data.last_failure_reason.value_or("unknown"));
    } else if (data.state == breaker::CircuitState::HalfOpen) {
      health.add_warning("Circuit breaker '" + service + "' is recovering (HALF_OPEN)");
    }
  }
}

void check_rate_limits(const RateLimitMetrics &limits, const double warning_percent,
                       SystemHealth &health) {
  for (const auto &[provider, data] : limits.by_provider) {
    if (!data.daily_limit.has_value() || !data.remaining_daily.has_value()) {
      continue;
    }
    if (*data.remaining_daily == 0) {
      health.add_issue("Rate limit for '" + provider + "' EXHAUSTED (0 remaining)");
      continue;
    }
    const double limit = static_cast<double>(*data.daily_limit);
    const double used_percent =
        (limit - static_cast<double>(*data.remaining_daily)) / limit * 100.0;
    if (used_percent >= warning_percent) {
      health.add_warning("Rate limit for '" + provider + "' at " +
                         common::format_fixed(used_percent, 0) + "% (" +
                         std::to_string(*data.remaining_daily) + " remaining)");
    }
  }
}

} // namespace

std::string health_to_string(const HealthStatus status) {
  switch (status) {
  case HealthStatus::Healthy:
    return "healthy";
  case HealthStatus::Degraded:
    return "degraded";
  case HealthStatus::Unhealthy:
    return "unhealthy";
  }
  return "unhealthy";
}

void SystemHealth::add_issue(std::string issue) {
  issues.push_back(std::move(issue));
  status = HealthStatus::Unhealthy;
}

void SystemHealth::add_warning(std::string warning) {
  warnings.push_back(std::move(warning));
  if (status == HealthStatus::Healthy) {
    status = HealthStatus::Degraded;
  }
}

std::string SystemHealth::to_json() const {
  return "{\"status\":" + common::json_quote(health_to_string(status)) +
         ",\"issues\":" + string_array(issues) + ",\"warnings\":" + string_array(warnings) + "}";
}

std::string TokenMetrics::to_json() const {
  std::ostringstream out;
  out << "{\"total_input_tokens\":" << total_input_tokens
      << ",\"total_output_tokens\":" << total_output_tokens
      << ",\"total_cost_usd\":" << common::json_number(total_cost_usd, 4) << ",\"by_tracker\":";
  breakdown_json(out, by_tracker);
  out << ",\"by_provider\":";
  breakdown_json(out, by_provider);
  out << ",\"by_layer\":";
  breakdown_json(out, by_layer);
  out << "}";
  return out.str();
}

std::string RateLimitMetrics::to_json() const {
  std::ostringstream out;
  out << "{\"total_requests\":" << total_requests << ",\"total_waits\":" << total_waits
      << ",\"total_wait_time_seconds\":" << common::json_number(seconds(total_wait_time), 2)
      << ",\"by_provider\":{";
  bool first = true;
  for (const auto &[provider, data] : by_provider) {
    out << (first ? "" : ",") << common::json_quote(provider)
        << ":{\"total_requests\":" << data.total_requests
        << ",\"requests_today\":" << data.requests_today
        << ",\"requests_this_minute\":" << data.requests_this_minute
        << ",\"waits_count\":" << data.waits_count
        << ",\"wait_time_seconds\":" << common::json_number(seconds(data.wait_time), 2)
        << ",\"remaining_daily\":" << optional_count(data.remaining_daily)
        << ",\"daily_limit\":" << optional_count(data.daily_limit)
        << ",\"requests_per_minute\":" << data.requests_per_minute << "}";
    first = false;
  }
  out << "}}";
  return out.str();
}

std::string CircuitBreakerMetrics::to_json() const {
  std::ostringstream out;
  out << "{\"total_breakers\":" << total_breakers << ",\"open_breakers\":" << open_breakers
      << ",\"half_open_breakers\":" << half_open_breakers
      << ",\"closed_breakers\":" << closed_breakers << ",\"total_calls\":" << total_calls
      << ",\"total_failures\":" << total_failures << ",\"total_rejections\":" << total_rejections
      << ",\"by_service\":{";
  bool first = true;
  for (const auto &[service, data] : by_service) {
    out << (first ? "" : ",") << common::json_quote(service)
        << ":{\"state\":" << common::json_quote(breaker::state_to_string(data.state))
        << ",\"total_calls\":" << data.total_calls << ",\"failed_calls\":" << data.failed_calls
        << ",\"rejected_calls\":" << data.rejected_calls
        << ",\"consecutive_failures\":" << data.consecutive_failures
        << ",\"last_failure_reason\":" << common::json_optional(data.last_failure_reason)
        << ",\"time_remaining_seconds\":" << common::json_number(seconds(data.time_remaining), 1)
        << "}";
    first = false;
  }
  out << "}}";
  return out.str();
}

std::string BudgetMetrics::to_json() const {
  std::ostringstream out;
  out << "{\"total_budget_usd\":" << optional_number(total_budget_usd, 2)
      << ",\"total_used_usd\":" << common::json_number(total_used_usd, 4)
      << ",\"total_remaining_usd\":" << optional_number(total_remaining_usd, 4)
      << ",\"overall_used_percent\":" << optional_number(overall_used_percent, 1)
      << ",\"trackers_exceeded\":" << trackers_exceeded
      << ",\"trackers_warning\":" << trackers_warning
      << ",\"trackers_critical\":" << trackers_critical << ",\"by_tracker\":{";
  bool first = true;
  for (const auto &[name, status] : by_tracker) {
    out << (first ? "" : ",") << common::json_quote(name) << ":" << status.to_json();
    first = false;
  }
  out << "}}";
  return out.str();
}

std::string MetricsSnapshot::to_json() const {
  std::ostringstream out;
  out << "{\"timestamp\":" << common::json_quote(common::format_utc(timestamp))
      << ",\"uptime_seconds\":" << common::json_number(uptime_seconds, 1)
      << ",\"system_health\":" << system_health.to_json() << ",\"tokens\":" << tokens.to_json()
      << ",\"rate_limits\":" << rate_limits.to_json()
      << ",\"circuit_breakers\":" << circuit_breakers.to_json()
      << ",\"budget\":" << budget.to_json() << "}";
  return out.str();
}

std::string CostHistory::to_json() const {
  std::ostringstream out;
  out << "{\"period\":" << common::json_quote(cost::period_to_string(period))
      << ",\"total_cost_usd\":" << common::json_number(total_cost_usd, 4)
      << ",\"average_cost_usd\":" << common::json_number(average_cost_usd, 4)
      << ",\"peak_cost_usd\":" << common::json_number(peak_cost_usd, 4) << ",\"buckets\":[";
  for (std::size_t i = 0; i < buckets.size(); ++i) {
    out << (i == 0 ? "" : ",")
        << "{\"start\":" << common::json_quote(common::format_utc(buckets[i].start))
        << ",\"cost_usd\":" << common::json_number(buckets[i].cost_usd, 4)
        << ",\"calls\":" << buckets[i].calls << "}";
  }
  out << "]}";
  return out.str();
}

CostHistory make_cost_history(const cost::CostPeriod period,
                              std::vector<cost::CostBucket> buckets) {
  CostHistory out{.period = period, .buckets = std::move(buckets)};
  for (const auto &bucket : out.buckets) {
    out.total_cost_usd += bucket.cost_usd;
    out.peak_cost_usd = std::max(out.peak_cost_usd, bucket.cost_usd);
  }
  if (!out.buckets.empty()) {
    out.average_cost_usd = out.total_cost_usd / static_cast<double>(out.buckets.size());
  }
  return out;
}

TokenMetrics token_metrics(const std::vector<cost::TrackerSnapshot> &trackers) {
  TokenMetrics out;
  for (const auto &tracker : trackers) {
    const auto &summary = tracker.summary;
    out.total_input_tokens += summary.total_input_tokens;
    out.total_output_tokens += summary.total_output_tokens;
    out.total_cost_usd += summary.total_cost_usd;
    out.by_tracker[tracker.name] = cost::UsageBreakdown{
        .input_tokens = summary.total_input_tokens,
        .output_tokens = summary.total_output_tokens,
        .cost_usd = summary.total_cost_usd,
        .calls = summary.calls_count,
    };
    for (const auto &[provider, group] : summary.by_provider) {
      add_to(out.by_provider[provider], group);
    }
    for (const auto &[layer, group] : summary.by_layer) {
      add_to(out.by_layer[layer], group);
    }
  }
  return out;
}

BudgetMetrics budget_metrics(const std::vector<cost::TrackerSnapshot> &trackers) {
  BudgetMetrics out;
  bool has_unlimited = false;
  double total_budget = 0.0;
  double total_remaining = 0.0;
  for (const auto &tracker : trackers) {
    const auto &status = tracker.budget;
    out.by_tracker[tracker.name] = status;
    out.total_used_usd += status.used_usd;
    switch (status.level) {
    case cost::BudgetLevel::Exceeded:
      ++out.trackers_exceeded;
      break;
    case cost::BudgetLevel::Critical:
      ++out.trackers_critical;
      break;
    case cost::BudgetLevel::Warning:
      ++out.trackers_warning;
      break;
    case cost::BudgetLevel::Ok:
      break;
    }
    if (!status.budget_usd.has_value()) {
      has_unlimited = true;
      continue;
    }
    total_budget += *status.budget_usd;
    total_remaining += status.remaining_usd.value_or(0.0);
  }
  if (!has_unlimited && total_budget > 0.0) {
    out.total_budget_usd = total_budget;
    out.total_remaining_usd = total_remaining;
    out.overall_used_percent = out.total_used_usd / total_budget * 100.0;
  }
  return out;
}

RateLimitMetrics rate_limit_metrics(const std::vector<ratelimit::RateLimitSnapshot> &limiters) {
  RateLimitMetrics out;
  for (const auto &limiter : limiters) {
    const auto &stats = limiter.stats;
    out.total_requests += stats.total_requests;
    out.total_waits += stats.waits_count;
    out.total_wait_time += stats.total_wait_time;
    out.by_provider[limiter.provider] = ProviderRateMetrics{
        .total_requests = stats.total_requests,
        .requests_today = stats.requests_today,
        .requests_this_minute = stats.requests_this_minute,
        .waits_count = stats.waits_count,
        .wait_time = stats.total_wait_time,
        .remaining_daily = limiter.remaining_daily,
        .daily_limit = limiter.config.daily_limit,
        .requests_per_minute = limiter.config.requests_per_minute,
    };
  }
  return out;
}

CircuitBreakerMetrics circuit_breaker_metrics(const std::vector<breaker::BreakerSnapshot> &breakers) {
  CircuitBreakerMetrics out;
  for (const auto &snapshot : breakers) {
    const auto &stats = snapshot.stats;
    ++out.total_breakers;
    switch (stats.state) {
    case breaker::CircuitState::Open:
      ++out.open_breakers;
      break;
    case breaker::CircuitState::HalfOpen:
      ++out.half_open_breakers;
      break;
    case breaker::CircuitState::Closed:
      ++out.closed_breakers;
      break;
    }
    out.total_calls += stats.total_calls;
    out.total_failures += stats.failed_calls;
    out.total_rejections += stats.rejected_calls;
    out.by_service[snapshot.name] = ServiceBreakerMetrics{
        .state = stats.state,
        .total_calls = stats.total_calls,
        .failed_calls = stats.failed_calls,
        .rejected_calls = stats.rejected_calls,
        .consecutive_failures = stats.consecutive_failures,
        .last_failure_reason = stats.last_failure_reason,
        .time_remaining = snapshot.time_remaining,
    };
  }
  return out;
}

MetricsAggregator::MetricsAggregator(
    const common::IStatsSource<breaker::BreakerSnapshot> &breakers,
    const common::IStatsSource<ratelimit::RateLimitSnapshot> &rate_limits,
    const common::IStatsSource<cost::TrackerSnapshot> &trackers,
    std::shared_ptr<common::Clock> clock, const double rate_warning_percent,
    const cost::ICostHistorySource *history)
    : breakers_(breakers), rate_limits_(rate_limits), trackers_(trackers), history_(history),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      rate_warning_percent_(rate_warning_percent), started_at_(clock_->now()) {}

MetricsSnapshot MetricsAggregator::snapshot() const {
  MetricsSnapshot out;
  out.timestamp = clock_->now();
  out.uptime_seconds = common::to_seconds(out.timestamp - started_at_);

  SystemHealth &health = out.system_health;
  out.circuit_breakers = circuit_breaker_metrics(collect(breakers_, "circuit_breakers", health));
  out.rate_limits = rate_limit_metrics(collect(rate_limits_, "rate_limits", health));
  const auto trackers = collect(trackers_, "cost_trackers", health);
  out.tokens = token_metrics(trackers);
  out.budget = budget_metrics(trackers);

  check_breakers(out.circuit_breakers, health);
  check_rate_limits(out.rate_limits, rate_warning_percent_, health);
  return out;
}

common::Result<CostHistory> MetricsAggregator::cost_history(const cost::CostPeriod period,
                                                            const std::size_t count) const {
  if (history_ == nullptr) {
    return common::Result<CostHistory>::failure("no cost history source configured");
  }
  if (const auto checked = cost::check_bucket_count(period, count); !checked.ok()) {
    return common::Result<CostHistory>::failure(checked.error());
  }
  auto buckets = history_->cost_buckets(period, count);
  if (!buckets.ok()) {
    return common::Result<CostHistory>::failure(buckets.error());
  }
  return common::Result<CostHistory>::success(
      make_cost_history(period, std::move(buckets.value())));
}

void MetricsAggregator::reset() { started_at_ = clock_->now(); }

} // namespace tollgate::metrics
