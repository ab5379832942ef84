#include "tollgate/cost/usage.hpp"

#include "tollgate/common/json.hpp"
#include "tollgate/common/strings.hpp"

#include <algorithm>
#include <sstream>

namespace tollgate::cost {

namespace {

void add_to(UsageBreakdown &breakdown, const UsageRecord &record) {
  breakdown.input_tokens += record.input_tokens;
  breakdown.output_tokens += record.output_tokens;
  breakdown.cost_usd += record.estimated_cost_usd;
  ++breakdown.calls;
}

void breakdown_json(std::ostringstream &out, const std::map<std::string, UsageBreakdown> &groups) {
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

} // namespace

std::string UsageRecord::to_json() const {
  std::ostringstream out;
  out << "{\"provider\":" << common::json_quote(provider)
      << ",\"model\":" << common::json_quote(model) << ",\"input_tokens\":" << input_tokens
      << ",\"output_tokens\":" << output_tokens
      << ",\"estimated_cost_usd\":" << common::json_number(estimated_cost_usd, 6)
      << ",\"layer\":" << common::json_optional(layer)
      << ",\"run_id\":" << common::json_optional(run_id)
      << ",\"scope\":" << common::json_optional(scope)
      << ",\"timestamp\":" << common::json_quote(common::format_utc(timestamp)) << "}";
  return out.str();
}

std::string UsageSummary::to_json() const {
  std::ostringstream out;
  out << "{\"total_input_tokens\":" << total_input_tokens
      << ",\"total_output_tokens\":" << total_output_tokens
      << ",\"total_tokens\":" << total_tokens()
      << ",\"total_cost_usd\":" << common::json_number(total_cost_usd, 4)
      << ",\"calls_count\":" << calls_count << ",\"by_provider\":";
  breakdown_json(out, by_provider);
  out << ",\"by_layer\":";
  breakdown_json(out, by_layer);
  out << "}";
  return out.str();
}

bool UsageFilter::matches(const UsageRecord &record) const {
  if (run_id.has_value() && record.run_id != run_id) {
    return false;
  }
  if (scope.has_value() && record.scope != scope) {
    return false;
  }
  return true;
}

std::string BudgetExceededError::message() const {
  return "Token budget exceeded: $" + common::format_fixed(summary.total_cost_usd, 4) + " / $" +
         common::format_fixed(budget_usd, 2) + " (" + std::to_string(summary.total_tokens()) +
         " tokens across " + std::to_string(summary.calls_count) + " calls)";
}

std::string budget_level_to_string(const BudgetLevel level) {
  switch (level) {
  case BudgetLevel::Ok:
    return "ok";
  case BudgetLevel::Warning:
    return "warning";
  case BudgetLevel::Critical:
    return "critical";
  case BudgetLevel::Exceeded:
    return "exceeded";
  }
  return "ok";
}

std::string BudgetStatus::to_json() const {
  std::ostringstream out;
  out << "{\"name\":" << common::json_quote(name)
      << ",\"budget_usd\":" << optional_number(budget_usd, 2)
      << ",\"used_usd\":" << common::json_number(used_usd, 4)
      << ",\"remaining_usd\":" << optional_number(remaining_usd, 4)
      << ",\"used_percent\":" << optional_number(used_percent, 1)
      << ",\"is_exceeded\":" << (is_exceeded ? "true" : "false")
      << ",\"status\":" << common::json_quote(budget_level_to_string(level)) << "}";
  return out.str();
}

BudgetStatus make_budget_status(const std::string &name, const std::optional<double> budget_usd,
                                const double used_usd, const double warning_percent,
                                const double critical_percent) {
  BudgetStatus status{.name = name, .budget_usd = budget_usd, .used_usd = used_usd};
  if (!budget_usd.has_value()) {
    return status;
  }
  status.remaining_usd = std::max(0.0, *budget_usd - used_usd);
  const double percent = *budget_usd > 0.0 ? used_usd / *budget_usd * 100.0 : 100.0;
  status.used_percent = percent;
  status.is_exceeded = used_usd > *budget_usd;
  if (status.is_exceeded) {
    status.level = BudgetLevel::Exceeded;
  } else if (percent >= critical_percent) {
    status.level = BudgetLevel::Critical;
  } else if (percent >= warning_percent) {
    status.level = BudgetLevel::Warning;
  }
  return status;
}

std::string period_to_string(const CostPeriod period) {
  return period == CostPeriod::Daily ? "daily" : "hourly";
}

std::optional<CostPeriod> parse_period(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "hourly" || lowered == "hour") {
    return CostPeriod::Hourly;
  }
  if (lowered == "daily" || lowered == "day") {
    return CostPeriod::Daily;
  }
  return std::nullopt;
}

UsageSummary summarize(const std::vector<UsageRecord> &records, const UsageFilter &filter) {
  UsageSummary summary;
  for (const auto &record : records) {
    if (!filter.matches(record)) {
      continue;
    }
    summary.total_input_tokens += record.input_tokens;
    summary.total_output_tokens += record.output_tokens;
    summary.total_cost_usd += record.estimated_cost_usd;
    ++summary.calls_count;
    add_to(summary.by_provider[record.provider], record);
    add_to(summary.by_layer[record.layer.value_or("unknown")], record);
  }
  return summary;
}

std::size_t max_buckets(const CostPeriod period) {
  return period == CostPeriod::Daily ? MAX_DAILY_BUCKETS : MAX_HOURLY_BUCKETS;
}

common::Status check_bucket_count(const CostPeriod period, const std::size_t count) {
  if (count == 0 || count > max_buckets(period)) {
    return common::Status::error("bucket count for " + period_to_string(period) +
                                 " history must be between 1 and " +
                                 std::to_string(max_buckets(period)));
  }
  return common::Status::success();
}

std::vector<CostBucket> bucket_costs(const std::vector<UsageRecord> &records,
                                     const CostPeriod period, std::size_t count,
                                     const common::TimePoint now) {
  count = std::min(count, max_buckets(period));
  if (count == 0) {
    return {};
  }
  const common::Duration width = period == CostPeriod::Daily
                                     ? common::Duration(std::chrono::hours(24))
                                     : common::Duration(std::chrono::hours(1));
  const auto floor = [period](const common::TimePoint point) {
    return period == CostPeriod::Daily ? common::floor_to_day(point) : common::floor_to_hour(point);
  };

  const common::TimePoint last = floor(now);
  const common::TimePoint first = last - width * static_cast<long>(count - 1);
  std::vector<CostBucket> buckets(count);
  for (std::size_t i = 0; i < count; ++i) {
    buckets[i].start = first + width * static_cast<long>(i);
  }

  for (const auto &record : records) {
    const common::TimePoint start = floor(record.timestamp);
    if (start < first || start > last) {
      continue;
    }
    const auto index = static_cast<std::size_t>((start - first) / width);
    buckets[index].cost_usd += record.estimated_cost_usd;
    ++buckets[index].calls;
  }
  return buckets;
}

} // namespace tollgate::cost
