#include "tollgate/cost/cost_tracker.hpp"

#include "tollgate/common/json.hpp"
#include "tollgate/common/strings.hpp"
#include "tollgate/observability/global.hpp"

#include <algorithm>
#include <sstream>

namespace tollgate::cost {

namespace {

void buckets_json(std::ostringstream &out, const std::vector<CostBucket> &buckets) {
  out << "[";
  for (std::size_t i = 0; i < buckets.size(); ++i) {
    out << (i == 0 ? "" : ",") << "{\"start\":" << common::json_quote(common::format_utc(buckets[i].start))
        << ",\"cost_usd\":" << common::json_number(buckets[i].cost_usd, 4)
        << ",\"calls\":" << buckets[i].calls << "}";
  }
  out << "]";
}

alerts::AlertLevel alert_level_for(const BudgetLevel level) {
  return level == BudgetLevel::Warning ? alerts::AlertLevel::Warning
                                       : alerts::AlertLevel::Critical;
}

} // namespace

std::string TrackerSnapshot::to_json() const {
  std::ostringstream out;
  out << "{\"name\":" << common::json_quote(name)
      << ",\"budget_usd\":"
      << (options.budget_usd.has_value() ? common::json_number(*options.budget_usd, 2) : "null")
      << ",\"enforce_budget\":" << (options.enforce_budget ? "true" : "false")
      << ",\"scope_id\":" << common::json_optional(options.scope_id)
      << ",\"summary\":" << summary.to_json() << ",\"budget\":" << budget.to_json()
      << ",\"hourly_costs\":";
  buckets_json(out, hourly);
  out << ",\"daily_costs\":";
  buckets_json(out, daily);
  out << "}";
  return out.str();
}

CostTracker::CostTracker(std::string name, TrackerOptions options,
                         std::shared_ptr<const PriceTable> prices,
                         std::shared_ptr<common::Clock> clock,
                         std::shared_ptr<alerts::IAlertSink> alert_sink,
                         std::shared_ptr<IUsageSink> usage_sink)
    : name_(std::move(name)), options_(std::move(options)),
      prices_(prices != nullptr ? std::move(prices) : std::make_shared<const PriceTable>()),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      alert_sink_(std::move(alert_sink)), usage_sink_(std::move(usage_sink)) {}

double CostTracker::estimate_cost(const std::string &model, const std::uint64_t input_tokens,
                                  const std::uint64_t output_tokens) const {
  return prices_->estimate(model, input_tokens, output_tokens);
}

TrackResult CostTracker::track_usage(const UsageRequest &request) {
  UsageRecord record{
      .provider = request.provider,
      .model = request.model,
      .input_tokens = request.input_tokens,
      .output_tokens = request.output_tokens,
      .estimated_cost_usd = estimate_cost(request.model, request.input_tokens,
                                          request.output_tokens),
      .layer = request.layer,
      .run_id = request.run_id,
      .scope = request.scope.has_value() ? request.scope : options_.scope_id,
      .timestamp = clock_->now(),
  };

  std::optional<BudgetStatus> crossed;
  std::optional<UsageSummary> exceeded;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    total_cost_ += record.estimated_cost_usd;

    const BudgetStatus status =
        make_budget_status(name_, options_.budget_usd, total_cost_, options_.warning_percent,
                           options_.critical_percent);
    if (status.level > alerted_level_) {
      alerted_level_ = status.level;
      crossed = status;
    }
    if (options_.enforce_budget && status.is_exceeded) {
      exceeded = summarize(records_);
    }
  }

  observability::record_usage(observability::UsageTrackedEvent{
      .tracker = name_,
      .provider = record.provider,
      .model = record.model,
      .input_tokens = record.input_tokens,
      .output_tokens = record.output_tokens,
      .cost_usd = record.estimated_cost_usd,
  });

  if (usage_sink_ != nullptr) {
    const auto appended = usage_sink_->append(name_, record);
    if (!appended.ok()) {
      observability::record_error("cost_tracker", "usage ledger append failed for '" + name_ +
                                                      "': " + appended.error());
    }
  }

  if (crossed.has_value() && alert_sink_ != nullptr) {
    alert_sink_->deliver(alerts::make_alert(
        alert_level_for(crossed->level), "cost_tracker",
        "Budget for '" + name_ + "' " + budget_level_to_string(crossed->level) + ": $" +
            common::format_fixed(crossed->used_usd, 4) + " / $" +
            common::format_fixed(crossed->budget_usd.value_or(0.0), 2),
        {{"tracker", name_},
         {"used_usd", common::format_fixed(crossed->used_usd, 4)},
         {"budget_usd", common::format_fixed(crossed->budget_usd.value_or(0.0), 2)},
         {"used_percent", common::format_fixed(crossed->used_percent.value_or(0.0), 1)}},
        record.timestamp));
  }

  if (exceeded.has_value()) {
    const double budget = options_.budget_usd.value_or(0.0);
    observability::record_budget_exceeded(name_, exceeded->total_cost_usd, budget);
    return TrackResult::failure(
        BudgetExceededError{.summary = std::move(*exceeded), .budget_usd = budget});
  }
  return TrackResult::success(std::move(record));
}

UsageSummary CostTracker::summary(const UsageFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return summarize(records_, filter);
}

std::vector<UsageRecord> CostTracker::usages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

std::optional<double> CostTracker::remaining_budget() const {
  if (!options_.budget_usd.has_value()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return std::max(0.0, *options_.budget_usd - total_cost_locked());
}

bool CostTracker::is_budget_exceeded() const {
  if (!options_.budget_usd.has_value()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return total_cost_locked() > *options_.budget_usd;
}

BudgetStatus CostTracker::budget_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return make_budget_status(name_, options_.budget_usd, total_cost_locked(),
                            options_.warning_percent, options_.critical_percent);
}

std::vector<CostBucket> CostTracker::hourly_costs(const std::size_t hours) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bucket_costs(records_, CostPeriod::Hourly, hours, clock_->now());
}

std::vector<CostBucket> CostTracker::daily_costs(const std::size_t days) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bucket_costs(records_, CostPeriod::Daily, days, clock_->now());
}

TrackerSnapshot CostTracker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_->now();
  return TrackerSnapshot{
      .name = name_,
      .options = options_,
      .summary = summarize(records_),
      .budget = make_budget_status(name_, options_.budget_usd, total_cost_locked(),
                                   options_.warning_percent, options_.critical_percent),
      .hourly = bucket_costs(records_, CostPeriod::Hourly, SNAPSHOT_HOURS, now),
      .daily = bucket_costs(records_, CostPeriod::Daily, SNAPSHOT_DAYS, now),
  };
}

std::string CostTracker::to_json() const { return snapshot().to_json(); }

void CostTracker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  total_cost_ = 0.0;
  alerted_level_ = BudgetLevel::Ok;
}

double CostTracker::total_cost_locked() const { return total_cost_; }

} // namespace tollgate::cost
