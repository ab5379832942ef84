#pragma once

#include "tollgate/alerts/sink.hpp"
#include "tollgate/common/clock.hpp"
#include "tollgate/common/result.hpp"
#include "tollgate/cost/pricing.hpp"
#include "tollgate/cost/usage.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::cost {

class IUsageSink {
public:
  virtual ~IUsageSink() = default;

  virtual common::Status append(const std::string &tracker, const UsageRecord &record) = 0;
};

struct TrackerOptions {
  std::optional<double> budget_usd;
  bool enforce_budget = false;
  std::optional<std::string> scope_id;
  double warning_percent = 80.0;
  double critical_percent = 90.0;
};

struct TrackerSnapshot {
  std::string name;
  TrackerOptions options;
  UsageSummary summary;
  BudgetStatus budget;
  std::vector<CostBucket> hourly;
  std::vector<CostBucket> daily;

  [[nodiscard]] std::string to_json() const;
};

using TrackResult = common::Result<UsageRecord, BudgetExceededError>;

class CostTracker {
public:
  static constexpr std::size_t SNAPSHOT_HOURS = 24;
  static constexpr std::size_t SNAPSHOT_DAYS = 7;

  CostTracker(std::string name, TrackerOptions options,
              std::shared_ptr<const PriceTable> prices = nullptr,
              std::shared_ptr<common::Clock> clock = nullptr,
              std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr,
              std::shared_ptr<IUsageSink> usage_sink = nullptr);

  CostTracker(const CostTracker &) = delete;
  CostTracker &operator=(const CostTracker &) = delete;

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const TrackerOptions &options() const { return options_; }

  [[nodiscard]] double estimate_cost(const std::string &model, std::uint64_t input_tokens,
                                     std::uint64_t output_tokens) const;

  /// Appends the record, then fails with BudgetExceededError when enforcement is on and the
  /// cumulative cost is strictly above the budget. The record is kept either way.
  TrackResult track_usage(const UsageRequest &request);

  [[nodiscard]] UsageSummary summary(const UsageFilter &filter = {}) const;
  [[nodiscard]] std::vector<UsageRecord> usages() const;
  [[nodiscard]] std::optional<double> remaining_budget() const;
  [[nodiscard]] bool is_budget_exceeded() const;
  [[nodiscard]] BudgetStatus budget_status() const;

  [[nodiscard]] std::vector<CostBucket> hourly_costs(std::size_t hours) const;
  [[nodiscard]] std::vector<CostBucket> daily_costs(std::size_t days) const;

  [[nodiscard]] TrackerSnapshot snapshot() const;
  [[nodiscard]] std::string to_json() const;

  void reset();

private:
  [[nodiscard]] double total_cost_locked() const;

  const std::string name_;
  const TrackerOptions options_;
  std::shared_ptr<const PriceTable> prices_;
  std::shared_ptr<common::Clock> clock_;
  std::shared_ptr<alerts::IAlertSink> alert_sink_;
  std::shared_ptr<IUsageSink> usage_sink_;

  mutable std::mutex mutex_;
  std::vector<UsageRecord> records_;
  double total_cost_ = 0.0;
  BudgetLevel alerted_level_ = BudgetLevel::Ok;
};

} // namespace tollgate::cost
