#pragma once

#include "tollgate/common/clock.hpp"
#include "tollgate/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::cost {

struct UsageRecord {
  std::string provider;
  std::string model;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  double estimated_cost_usd = 0.0;
  std::optional<std::string> layer;
  std::optional<std::string> run_id;
  std::optional<std::string> scope;
  common::TimePoint timestamp{};

  [[nodiscard]] std::uint64_t total_tokens() const { return input_tokens + output_tokens; }
  [[nodiscard]] std::string to_json() const;
};

struct UsageRequest {
  std::string provider;
  std::string model;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  std::optional<std::string> layer;
  std::optional<std::string> run_id;
  std::optional<std::string> scope;
};

struct UsageBreakdown {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  double cost_usd = 0.0;
  std::uint64_t calls = 0;
};

struct UsageSummary {
  std::uint64_t total_input_tokens = 0;
  std::uint64_t total_output_tokens = 0;
  double total_cost_usd = 0.0;
  std::uint64_t calls_count = 0;
  std::map<std::string, UsageBreakdown> by_provider;
  /// Records without a layer are grouped under "unknown".
  std::map<std::string, UsageBreakdown> by_layer;

  [[nodiscard]] std::uint64_t total_tokens() const {
    return total_input_tokens + total_output_tokens;
  }
  [[nodiscard]] std::string to_json() const;
};

struct UsageFilter {
  std::optional<std::string> run_id;
  std::optional<std::string> scope;

  [[nodiscard]] bool matches(const UsageRecord &record) const;
};

struct BudgetExceededError {
  UsageSummary summary;
  double budget_usd = 0.0;

  [[nodiscard]] std::string message() const;
};

enum class BudgetLevel { Ok, Warning, Critical, Exceeded };

[[nodiscard]] std::string budget_level_to_string(BudgetLevel level);

struct BudgetStatus {
  std::string name;
  std::optional<double> budget_usd;
  double used_usd = 0.0;
  std::optional<double> remaining_usd;
  std::optional<double> used_percent;
  bool is_exceeded = false;
  BudgetLevel level = BudgetLevel::Ok;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] BudgetStatus make_budget_status(const std::string &name,
                                              std::optional<double> budget_usd, double used_usd,
                                              double warning_percent, double critical_percent);

enum class CostPeriod { Hourly, Daily };

[[nodiscard]] std::string period_to_string(CostPeriod period);
[[nodiscard]] std::optional<CostPeriod> parse_period(const std::string &value);

struct CostBucket {
  common::TimePoint start{};
  double cost_usd = 0.0;
  std::uint64_t calls = 0;
};

[[nodiscard]] UsageSummary summarize(const std::vector<UsageRecord> &records,
                                     const UsageFilter &filter = {});

/// One leap year of hours, ten years of days.
inline constexpr std::size_t MAX_HOURLY_BUCKETS = 8784;
inline constexpr std::size_t MAX_DAILY_BUCKETS = 3660;

[[nodiscard]] std::size_t max_buckets(CostPeriod period);
[[nodiscard]] common::Status check_bucket_count(CostPeriod period, std::size_t count);

/// Dense series of `count` buckets ending with the one containing `now`, oldest first. Buckets
/// without usage are present with zero cost. `count` is clamped to max_buckets(period).
[[nodiscard]] std::vector<CostBucket> bucket_costs(const std::vector<UsageRecord> &records,
                                                   CostPeriod period, std::size_t count,
                                                   common::TimePoint now);

} // namespace tollgate::cost
