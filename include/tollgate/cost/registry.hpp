#pragma once

#include "tollgate/common/registry.hpp"
#include "tollgate/cost/cost_tracker.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tollgate::cost {

class ICostHistorySource {
public:
  virtual ~ICostHistorySource() = default;

  [[nodiscard]] virtual common::Result<std::vector<CostBucket>>
  cost_buckets(CostPeriod period, std::size_t count) const = 0;
};

/// Trackers by scope name ("global", a job id, ...). All share one price table and usage sink.
class CostTrackerRegistry final : public common::IStatsSource<TrackerSnapshot>,
                                  public ICostHistorySource {
public:
  explicit CostTrackerRegistry(TrackerOptions defaults = {},
                               std::shared_ptr<const PriceTable> prices = nullptr,
                               std::shared_ptr<common::Clock> clock = nullptr,
                               std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr,
                               std::shared_ptr<IUsageSink> usage_sink = nullptr);

  std::shared_ptr<CostTracker> get_or_create(const std::string &name);
  std::shared_ptr<CostTracker> get_or_create(const std::string &name,
                                             const TrackerOptions &options);
  [[nodiscard]] std::shared_ptr<CostTracker> get(const std::string &name) const;
  [[nodiscard]] std::size_t size() const { return trackers_.size(); }
  [[nodiscard]] const TrackerOptions &defaults() const { return defaults_; }
  [[nodiscard]] const PriceTable &prices() const { return *prices_; }

  [[nodiscard]] common::Result<std::vector<TrackerSnapshot>> all_stats() const override;
  [[nodiscard]] common::Result<std::vector<CostBucket>>
  cost_buckets(CostPeriod period, std::size_t count) const override;
  [[nodiscard]] std::string to_json() const;

  void reset_all();
  void clear() { trackers_.clear(); }

private:
  [[nodiscard]] std::shared_ptr<CostTracker> make(const std::string &name,
                                                  const TrackerOptions &options) const;

  TrackerOptions defaults_;
  std::shared_ptr<const PriceTable> prices_;
  std::shared_ptr<common::Clock> clock_;
  std::shared_ptr<alerts::IAlertSink> alert_sink_;
  std::shared_ptr<IUsageSink> usage_sink_;
  common::Registry<CostTracker> trackers_;
};

} // namespace tollgate::cost
