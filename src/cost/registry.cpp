#include "tollgate/cost/registry.hpp"

#include "tollgate/common/json.hpp"

#include <sstream>

namespace tollgate::cost {

CostTrackerRegistry::CostTrackerRegistry(TrackerOptions defaults,
                                         std::shared_ptr<const PriceTable> prices,
                                         std::shared_ptr<common::Clock> clock,
                                         std::shared_ptr<alerts::IAlertSink> alert_sink,
                                         std::shared_ptr<IUsageSink> usage_sink)
    : defaults_(std::move(defaults)),
      prices_(prices != nullptr ? std::move(prices) : std::make_shared<const PriceTable>()),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      alert_sink_(std::move(alert_sink)), usage_sink_(std::move(usage_sink)),
      trackers_([this](const std::string &name) { return make(name, defaults_); }) {}

std::shared_ptr<CostTracker> CostTrackerRegistry::get_or_create(const std::string &name) {
  return trackers_.get_or_create(name);
}

std::shared_ptr<CostTracker> CostTrackerRegistry::get_or_create(const std::string &name,
                                                                const TrackerOptions &options) {
  return trackers_.get_or_create(
      name, [this, &options](const std::string &key) { return make(key, options); });
}

std::shared_ptr<CostTracker> CostTrackerRegistry::get(const std::string &name) const {
  return trackers_.get(name);
}

common::Result<std::vector<TrackerSnapshot>> CostTrackerRegistry::all_stats() const {
  std::vector<TrackerSnapshot> out;
  for (const auto &[name, tracker] : trackers_.all()) {
    out.push_back(tracker->snapshot());
  }
  return common::Result<std::vector<TrackerSnapshot>>::success(std::move(out));
}

common::Result<std::vector<CostBucket>>
CostTrackerRegistry::cost_buckets(const CostPeriod period, const std::size_t count) const {
  if (const auto checked = check_bucket_count(period, count); !checked.ok()) {
    return common::Result<std::vector<CostBucket>>::failure(checked.error());
  }
  const auto now = clock_->now();
  std::vector<CostBucket> total = bucket_costs({}, period, count, now);
  for (const auto &[name, tracker] : trackers_.all()) {
    const auto series = bucket_costs(tracker->usages(), period, count, now);
    for (std::size_t i = 0; i < total.size(); ++i) {
      total[i].cost_usd += series[i].cost_usd;
      total[i].calls += series[i].calls;
    }
  }
  return common::Result<std::vector<CostBucket>>::success(std::move(total));
}

std::string CostTrackerRegistry::to_json() const {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[name, tracker] : trackers_.all()) {
    out << (first ? "" : ",") << common::json_quote(name) << ":" << tracker->to_json();
    first = false;
  }
  out << "}";
  return out.str();
}

void CostTrackerRegistry::reset_all() {
  for (const auto &[name, tracker] : trackers_.all()) {
    tracker->reset();
  }
}

std::shared_ptr<CostTracker> CostTrackerRegistry::make(const std::string &name,
                                                       const TrackerOptions &options) const {
  return std::make_shared<CostTracker>(name, options, prices_, clock_, alert_sink_, usage_sink_);
}

} // namespace tollgate::cost
