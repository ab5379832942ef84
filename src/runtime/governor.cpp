#include "tollgate/runtime/governor.hpp"

#include "tollgate/config/config.hpp"
#include "tollgate/observability/factory.hpp"
#include "tollgate/observability/global.hpp"

namespace tollgate::runtime {

namespace {

std::shared_ptr<cost::UsageLedger> open_ledger(const config::LedgerConfig &ledger) {
  if (!ledger.enabled) {
    return nullptr;
  }
  auto opened = std::make_shared<cost::UsageLedger>(config::expand_path(ledger.path));
  if (!opened->is_open()) {
    observability::record_error("ledger", "cannot open usage ledger at " + ledger.path + ": " +
                                              opened->open_error());
    return nullptr;
  }
  return opened;
}

} // namespace

cost::TrackerOptions tracker_options(const config::Config &config) {
  return cost::TrackerOptions{
      .budget_usd = config.budget.budget_usd,
      .enforce_budget = config.budget.enforce,
      .warning_percent = config.alerts.budget_warning_percent,
      .critical_percent = config.alerts.budget_critical_percent,
  };
}

Governor::Governor(config::Config config, std::shared_ptr<common::Clock> clock,
                   std::shared_ptr<alerts::IAlertSink> alert_sink)
    : config_(std::move(config)),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      alert_sink_(alert_sink != nullptr ? std::move(alert_sink)
                                        : alerts::create_alert_sink(config_)),
      prices_(std::make_shared<const cost::PriceTable>(config_.pricing)),
      ledger_(open_ledger(config_.ledger)),
      breakers_(config_.breaker_defaults, config_.breakers, clock_, alert_sink_),
      rate_limiters_(config_.rate_limit_defaults, config_.rate_limits, clock_, alert_sink_,
                     config_.alerts.rate_limit_warning_percent),
      trackers_(tracker_options(config_), prices_, clock_, alert_sink_, ledger_),
      aggregator_(breakers_, rate_limiters_, trackers_, clock_,
                  config_.alerts.rate_limit_warning_percent, &trackers_) {}

common::Result<std::unique_ptr<Governor>> Governor::from_disk() {
  auto loaded = config::load_validated_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<Governor>>::failure(loaded.error());
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  return common::Result<std::unique_ptr<Governor>>::success(
      std::make_unique<Governor>(std::move(loaded.value())));
}

std::unique_ptr<Governor> Governor::from_config(config::Config config,
                                                std::shared_ptr<common::Clock> clock,
                                                std::shared_ptr<alerts::IAlertSink> alert_sink) {
  return std::make_unique<Governor>(std::move(config), std::move(clock), std::move(alert_sink));
}

std::shared_ptr<cost::CostTracker> Governor::global_tracker() {
  return trackers_.get_or_create(GLOBAL_TRACKER);
}

cost::TrackResult Governor::track_usage(const cost::UsageRequest &request,
                                        const std::string &tracker) {
  return trackers_.get_or_create(tracker)->track_usage(request);
}

} // namespace tollgate::runtime
