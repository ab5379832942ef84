#pragma once

#include "tollgate/alerts/sink.hpp"
#include "tollgate/breaker/registry.hpp"
#include "tollgate/common/result.hpp"
#include "tollgate/config/schema.hpp"
#include "tollgate/cost/ledger.hpp"
#include "tollgate/cost/registry.hpp"
#include "tollgate/metrics/aggregator.hpp"
#include "tollgate/ratelimit/registry.hpp"
#include "tollgate/runtime/retry.hpp"

#include <memory>
#include <string>
#include <type_traits>

namespace tollgate::runtime {

/// Root object wiring configuration, clock, alert sink, prices, registries and the aggregator.
/// Registries and the aggregator refer back into it, so it is created behind a pointer.
class Governor {
public:
  static constexpr const char *GLOBAL_TRACKER = "global";

  explicit Governor(config::Config config, std::shared_ptr<common::Clock> clock = nullptr,
                    std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr);

  Governor(const Governor &) = delete;
  Governor &operator=(const Governor &) = delete;

  /// Loads configuration from disk and the environment and installs the configured observer.
  [[nodiscard]] static common::Result<std::unique_ptr<Governor>> from_disk();
  [[nodiscard]] static std::unique_ptr<Governor>
  from_config(config::Config config, std::shared_ptr<common::Clock> clock = nullptr,
              std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr);

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::shared_ptr<common::Clock> &clock() const { return clock_; }
  [[nodiscard]] const std::shared_ptr<alerts::IAlertSink> &alert_sink() const {
    return alert_sink_;
  }
  [[nodiscard]] const cost::PriceTable &prices() const { return *prices_; }
  /// Null unless the ledger is enabled; check is_open() before relying on it.
  [[nodiscard]] const std::shared_ptr<cost::UsageLedger> &ledger() const { return ledger_; }

  [[nodiscard]] breaker::BreakerRegistry &breakers() { return breakers_; }
  [[nodiscard]] ratelimit::RateLimiterRegistry &rate_limiters() { return rate_limiters_; }
  [[nodiscard]] cost::CostTrackerRegistry &trackers() { return trackers_; }
  [[nodiscard]] const metrics::MetricsAggregator &aggregator() const { return aggregator_; }

  [[nodiscard]] std::shared_ptr<cost::CostTracker> global_tracker();
  [[nodiscard]] metrics::MetricsSnapshot snapshot() const { return aggregator_.snapshot(); }

  /// Rate limit, then breaker, then fn (returning common::Result<T, breaker::Failure>), then the
  /// outcome is reported to the breaker.
  template <typename Fn>
  auto guarded_call(const std::string &service, const std::string &provider, Fn &&fn) {
    using Outcome = std::invoke_result_t<Fn &>;
    using T = typename Outcome::value_type;
    using Guarded = common::Result<T, GuardError>;

    const auto admitted = rate_limiters_.get_or_create(provider)->acquire();
    if (!admitted.ok()) {
      return Guarded::failure(GuardError{admitted.error()});
    }
    if (!admitted.value()) {
      return Guarded::failure(GuardError{AdmissionTimeout{.provider = provider}});
    }

    auto outcome = breakers_.get_or_create(service)->call(fn);
    if (!outcome.ok()) {
      return Guarded::failure(GuardError::from(outcome.error()));
    }
    if constexpr (std::is_void_v<T>) {
      return Guarded::success();
    } else {
      return Guarded::success(std::move(outcome.value()));
    }
  }

  /// guarded_call under call_with_retries; the rate limiter is consulted on every attempt.
  template <typename Fn>
  auto guarded_call_with_retries(const std::string &service, const std::string &provider,
                                 const RetryPolicy &policy, Fn &&fn) {
    return call_with_retries([&] { return guarded_call(service, provider, fn); }, policy,
                             *clock_);
  }

  /// Records usage on the named tracker (created with the configured budget when new).
  cost::TrackResult track_usage(const cost::UsageRequest &request,
                                const std::string &tracker = GLOBAL_TRACKER);

private:
  config::Config config_;
  std::shared_ptr<common::Clock> clock_;
  std::shared_ptr<alerts::IAlertSink> alert_sink_;
  std::shared_ptr<const cost::PriceTable> prices_;
  std::shared_ptr<cost::UsageLedger> ledger_;
  breaker::BreakerRegistry breakers_;
  ratelimit::RateLimiterRegistry rate_limiters_;
  cost::CostTrackerRegistry trackers_;
  metrics::MetricsAggregator aggregator_;
};

[[nodiscard]] cost::TrackerOptions tracker_options(const config::Config &config);

} // namespace tollgate::runtime
