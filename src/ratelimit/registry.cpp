#include "tollgate/ratelimit/registry.hpp"

#include "tollgate/common/json.hpp"

#include <sstream>

namespace tollgate::ratelimit {

RateLimiterRegistry::RateLimiterRegistry(config::RateLimitConfig defaults,
                                         std::map<std::string, config::RateLimitConfig> providers,
                                         std::shared_ptr<common::Clock> clock,
                                         std::shared_ptr<alerts::IAlertSink> alert_sink,
                                         const double warning_percent)
    : defaults_(std::move(defaults)), providers_(std::move(providers)),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      alert_sink_(std::move(alert_sink)), warning_percent_(warning_percent),
      limiters_([this](const std::string &name) { return make(name, config_for(name)); }) {}

RateLimiterRegistry::RateLimiterRegistry(std::shared_ptr<common::Clock> clock,
                                         std::shared_ptr<alerts::IAlertSink> alert_sink)
    : RateLimiterRegistry(config::RateLimitConfig{}, config::default_rate_limits(),
                          std::move(clock), std::move(alert_sink)) {}

std::shared_ptr<RateLimiter> RateLimiterRegistry::get_or_create(const std::string &provider) {
  return limiters_.get_or_create(provider);
}

std::shared_ptr<RateLimiter>
RateLimiterRegistry::get_or_create(const std::string &provider,
                                   const config::RateLimitConfig &config) {
  return limiters_.get_or_create(
      provider, [this, &config](const std::string &key) { return make(key, config); });
}

std::shared_ptr<RateLimiter> RateLimiterRegistry::get(const std::string &provider) const {
  return limiters_.get(provider);
}

config::RateLimitConfig RateLimiterRegistry::config_for(const std::string &provider) const {
  const auto it = providers_.find(provider);
  return it == providers_.end() ? defaults_ : it->second;
}

common::Result<std::vector<RateLimitSnapshot>> RateLimiterRegistry::all_stats() const {
  std::vector<RateLimitSnapshot> out;
  for (const auto &[provider, limiter] : limiters_.all()) {
    out.push_back(limiter->snapshot());
  }
  return common::Result<std::vector<RateLimitSnapshot>>::success(std::move(out));
}

std::string RateLimiterRegistry::to_json() const {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[provider, limiter] : limiters_.all()) {
    out << (first ? "" : ",") << common::json_quote(provider) << ":" << limiter->to_json();
    first = false;
  }
  out << "}";
  return out.str();
}

void RateLimiterRegistry::reset_all() {
  for (const auto &[provider, limiter] : limiters_.all()) {
    limiter->reset();
  }
}

std::shared_ptr<RateLimiter> RateLimiterRegistry::make(const std::string &provider,
                                                       const config::RateLimitConfig &config) const {
  return std::make_shared<RateLimiter>(provider, config, clock_, alert_sink_, warning_percent_);
}

} // namespace tollgate::ratelimit
