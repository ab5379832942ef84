#pragma once

#include "tollgate/common/registry.hpp"
#include "tollgate/ratelimit/rate_limiter.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tollgate::ratelimit {

class RateLimiterRegistry final : public common::IStatsSource<RateLimitSnapshot> {
public:
  RateLimiterRegistry(config::RateLimitConfig defaults,
                      std::map<std::string, config::RateLimitConfig> providers,
                      std::shared_ptr<common::Clock> clock = nullptr,
                      std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr,
                      double warning_percent = 90.0);
  explicit RateLimiterRegistry(std::shared_ptr<common::Clock> clock = nullptr,
                               std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr);

  std::shared_ptr<RateLimiter> get_or_create(const std::string &provider);
  std::shared_ptr<RateLimiter> get_or_create(const std::string &provider,
                                             const config::RateLimitConfig &config);
  [[nodiscard]] std::shared_ptr<RateLimiter> get(const std::string &provider) const;
  [[nodiscard]] std::size_t size() const { return limiters_.size(); }
  [[nodiscard]] config::RateLimitConfig config_for(const std::string &provider) const;

  [[nodiscard]] common::Result<std::vector<RateLimitSnapshot>> all_stats() const override;
  [[nodiscard]] std::string to_json() const;

  void reset_all();
  void clear() { limiters_.clear(); }

private:
  [[nodiscard]] std::shared_ptr<RateLimiter> make(const std::string &provider,
                                                  const config::RateLimitConfig &config) const;

  config::RateLimitConfig defaults_;
  std::map<std::string, config::RateLimitConfig> providers_;
  std::shared_ptr<common::Clock> clock_;
  std::shared_ptr<alerts::IAlertSink> alert_sink_;
  double warning_percent_;
  common::Registry<RateLimiter> limiters_;
};

} // namespace tollgate::ratelimit
