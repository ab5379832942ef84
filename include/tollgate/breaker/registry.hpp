#pragma once

#include "tollgate/breaker/circuit_breaker.hpp"
#include "tollgate/common/registry.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tollgate::breaker {

/// Shared breakers by service name. New breakers take their per-service configuration, or the
/// defaults for services that have none.
class BreakerRegistry final : public common::IStatsSource<BreakerSnapshot> {
public:
  BreakerRegistry(config::BreakerConfig defaults,
                  std::map<std::string, config::BreakerConfig> services,
                  std::shared_ptr<common::Clock> clock = nullptr,
                  std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr);
  explicit BreakerRegistry(std::shared_ptr<common::Clock> clock = nullptr,
                           std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr);

  std::shared_ptr<CircuitBreaker> get_or_create(const std::string &name);
  /// Explicit configuration applies only if this call creates the breaker.
  std::shared_ptr<CircuitBreaker> get_or_create(const std::string &name,
                                                const config::BreakerConfig &config);
  [[nodiscard]] std::shared_ptr<CircuitBreaker> get(const std::string &name) const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] std::size_t size() const { return breakers_.size(); }
  [[nodiscard]] config::BreakerConfig config_for(const std::string &name) const;

  [[nodiscard]] common::Result<std::vector<BreakerSnapshot>> all_stats() const override;
  [[nodiscard]] std::string to_json() const;

  void reset_all();
  void clear() { breakers_.clear(); }

private:
  [[nodiscard]] std::shared_ptr<CircuitBreaker> make(const std::string &name,
                                                     const config::BreakerConfig &config) const;

  config::BreakerConfig defaults_;
  std::map<std::string, config::BreakerConfig> services_;
  std::shared_ptr<common::Clock> clock_;
  std::shared_ptr<alerts::IAlertSink> alert_sink_;
  common::Registry<CircuitBreaker> breakers_;
};

} // namespace tollgate::breaker
