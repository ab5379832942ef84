#include "tollgate/breaker/registry.hpp"

#include "tollgate/common/json.hpp"

#include <sstream>

namespace tollgate::breaker {

BreakerRegistry::BreakerRegistry(config::BreakerConfig defaults,
                                 std::map<std::string, config::BreakerConfig> services,
                                 std::shared_ptr<common::Clock> clock,
                                 std::shared_ptr<alerts::IAlertSink> alert_sink)
    : defaults_(std::move(defaults)), services_(std::move(services)),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      alert_sink_(std::move(alert_sink)),
      breakers_([this](const std::string &name) { return make(name, config_for(name)); }) {}

BreakerRegistry::BreakerRegistry(std::shared_ptr<common::Clock> clock,
                                 std::shared_ptr<alerts::IAlertSink> alert_sink)
    : BreakerRegistry(config::BreakerConfig{}, config::default_breakers(), std::move(clock),
                      std::move(alert_sink)) {}

std::shared_ptr<CircuitBreaker> BreakerRegistry::get_or_create(const std::string &name) {
  return breakers_.get_or_create(name);
}

std::shared_ptr<CircuitBreaker>
BreakerRegistry::get_or_create(const std::string &name, const config::BreakerConfig &config) {
  return breakers_.get_or_create(name,
                                 [this, &config](const std::string &key) { return make(key, config); });
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::get(const std::string &name) const {
  return breakers_.get(name);
}

std::vector<std::string> BreakerRegistry::names() const {
  std::vector<std::string> out;
  for (const auto &[name, _] : breakers_.all()) {
    out.push_back(name);
  }
  return out;
}

config::BreakerConfig BreakerRegistry::config_for(const std::string &name) const {
  const auto it = services_.find(name);
  return it == services_.end() ? defaults_ : it->second;
}

common::Result<std::vector<BreakerSnapshot>> BreakerRegistry::all_stats() const {
  std::vector<BreakerSnapshot> out;
  for (const auto &[name, breaker] : breakers_.all()) {
    out.push_back(breaker->snapshot());
  }
  return common::Result<std::vector<BreakerSnapshot>>::success(std::move(out));
}

std::string BreakerRegistry::to_json() const {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[name, breaker] : breakers_.all()) {
    out << (first ? "" : ",") << common::json_quote(name) << ":" << breaker->to_json();
    first = false;
  }
  out << "}";
  return out.str();
}

void BreakerRegistry::reset_all() {
  for (const auto &[name, breaker] : breakers_.all()) {
    breaker->reset();
  }
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::make(const std::string &name,
                                                      const config::BreakerConfig &config) const {
  return std::make_shared<CircuitBreaker>(name, config, clock_, alert_sink_);
}

} // namespace tollgate::breaker
