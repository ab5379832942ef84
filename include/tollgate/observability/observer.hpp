#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tollgate::observability {

struct BreakerStateChangeEvent {
  std::string service;
  std::string from_state;
  std::string to_state;
  std::string reason;
};

struct CallRejectedEvent {
  std::string service;
  std::chrono::milliseconds time_remaining{0};
};

struct RateLimitWaitEvent {
  std::string provider;
  std::chrono::milliseconds wait{0};
};

struct RateLimitRejectedEvent {
  std::string provider;
  std::string limit_type;
  std::uint64_t current = 0;
  std::uint64_t limit = 0;
};

struct UsageTrackedEvent {
  std::string tracker;
  std::string provider;
  std::string model;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  double cost_usd = 0.0;
};

struct BudgetExceededEvent {
  std::string tracker;
  double total_cost_usd = 0.0;
  double budget_usd = 0.0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<BreakerStateChangeEvent, CallRejectedEvent, RateLimitWaitEvent,
                 RateLimitRejectedEvent, UsageTrackedEvent, BudgetExceededEvent, ErrorEvent>;

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

struct CostIncurredMetric {
  double cost_usd = 0.0;
};

struct RateLimitWaitMetric {
  std::chrono::milliseconds wait{0};
};

struct CallLatencyMetric {
  std::string service;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric =
    std::variant<TokensUsedMetric, CostIncurredMetric, RateLimitWaitMetric, CallLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace tollgate::observability
