#include "tollgate/observability/global.hpp"

#include <mutex>

namespace tollgate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_breaker_transition(const std::string &service, const std::string &from_state,
                               const std::string &to_state, const std::string &reason) {
  record_event(BreakerStateChangeEvent{
      .service = service, .from_state = from_state, .to_state = to_state, .reason = reason});
}

void record_call_rejected(const std::string &service, std::chrono::milliseconds time_remaining) {
  record_event(CallRejectedEvent{.service = service, .time_remaining = time_remaining});
}

void record_rate_limit_wait(const std::string &provider, std::chrono::milliseconds wait) {
  record_event(RateLimitWaitEvent{.provider = provider, .wait = wait});
  record_metric(RateLimitWaitMetric{.wait = wait});
}

void record_rate_limit_rejected(const std::string &provider, const std::string &limit_type,
                                const std::uint64_t current, const std::uint64_t limit) {
  record_event(RateLimitRejectedEvent{
      .provider = provider, .limit_type = limit_type, .current = current, .limit = limit});
}

void record_usage(const UsageTrackedEvent &usage) {
  record_event(usage);
  record_metric(TokensUsedMetric{.tokens = usage.input_tokens + usage.output_tokens});
  record_metric(CostIncurredMetric{.cost_usd = usage.cost_usd});
}

void record_budget_exceeded(const std::string &tracker, const double total_cost_usd,
                            const double budget_usd) {
  record_event(BudgetExceededEvent{
      .tracker = tracker, .total_cost_usd = total_cost_usd, .budget_usd = budget_usd});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace tollgate::observability
