#include "tollgate/observability/log_observer.hpp"

#include "tollgate/common/strings.hpp"

#include <iostream>
#include <type_traits>

namespace tollgate::observability {

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, BreakerStateChangeEvent>) {
          const std::string level = evt.to_state == "open" ? "WARN" : "INFO";
          std::string line = "breaker.state service=" + evt.service + " from=" + evt.from_state +
                             " to=" + evt.to_state;
          if (!evt.reason.empty()) {
            line += " reason=" + evt.reason;
          }
          log_line(level, line);
        } else if constexpr (std::is_same_v<T, CallRejectedEvent>) {
          log_line("DEBUG", "breaker.rejected service=" + evt.service +
                                " retry_in_ms=" + std::to_string(evt.time_remaining.count()));
        } else if constexpr (std::is_same_v<T, RateLimitWaitEvent>) {
          log_line("DEBUG", "ratelimit.wait provider=" + evt.provider +
                                " wait_ms=" + std::to_string(evt.wait.count()));
        } else if constexpr (std::is_same_v<T, RateLimitRejectedEvent>) {
          log_line("WARN", "ratelimit.rejected provider=" + evt.provider + " limit=" +
                               evt.limit_type + " " + std::to_string(evt.current) + "/" +
                               std::to_string(evt.limit));
        } else if constexpr (std::is_same_v<T, UsageTrackedEvent>) {
          log_line("DEBUG", "usage tracker=" + evt.tracker + " provider=" + evt.provider +
                                " model=" + evt.model + " in=" + std::to_string(evt.input_tokens) +
                                " out=" + std::to_string(evt.output_tokens) +
                                " cost_usd=" + common::format_fixed(evt.cost_usd, 6));
        } else if constexpr (std::is_same_v<T, BudgetExceededEvent>) {
          log_line("ERROR", "budget.exceeded tracker=" + evt.tracker + " used_usd=" +
                                common::format_fixed(evt.total_cost_usd, 4) +
                                " budget_usd=" + common::format_fixed(evt.budget_usd, 2));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line("DEBUG", "metric.tokens_used=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, CostIncurredMetric>) {
          log_line("DEBUG", "metric.cost_usd=" + common::format_fixed(m.cost_usd, 6));
        } else if constexpr (std::is_same_v<T, RateLimitWaitMetric>) {
          log_line("DEBUG", "metric.rate_limit_wait_ms=" + std::to_string(m.wait.count()));
        } else if constexpr (std::is_same_v<T, CallLatencyMetric>) {
          log_line("DEBUG", "metric.call_latency_ms service=" + m.service + " value=" +
                                std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace tollgate::observability
