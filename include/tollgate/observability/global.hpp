#pragma once

#include "tollgate/observability/observer.hpp"

#include <memory>

namespace tollgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_breaker_transition(const std::string &service, const std::string &from_state,
                               const std::string &to_state, const std::string &reason);
void record_call_rejected(const std::string &service, std::chrono::milliseconds time_remaining);
void record_rate_limit_wait(const std::string &provider, std::chrono::milliseconds wait);
void record_rate_limit_rejected(const std::string &provider, const std::string &limit_type,
                                std::uint64_t current, std::uint64_t limit);
void record_usage(const UsageTrackedEvent &usage);
void record_budget_exceeded(const std::string &tracker, double total_cost_usd, double budget_usd);
void record_error(const std::string &component, const std::string &message);

} // namespace tollgate::observability
