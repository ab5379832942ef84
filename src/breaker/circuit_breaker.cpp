#include "tollgate/breaker/circuit_breaker.hpp"

#include "tollgate/common/json.hpp"
#include "tollgate/common/strings.hpp"
#include "tollgate/observability/global.hpp"

#include <algorithm>
#include <sstream>

namespace tollgate::breaker {

namespace {

std::string seconds_text(std::chrono::milliseconds value) {
  return common::format_fixed(static_cast<double>(value.count()) / 1000.0, 1);
}

alerts::AlertLevel level_for(CircuitState to) {
  switch (to) {
  case CircuitState::Open:
    return alerts::AlertLevel::Error;
  case CircuitState::HalfOpen:
    return alerts::AlertLevel::Warning;
  case CircuitState::Closed:
    return alerts::AlertLevel::Info;
  }
  return alerts::AlertLevel::Info;
}

std::string optional_time_json(const std::optional<common::TimePoint> &value) {
  return value.has_value() ? common::json_quote(common::format_utc(*value)) : "null";
}

} // namespace

std::string state_to_string(const CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "closed";
  case CircuitState::Open:
    return "open";
  case CircuitState::HalfOpen:
    return "half_open";
  }
  return "closed";
}

std::string CircuitOpenError::message() const {
  return "Circuit '" + breaker_name + "' is OPEN. Retry in " + seconds_text(time_remaining) +
         "s. Last failure: " + last_failure.value_or("unknown");
}

std::string CallError::message() const {
  if (const auto *open = open_error(); open != nullptr) {
    return open->message();
  }
  return std::get<Failure>(detail).describe();
}

std::string BreakerSnapshot::to_json() const {
  std::ostringstream out;
  out << "{\"name\":" << common::json_quote(name)
      << ",\"state\":" << common::json_quote(state_to_string(stats.state)) << ",\"config\":{"
      << "\"failure_threshold\":" << config.failure_threshold
      << ",\"success_threshold\":" << config.success_threshold << ",\"recovery_timeout\":"
      << common::json_number(static_cast<double>(config.recovery_timeout_ms) / 1000.0, 1)
      << ",\"half_open_max_calls\":" << config.half_open_max_calls
      << ",\"failure_rate_threshold\":" << common::json_number(config.failure_rate_threshold, 2)
      << ",\"min_calls_for_rate\":" << config.min_calls_for_rate << "},\"stats\":{"
      << "\"total_calls\":" << stats.total_calls
      << ",\"successful_calls\":" << stats.successful_calls
      << ",\"failed_calls\":" << stats.failed_calls << ",\"rejected_calls\":" << stats.rejected_calls
      << ",\"consecutive_failures\":" << stats.consecutive_failures
      << ",\"consecutive_successes\":" << stats.consecutive_successes
      << ",\"half_open_in_flight\":" << stats.half_open_in_flight
      << ",\"last_failure_at\":" << optional_time_json(stats.last_failure_at)
      << ",\"last_failure_reason\":" << common::json_optional(stats.last_failure_reason)
      << ",\"last_success_at\":" << optional_time_json(stats.last_success_at)
      << ",\"last_state_change_at\":"
      << common::json_quote(common::format_utc(stats.last_state_change_at))
      << ",\"time_in_current_state_seconds\":"
      << common::json_number(stats.time_in_current_state_seconds, 1)
      << "},\"time_remaining_seconds\":"
      << common::json_number(static_cast<double>(time_remaining.count()) / 1000.0, 1) << "}";
  return out.str();
}

CircuitBreaker::Permit::~Permit() {
  if (breaker_ != nullptr) {
    breaker_->complete_failure(
        Failure{.kind = FailureKind::Unknown, .message = "call ended without reporting an outcome"},
        Holder{.half_open_slot = half_open_slot_, .generation = generation_});
  }
}

void CircuitBreaker::Permit::success() {
  if (auto *breaker = std::exchange(breaker_, nullptr); breaker != nullptr) {
    breaker->complete_success(Holder{.half_open_slot = half_open_slot_, .generation = generation_});
  }
}

void CircuitBreaker::Permit::failure(const Failure &failure) {
  if (auto *breaker = std::exchange(breaker_, nullptr); breaker != nullptr) {
    breaker->complete_failure(failure,
                              Holder{.half_open_slot = half_open_slot_, .generation = generation_});
  }
}

CircuitBreaker::CircuitBreaker(std::string name, config::BreakerConfig config,
                               std::shared_ptr<common::Clock> clock,
                               std::shared_ptr<alerts::IAlertSink> alert_sink)
    : name_(std::move(name)), config_(std::move(config)),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      alert_sink_(std::move(alert_sink)) {
  for (const auto &kind_name : config_.excluded_failure_kinds) {
    if (const auto kind = parse_failure_kind(kind_name); kind.has_value()) {
      excluded_.push_back(*kind);
    }
  }
  last_state_change_at_ = clock_->now();
}

CircuitState CircuitBreaker::state() {
  std::vector<Transition> pending;
  CircuitState current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_locked(clock_->now(), pending);
    current = state_;
  }
  emit(pending);
  return current;
}

bool CircuitBreaker::can_execute() { return admit().has_value(); }

std::optional<CircuitBreaker::Admission> CircuitBreaker::admit() {
  std::vector<Transition> pending;
  std::optional<Admission> admission;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_locked(clock_->now(), pending);
    switch (state_) {
    case CircuitState::Closed:
      admission = Admission{.half_open_slot = false, .generation = generation_};
      break;
    case CircuitState::Open:
      break;
    case CircuitState::HalfOpen:
      if (half_open_in_flight_ < config_.half_open_max_calls) {
        ++half_open_in_flight_;
        admission = Admission{.half_open_slot = true, .generation = generation_};
      }
      break;
    }
  }
  emit(pending);
  return admission;
}

void CircuitBreaker::record_success() { complete_success(Holder{}); }

void CircuitBreaker::record_failure(const Failure &failure) { complete_failure(failure, Holder{}); }

bool CircuitBreaker::holds_slot_locked(const Holder &holder) const {
  if (state_ != CircuitState::HalfOpen || !holder.half_open_slot) {
    return false;
  }
  return !holder.generation.has_value() || *holder.generation == generation_;
}

void CircuitBreaker::complete_success(const Holder &holder) {
  std::vector<Transition> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();
    ++total_calls_;
    ++successful_calls_;
    last_success_at_ = now;
    consecutive_failures_ = 0;

    // Calls admitted before the circuit last changed state do not count toward recovery.
    if (holds_slot_locked(holder)) {
      ++consecutive_successes_;
      half_open_in_flight_ = half_open_in_flight_ > 0 ? half_open_in_flight_ - 1 : 0;
      if (consecutive_successes_ >= config_.success_threshold) {
        transition_locked(CircuitState::Closed,
                          "recovered after " + std::to_string(consecutive_successes_) +
                              " successful calls",
                          now, pending);
      }
    }
  }
  emit(pending);
}

void CircuitBreaker::complete_failure(const Failure &failure, const Holder &holder) {
  std::vector<Transition> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool holds_slot = holds_slot_locked(holder);
    if (is_excluded(failure.kind)) {
      // Not a service failure, but the trial call it held is finished.
      if (holds_slot && half_open_in_flight_ > 0) {
        --half_open_in_flight_;
      }
      return;
    }

    const auto now = clock_->now();
    ++total_calls_;
    ++failed_calls_;
    ++consecutive_failures_;
    last_failure_at_ = now;
    last_failure_reason_ = failure.message_or_kind();

    if (state_ == CircuitState::HalfOpen) {
      if (holds_slot) {
        transition_locked(CircuitState::Open, "trial call failed: " + *last_failure_reason_, now,
                          pending);
      }
    } else if (state_ == CircuitState::Closed) {
      if (consecutive_failures_ >= config_.failure_threshold) {
        transition_locked(CircuitState::Open,
                          std::to_string(consecutive_failures_) + " consecutive failures", now,
                          pending);
      } else if (config_.min_calls_for_rate > 0 && total_calls_ >= config_.min_calls_for_rate) {
        const double rate =
            static_cast<double>(failed_calls_) / static_cast<double>(total_calls_);
        if (rate >= config_.failure_rate_threshold) {
          transition_locked(CircuitState::Open,
                            "failure rate " + common::format_fixed(rate * 100.0, 1) + "% >= " +
                                common::format_fixed(config_.failure_rate_threshold * 100.0, 1) +
                                "%",
                            now, pending);
        }
      }
    }
  }
  emit(pending);
}

void CircuitBreaker::record_rejection() {
  std::chrono::milliseconds remaining{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++rejected_calls_;
    remaining = time_remaining_locked(clock_->now());
  }
  observability::record_call_rejected(name_, remaining);
}

bool CircuitBreaker::is_excluded(const FailureKind kind) const {
  return std::find(excluded_.begin(), excluded_.end(), kind) != excluded_.end();
}

std::chrono::milliseconds CircuitBreaker::time_remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return time_remaining_locked(clock_->now());
}

CircuitOpenError CircuitBreaker::open_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CircuitOpenError{.breaker_name = name_,
                          .time_remaining = time_remaining_locked(clock_->now()),
                          .last_failure = last_failure_reason_};
}

BreakerStats CircuitBreaker::stats() {
  std::vector<Transition> pending;
  BreakerStats out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();
    refresh_locked(now, pending);
    out = BreakerStats{.state = state_,
                       .total_calls = total_calls_,
                       .successful_calls = successful_calls_,
                       .failed_calls = failed_calls_,
                       .rejected_calls = rejected_calls_,
                       .consecutive_failures = consecutive_failures_,
                       .consecutive_successes = consecutive_successes_,
                       .half_open_in_flight = half_open_in_flight_,
                       .last_failure_at = last_failure_at_,
                       .last_failure_reason = last_failure_reason_,
                       .last_success_at = last_success_at_,
                       .last_state_change_at = last_state_change_at_,
                       .time_in_current_state_seconds =
                           common::to_seconds(now - last_state_change_at_)};
  }
  emit(pending);
  return out;
}

BreakerSnapshot CircuitBreaker::snapshot() {
  BreakerSnapshot out{.name = name_, .config = config_, .stats = stats()};
  out.time_remaining = time_remaining();
  return out;
}

std::string CircuitBreaker::to_json() { return snapshot().to_json(); }

void CircuitBreaker::reset() {
  std::vector<Transition> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();
    if (state_ != CircuitState::Closed) {
      pending.push_back(Transition{.from = state_, .to = CircuitState::Closed,
                                   .reason = "manual reset"});
    }
    state_ = CircuitState::Closed;
    ++generation_;
    consecutive_failures_ = 0;
    consecutive_successes_ = 0;
    half_open_in_flight_ = 0;
    total_calls_ = 0;
    successful_calls_ = 0;
    failed_calls_ = 0;
    rejected_calls_ = 0;
    last_failure_at_.reset();
    last_failure_reason_.reset();
    last_success_at_.reset();
    last_state_change_at_ = now;
  }
  emit(pending);
}

void CircuitBreaker::force_open() {
  std::vector<Transition> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();
    transition_locked(CircuitState::Open, "forced open", now, pending);
    last_failure_at_ = now;
  }
  emit(pending);
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_state_change_ = std::move(callback);
}

std::optional<CircuitBreaker::Permit> CircuitBreaker::acquire() {
  const auto admission = admit();
  if (!admission.has_value()) {
    record_rejection();
    return std::nullopt;
  }
  return std::optional<Permit>(std::in_place, *this, admission->half_open_slot,
                               admission->generation);
}

void CircuitBreaker::refresh_locked(const common::TimePoint now,
                                    std::vector<Transition> &pending) {
  if (state_ != CircuitState::Open) {
    return;
  }
  if (time_remaining_locked(now).count() <= 0) {
    transition_locked(CircuitState::HalfOpen, "recovery timeout elapsed", now, pending);
  }
}

void CircuitBreaker::transition_locked(const CircuitState to, std::string reason,
                                       const common::TimePoint now,
                                       std::vector<Transition> &pending) {
  const CircuitState from = state_;
  if (from == to) {
    return;
  }

  state_ = to;
  ++generation_;
  last_state_change_at_ = now;
  switch (to) {
  case CircuitState::Closed:
    consecutive_failures_ = 0;
    half_open_in_flight_ = 0;
    break;
  case CircuitState::HalfOpen:
    consecutive_successes_ = 0;
    half_open_in_flight_ = 0;
    break;
  case CircuitState::Open:
    half_open_in_flight_ = 0;
    break;
  }
  pending.push_back(Transition{.from = from, .to = to, .reason = std::move(reason)});
}

std::chrono::milliseconds CircuitBreaker::time_remaining_locked(const common::TimePoint now) const {
  if (state_ != CircuitState::Open) {
    return std::chrono::milliseconds(0);
  }
  const auto since_failure = last_failure_at_.has_value()
                                 ? std::chrono::duration_cast<std::chrono::milliseconds>(
                                       now - *last_failure_at_)
                                 : std::chrono::milliseconds::max();
  const auto timeout = std::chrono::milliseconds(config_.recovery_timeout_ms);
  if (since_failure >= timeout) {
    return std::chrono::milliseconds(0);
  }
  return timeout - since_failure;
}

void CircuitBreaker::emit(const std::vector<Transition> &pending) {
  if (pending.empty()) {
    return;
  }

  StateChangeCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = on_state_change_;
  }

  for (const auto &transition : pending) {
    const std::string from = state_to_string(transition.from);
    const std::string to = state_to_string(transition.to);
    observability::record_breaker_transition(name_, from, to, transition.reason);

    if (alert_sink_ != nullptr) {
      alert_sink_->deliver(alerts::make_alert(
          level_for(transition.to), "circuit_breaker",
          "Circuit breaker '" + name_ + "' " + from + " -> " + to + ": " + transition.reason,
          {{"service", name_}, {"from", from}, {"to", to}}, clock_->now()));
    }

    if (callback) {
      try {
        callback(name_, transition.from, transition.to);
      } catch (const std::exception &e) {
        observability::record_error("circuit_breaker",
                                    "state change callback failed for '" + name_ + "': " +
                                        e.what());
      }
    }
  }
}

void CircuitBreaker::record_latency(const common::Duration elapsed) const {
  observability::record_metric(observability::CallLatencyMetric{
      .service = name_,
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)});
}

} // namespace tollgate::breaker
