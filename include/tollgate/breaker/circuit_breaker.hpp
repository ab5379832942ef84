#pragma once

#include "tollgate/alerts/sink.hpp"
#include "tollgate/breaker/failure.hpp"
#include "tollgate/common/clock.hpp"
#include "tollgate/common/result.hpp"
#include "tollgate/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tollgate::breaker {

enum class CircuitState { Closed, Open, HalfOpen };

[[nodiscard]] std::string state_to_string(CircuitState state);

/// A call was refused because the circuit is open, or half-open with every trial slot taken.
struct CircuitOpenError {
  std::string breaker_name;
  std::chrono::milliseconds time_remaining{0};
  std::optional<std::string> last_failure;

  [[nodiscard]] std::string message() const;
};

struct CallError {
  std::variant<CircuitOpenError, Failure> detail;

  [[nodiscard]] bool rejected() const { return std::holds_alternative<CircuitOpenError>(detail); }
  [[nodiscard]] const CircuitOpenError *open_error() const {
    return std::get_if<CircuitOpenError>(&detail);
  }
  [[nodiscard]] const Failure *failure() const { return std::get_if<Failure>(&detail); }
  [[nodiscard]] std::string message() const;
};

struct BreakerStats {
  CircuitState state = CircuitState::Closed;
  std::uint64_t total_calls = 0;
  std::uint64_t successful_calls = 0;
  std::uint64_t failed_calls = 0;
  std::uint64_t rejected_calls = 0;
  std::uint32_t consecutive_failures = 0;
  std::uint32_t consecutive_successes = 0;
  std::uint32_t half_open_in_flight = 0;
  std::optional<common::TimePoint> last_failure_at;
  std::optional<std::string> last_failure_reason;
  std::optional<common::TimePoint> last_success_at;
  common::TimePoint last_state_change_at{};
  double time_in_current_state_seconds = 0.0;
};

struct BreakerSnapshot {
  std::string name;
  config::BreakerConfig config;
  BreakerStats stats;
  std::chrono::milliseconds time_remaining{0};

  [[nodiscard]] std::string to_json() const;
};

using StateChangeCallback =
    std::function<void(const std::string &name, CircuitState from, CircuitState to)>;

class CircuitBreaker {
public:
  /// Scoped admission. Reports success or failure exactly once; a permit dropped without an
  /// outcome (early return, exception) counts as an unknown failure.
  class Permit {
  public:
    Permit(CircuitBreaker &breaker, bool half_open_slot, std::uint64_t generation)
        : breaker_(&breaker), half_open_slot_(half_open_slot), generation_(generation) {}
    Permit(Permit &&other) noexcept
        : breaker_(std::exchange(other.breaker_, nullptr)),
          half_open_slot_(other.half_open_slot_), generation_(other.generation_) {}
    Permit(const Permit &) = delete;
    Permit &operator=(const Permit &) = delete;
    Permit &operator=(Permit &&) = delete;
    ~Permit();

    void success();
    void failure(const Failure &failure);

  private:
    CircuitBreaker *breaker_;
    bool half_open_slot_;
    std::uint64_t generation_;
  };

  CircuitBreaker(std::string name, config::BreakerConfig config,
                 std::shared_ptr<common::Clock> clock = nullptr,
                 std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr);

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const config::BreakerConfig &config() const { return config_; }

  /// Current state. Reading it moves OPEN to HALF_OPEN once the recovery timeout has elapsed.
  [[nodiscard]] CircuitState state();
  [[nodiscard]] bool is_closed() { return state() == CircuitState::Closed; }
  [[nodiscard]] bool is_open() { return state() == CircuitState::Open; }
  [[nodiscard]] bool is_half_open() { return state() == CircuitState::HalfOpen; }

  /// True when a call may proceed. In HALF_OPEN this reserves one trial slot, released by the
  /// matching record_success / record_failure.
  [[nodiscard]] bool can_execute();
  void record_success();
  void record_failure(const Failure &failure);
  void record_rejection();

  [[nodiscard]] bool is_excluded(FailureKind kind) const;
  [[nodiscard]] std::chrono::milliseconds time_remaining() const;
  [[nodiscard]] CircuitOpenError open_error() const;

  [[nodiscard]] BreakerStats stats();
  [[nodiscard]] BreakerSnapshot snapshot();
  [[nodiscard]] std::string to_json();

  void reset();
  void force_open();
  void on_state_change(StateChangeCallback callback);

  /// can_execute() plus a guard; nullopt (after recording the rejection) when refused.
  [[nodiscard]] std::optional<Permit> acquire();

  /// Runs fn (returning common::Result<T, Failure>) under the breaker and reports its outcome.
  template <typename Fn> auto call(Fn &&fn) {
    using Outcome = std::invoke_result_t<Fn &>;
    using T = typename Outcome::value_type;
    using Wrapped = common::Result<T, CallError>;

    auto permit = acquire();
    if (!permit.has_value()) {
      return Wrapped::failure(CallError{open_error()});
    }

    const auto started = clock_->now();
    Outcome outcome = std::invoke(fn);
    record_latency(clock_->now() - started);
    if (!outcome.ok()) {
      permit->failure(outcome.error());
      return Wrapped::failure(CallError{outcome.error()});
    }
    permit->success();
    if constexpr (std::is_void_v<T>) {
      return Wrapped::success();
    } else {
      return Wrapped::success(std::move(outcome.value()));
    }
  }

private:
  struct Transition {
    CircuitState from;
    CircuitState to;
    std::string reason;
  };

  /// Who is reporting an outcome. Direct record_* callers own a half-open slot if one is taken.
  struct Holder {
    bool half_open_slot = true;
    std::optional<std::uint64_t> generation;
  };

  struct Admission {
    bool half_open_slot = false;
    std::uint64_t generation = 0;
  };

  [[nodiscard]] std::optional<Admission> admit();
  [[nodiscard]] bool holds_slot_locked(const Holder &holder) const;
  void complete_success(const Holder &holder);
  void complete_failure(const Failure &failure, const Holder &holder);

  void refresh_locked(common::TimePoint now, std::vector<Transition> &pending);
  void transition_locked(CircuitState to, std::string reason, common::TimePoint now,
                         std::vector<Transition> &pending);
  [[nodiscard]] std::chrono::milliseconds time_remaining_locked(common::TimePoint now) const;
  void emit(const std::vector<Transition> &pending);
  void record_latency(common::Duration elapsed) const;

  const std::string name_;
  const config::BreakerConfig config_;
  std::vector<FailureKind> excluded_;
  std::shared_ptr<common::Clock> clock_;
  std::shared_ptr<alerts::IAlertSink> alert_sink_;

  mutable std::mutex mutex_;
  CircuitState state_ = CircuitState::Closed;
  std::uint32_t consecutive_failures_ = 0;
  std::uint32_t consecutive_successes_ = 0;
  std::uint32_t half_open_in_flight_ = 0;
  std::uint64_t generation_ = 0;
  std::uint64_t total_calls_ = 0;
  std::uint64_t successful_calls_ = 0;
  std::uint64_t failed_calls_ = 0;
  std::uint64_t rejected_calls_ = 0;
  std::optional<common::TimePoint> last_failure_at_;
  std::optional<std::string> last_failure_reason_;
  std::optional<common::TimePoint> last_success_at_;
  common::TimePoint last_state_change_at_;

  std::mutex callback_mutex_;
  StateChangeCallback on_state_change_;
};

} // namespace tollgate::breaker
