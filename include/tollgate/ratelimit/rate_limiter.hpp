#pragma once

#include "tollgate/alerts/sink.hpp"
#include "tollgate/common/clock.hpp"
#include "tollgate/common/result.hpp"
#include "tollgate/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tollgate::ratelimit {

enum class LimitType { PerMinute, Daily };

[[nodiscard]] std::string limit_type_to_string(LimitType type);

struct RateLimitExceededError {
  std::string provider;
  LimitType limit_type = LimitType::PerMinute;
  std::uint64_t current = 0;
  std::uint64_t limit = 0;

  [[nodiscard]] std::string message() const;
};

using AcquireResult = common::Result<bool, RateLimitExceededError>;

struct RateLimitStats {
  std::uint64_t total_requests = 0;
  std::uint64_t requests_today = 0;
  std::uint64_t requests_this_minute = 0;
  std::uint64_t waits_count = 0;
  std::chrono::milliseconds total_wait_time{0};
  std::optional<common::TimePoint> last_request_at;
  std::optional<common::TimePoint> daily_reset_at;
};

struct RateLimitSnapshot {
  std::string provider;
  config::RateLimitConfig config;
  RateLimitStats stats;
  std::optional<std::uint64_t> remaining_daily;

  [[nodiscard]] std::string to_json() const;
};

/// Sliding 60 s window plus an optional UTC-day cap for one provider.
class RateLimiter {
public:
  static constexpr std::chrono::seconds WINDOW{60};
  static constexpr std::chrono::milliseconds MIN_SLEEP{10};
  static constexpr std::chrono::milliseconds MAX_SLEEP{1000};

  RateLimiter(std::string provider, config::RateLimitConfig config,
              std::shared_ptr<common::Clock> clock = nullptr,
              std::shared_ptr<alerts::IAlertSink> alert_sink = nullptr,
              double warning_percent = 90.0);

  RateLimiter(const RateLimiter &) = delete;
  RateLimiter &operator=(const RateLimiter &) = delete;

  [[nodiscard]] const std::string &provider() const { return provider_; }
  [[nodiscard]] const config::RateLimitConfig &config() const { return config_; }

  /// Non-blocking: would a request be admitted right now? Records nothing.
  [[nodiscard]] bool check();

  /// Admits and records one request, sleeping in bounded steps while the minute window is full.
  /// false: the daily cap is spent, or the wait would exceed max_wait_ms.
  /// Error: a cap is hit and allow_wait is off.
  [[nodiscard]] AcquireResult acquire();

  /// acquire() on a worker thread. The limiter must outlive the returned future.
  [[nodiscard]] std::future<AcquireResult> acquire_async();

  [[nodiscard]] std::optional<std::uint64_t> remaining_daily();

  [[nodiscard]] RateLimitStats stats();
  [[nodiscard]] RateLimitSnapshot snapshot();
  [[nodiscard]] std::string to_json();

  void reset();

private:
  void prune_locked(common::TimePoint now);
  void rollover_locked(common::TimePoint now);
  [[nodiscard]] bool daily_exhausted_locked() const;
  void alert(alerts::AlertLevel level, const std::string &message, std::uint64_t used);

  const std::string provider_;
  const config::RateLimitConfig config_;
  std::shared_ptr<common::Clock> clock_;
  std::shared_ptr<alerts::IAlertSink> alert_sink_;
  const double warning_percent_;

  std::mutex mutex_;
  std::deque<common::TimePoint> minute_window_;
  std::uint64_t daily_count_ = 0;
  std::optional<std::int64_t> daily_reset_day_;
  bool warned_today_ = false;
  bool exhausted_alerted_today_ = false;
  RateLimitStats stats_;
};

} // namespace tollgate::ratelimit
