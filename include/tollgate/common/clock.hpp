#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace tollgate::common {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;

class Clock {
public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual TimePoint now() const = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] TimePoint now() const override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

/// Deterministic clock for tests. Sleeping advances time instead of blocking.
class ManualClock final : public Clock {
public:
  explicit ManualClock(TimePoint start = TimePoint{std::chrono::hours(24 * 19'700)});

  [[nodiscard]] TimePoint now() const override;
  void sleep_for(std::chrono::milliseconds duration) override;

  void advance(Duration delta);
  void set(TimePoint value);
  [[nodiscard]] std::uint64_t sleep_calls() const;
  [[nodiscard]] std::chrono::milliseconds total_slept() const;

private:
  mutable std::mutex mutex_;
  TimePoint now_;
  std::uint64_t sleep_calls_ = 0;
  std::chrono::milliseconds total_slept_{0};
};

[[nodiscard]] std::shared_ptr<Clock> default_clock();

/// Days since 1970-01-01 in UTC.
[[nodiscard]] std::int64_t utc_day_number(TimePoint point);
[[nodiscard]] TimePoint floor_to_hour(TimePoint point);
[[nodiscard]] TimePoint floor_to_day(TimePoint point);

[[nodiscard]] std::string format_utc(TimePoint point);
[[nodiscard]] std::string format_utc_date(TimePoint point);

[[nodiscard]] double to_unix_seconds(TimePoint point);
[[nodiscard]] TimePoint from_unix_seconds(double seconds);
[[nodiscard]] double to_seconds(Duration duration);

} // namespace tollgate::common
