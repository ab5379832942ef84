#include "tollgate/common/clock.hpp"

#include <ctime>
#include <thread>

namespace tollgate::common {

namespace {

std::tm to_utc_tm(TimePoint point) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(point);
  std::tm out{};
#if defined(_WIN32)
  gmtime_s(&out, &seconds);
#else
  gmtime_r(&seconds, &out);
#endif
  return out;
}

std::string format_tm(TimePoint point, const char *pattern) {
  const std::tm parts = to_utc_tm(point);
  char buffer[32];
  const std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &parts);
  return std::string(buffer, written);
}

} // namespace

TimePoint SystemClock::now() const { return std::chrono::system_clock::now(); }

void SystemClock::sleep_for(const std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

ManualClock::ManualClock(TimePoint start) : now_(start) {}

TimePoint ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::sleep_for(const std::chrono::milliseconds duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++sleep_calls_;
  if (duration.count() > 0) {
    now_ += duration;
    total_slept_ += duration;
  }
}

void ManualClock::advance(const Duration delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

void ManualClock::set(TimePoint value) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = value;
}

std::uint64_t ManualClock::sleep_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sleep_calls_;
}

std::chrono::milliseconds ManualClock::total_slept() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_slept_;
}

std::shared_ptr<Clock> default_clock() {
  static const std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
  return clock;
}

std::int64_t utc_day_number(TimePoint point) {
  return std::chrono::floor<std::chrono::days>(point).time_since_epoch().count();
}

TimePoint floor_to_hour(TimePoint point) {
  return std::chrono::time_point_cast<Duration>(std::chrono::floor<std::chrono::hours>(point));
}

TimePoint floor_to_day(TimePoint point) {
  return std::chrono::time_point_cast<Duration>(std::chrono::floor<std::chrono::days>(point));
}

std::string format_utc(TimePoint point) { return format_tm(point, "%Y-%m-%dT%H:%M:%SZ"); }

std::string format_utc_date(TimePoint point) { return format_tm(point, "%Y-%m-%d"); }

double to_unix_seconds(TimePoint point) {
  return std::chrono::duration<double>(point.time_since_epoch()).count();
}

TimePoint from_unix_seconds(const double seconds) {
  return TimePoint{std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds))};
}

double to_seconds(const Duration duration) {
  return std::chrono::duration<double>(duration).count();
}

} // namespace tollgate::common
