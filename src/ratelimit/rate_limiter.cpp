#include "tollgate/ratelimit/rate_limiter.hpp"

#include "tollgate/common/json.hpp"
#include "tollgate/common/strings.hpp"
#include "tollgate/observability/global.hpp"

#include <algorithm>
#include <sstream>

namespace tollgate::ratelimit {

namespace {

std::string optional_time_json(const std::optional<common::TimePoint> &value) {
  return value.has_value() ? common::json_quote(common::format_utc(*value)) : "null";
}

template <typename T> std::string optional_count_json(const std::optional<T> &value) {
  return value.has_value() ? std::to_string(*value) : "null";
}

} // namespace

std::string limit_type_to_string(const LimitType type) {
  return type == LimitType::Daily ? "daily" : "per_minute";
}

std::string RateLimitExceededError::message() const {
  return "Rate limit exceeded for " + provider + ": " + std::to_string(current) + "/" +
         std::to_string(limit) + " (" + limit_type_to_string(limit_type) + ")";
}

std::string RateLimitSnapshot::to_json() const {
  std::ostringstream out;
  out << "{\"provider\":" << common::json_quote(provider)
      << ",\"requests_per_minute\":" << config.requests_per_minute
      << ",\"daily_limit\":" << optional_count_json(config.daily_limit)
      << ",\"allow_wait\":" << (config.allow_wait ? "true" : "false")
      << ",\"max_wait_seconds\":"
      << common::json_number(static_cast<double>(config.max_wait_ms) / 1000.0, 1)
      << ",\"stats\":{\"total_requests\":" << stats.total_requests
      << ",\"requests_today\":" << stats.requests_today
      << ",\"requests_this_minute\":" << stats.requests_this_minute
      << ",\"waits_count\":" << stats.waits_count << ",\"total_wait_time_seconds\":"
      << common::json_number(static_cast<double>(stats.total_wait_time.count()) / 1000.0, 2)
      << ",\"last_request_at\":" << optional_time_json(stats.last_request_at)
      << ",\"daily_reset_at\":" << optional_time_json(stats.daily_reset_at)
      << "},\"remaining_daily\":" << optional_count_json(remaining_daily) << "}";
  return out.str();
}

RateLimiter::RateLimiter(std::string provider, config::RateLimitConfig config,
                         std::shared_ptr<common::Clock> clock,
                         std::shared_ptr<alerts::IAlertSink> alert_sink,
                         const double warning_percent)
    : provider_(std::move(provider)), config_(std::move(config)),
      clock_(clock != nullptr ? std::move(clock) : common::default_clock()),
      alert_sink_(std::move(alert_sink)), warning_percent_(warning_percent) {}

bool RateLimiter::check() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_->now();
  rollover_locked(now);
  prune_locked(now);
  if (daily_exhausted_locked()) {
    return false;
  }
  return minute_window_.size() < config_.requests_per_minute;
}

AcquireResult RateLimiter::acquire() {
  const auto started = clock_->now();

  while (true) {
    std::chrono::milliseconds wait{0};
    std::uint64_t in_window = 0;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      const auto now = clock_->now();
      rollover_locked(now);
      prune_locked(now);

      if (daily_exhausted_locked()) {
        const std::uint64_t used = daily_count_;
        lock.unlock();
        observability::record_rate_limit_rejected(provider_, "daily", used, *config_.daily_limit);
        if (!config_.allow_wait) {
          return AcquireResult::failure(RateLimitExceededError{.provider = provider_,
                                                               .limit_type = LimitType::Daily,
                                                               .current = used,
                                                               .limit = *config_.daily_limit});
        }
        return AcquireResult::success(false);
      }

      if (minute_window_.size() < config_.requests_per_minute) {
        minute_window_.push_back(now);
        ++daily_count_;
        ++stats_.total_requests;
        stats_.requests_today = daily_count_;
        stats_.requests_this_minute = minute_window_.size();
        stats_.last_request_at = now;

        std::optional<std::pair<alerts::AlertLevel, std::string>> pending;
        if (config_.daily_limit.has_value() && *config_.daily_limit > 0) {
          const double used_percent = static_cast<double>(daily_count_) * 100.0 /
                                      static_cast<double>(*config_.daily_limit);
          if (daily_count_ >= *config_.daily_limit && !exhausted_alerted_today_) {
            exhausted_alerted_today_ = true;
            pending.emplace(alerts::AlertLevel::Error,
                            "Daily rate limit for '" + provider_ + "' exhausted");
          } else if (used_percent >= warning_percent_ && !warned_today_) {
            warned_today_ = true;
            pending.emplace(alerts::AlertLevel::Warning,
                            "Daily rate limit for '" + provider_ + "' at " +
                                common::format_fixed(used_percent, 0) + "%");
          }
        }
        const std::uint64_t used = daily_count_;
        lock.unlock();
        if (pending.has_value()) {
          alert(pending->first, pending->second, used);
        }
        return AcquireResult::success(true);
      }

      in_window = minute_window_.size();
      if (!config_.allow_wait) {
        lock.unlock();
        observability::record_rate_limit_rejected(provider_, "per_minute", in_window,
                                                  config_.requests_per_minute);
        return AcquireResult::failure(RateLimitExceededError{.provider = provider_,
                                                             .limit_type = LimitType::PerMinute,
                                                             .current = in_window,
                                                             .limit = config_.requests_per_minute});
      }

      if (minute_window_.empty()) {
        // requests_per_minute == 0: no entry will ever expire to make room.
        lock.unlock();
        observability::record_rate_limit_rejected(provider_, "per_minute", 0,
                                                  config_.requests_per_minute);
        return AcquireResult::success(false);
      }

      const auto expires = minute_window_.front() + WINDOW;
      if (expires > now) {
        wait = std::chrono::ceil<std::chrono::milliseconds>(expires - now);
      }
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - started);
    if (elapsed + wait > std::chrono::milliseconds(config_.max_wait_ms)) {
      observability::record_rate_limit_rejected(provider_, "per_minute", in_window,
                                                config_.requests_per_minute);
      return AcquireResult::success(false);
    }

    // Sleep in short steps so a reset() or an expiring entry is noticed promptly.
    const auto step = std::clamp(wait, MIN_SLEEP, MAX_SLEEP);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.waits_count;
      stats_.total_wait_time += step;
    }
    observability::record_rate_limit_wait(provider_, step);
    clock_->sleep_for(step);
  }
}

std::future<AcquireResult> RateLimiter::acquire_async() {
  return std::async(std::launch::async, [this] { return acquire(); });
}

std::optional<std::uint64_t> RateLimiter::remaining_daily() {
  if (!config_.daily_limit.has_value()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  rollover_locked(clock_->now());
  return daily_count_ >= *config_.daily_limit ? 0 : *config_.daily_limit - daily_count_;
}

RateLimitStats RateLimiter::stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_->now();
  rollover_locked(now);
  prune_locked(now);
  stats_.requests_this_minute = minute_window_.size();
  return stats_;
}

RateLimitSnapshot RateLimiter::snapshot() {
  RateLimitSnapshot out{.provider = provider_, .config = config_, .stats = stats()};
  out.remaining_daily = remaining_daily();
  return out;
}

std::string RateLimiter::to_json() { return snapshot().to_json(); }

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  minute_window_.clear();
  daily_count_ = 0;
  daily_reset_day_.reset();
  warned_today_ = false;
  exhausted_alerted_today_ = false;
  stats_ = RateLimitStats{};
}

void RateLimiter::prune_locked(const common::TimePoint now) {
  const auto cutoff = now - WINDOW;
  while (!minute_window_.empty() && minute_window_.front() < cutoff) {
    minute_window_.pop_front();
  }
}

void RateLimiter::rollover_locked(const common::TimePoint now) {
  const std::int64_t today = common::utc_day_number(now);
  if (daily_reset_day_.has_value() && *daily_reset_day_ >= today) {
    return;
  }
  daily_count_ = 0;
  daily_reset_day_ = today;
  warned_today_ = false;
  exhausted_alerted_today_ = false;
  stats_.requests_today = 0;
  stats_.daily_reset_at = now;
}

bool RateLimiter::daily_exhausted_locked() const {
  return config_.daily_limit.has_value() && daily_count_ >= *config_.daily_limit;
}

void RateLimiter::alert(const alerts::AlertLevel level, const std::string &message,
                        const std::uint64_t used) {
  if (alert_sink_ == nullptr) {
    return;
  }
  alert_sink_->deliver(alerts::make_alert(
      level, "rate_limiter", message,
      {{"provider", provider_},
       {"used", std::to_string(used)},
       {"daily_limit", std::to_string(config_.daily_limit.value_or(0))}},
      clock_->now()));
}

} // namespace tollgate::ratelimit
