#include "tollgate/config/schema.hpp"

namespace tollgate::config {

std::map<std::string, BreakerConfig> default_breakers() {
  return {
      {"pdf_service",
       BreakerConfig{.failure_threshold = 3,
                     .recovery_timeout_ms = 60'000,
                     .half_open_max_calls = 1}},
      {"openai",
       BreakerConfig{.failure_threshold = 5,
                     .recovery_timeout_ms = 30'000,
                     .half_open_max_calls = 2,
                     .excluded_failure_kinds = {"validation"}}},
      {"anthropic",
       BreakerConfig{.failure_threshold = 5,
                     .recovery_timeout_ms = 30'000,
                     .half_open_max_calls = 2,
                     .excluded_failure_kinds = {"validation"}}},
      {"firecrawl",
       BreakerConfig{.failure_threshold = 3,
                     .recovery_timeout_ms = 120'000,
                     .half_open_max_calls = 1}},
  };
}

std::map<std::string, RateLimitConfig> default_rate_limits() {
  return {
      {"openai", RateLimitConfig{.requests_per_minute = 500}},
      {"anthropic", RateLimitConfig{.requests_per_minute = 100}},
      {"openrouter", RateLimitConfig{.requests_per_minute = 60}},
      {"firecrawl", RateLimitConfig{.requests_per_minute = 10, .daily_limit = 600}},
  };
}

BreakerConfig Config::breaker_for(const std::string &service) const {
  const auto it = breakers.find(service);
  return it == breakers.end() ? breaker_defaults : it->second;
}

RateLimitConfig Config::rate_limit_for(const std::string &provider) const {
  const auto it = rate_limits.find(provider);
  return it == rate_limits.end() ? rate_limit_defaults : it->second;
}

} // namespace tollgate::config
