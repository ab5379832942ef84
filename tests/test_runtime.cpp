#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tollgate/config/config.hpp"
#include "tollgate/runtime/governor.hpp"
#include "tollgate/runtime/retry.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

namespace rt = tollgate::runtime;
namespace br = tollgate::breaker;
namespace cfg = tollgate::config;
using tollgate::tests::require;

using CallOutcome = tollgate::common::Result<std::string, br::Failure>;

cfg::Config governor_config() {
  auto config = tollgate::testing::quiet_config();
  config.breakers["search"] = cfg::BreakerConfig{.failure_threshold = 2,
                                                 .recovery_timeout_ms = 30'000,
                                                 .half_open_max_calls = 1};
  config.rate_limits["search"] =
      cfg::RateLimitConfig{.requests_per_minute = 100, .daily_limit = 3};
  config.rate_limits["strict"] =
      cfg::RateLimitConfig{.requests_per_minute = 1, .allow_wait = false};
  config.budget.budget_usd = 1.0;
  config.budget.enforce = true;
  return config;
}

CallOutcome fail_with(br::FailureKind kind) {
  return CallOutcome::failure(br::Failure{.kind = kind, .message = "upstream said no"});
}

} // namespace

void register_runtime_tests(std::vector<tollgate::tests::TestCase> &tests) {
  using tollgate::testing::manual_clock;

  tests.push_back({"runtime_guarded_call_success_records_both_components", [] {
                     auto governor = rt::Governor::from_config(governor_config(), manual_clock());
                     auto result = governor->guarded_call("search", "search", [] {
                       return CallOutcome::success("results");
                     });
                     require(result.ok() && result.value() == "results", "value passes through");
                     require(governor->breakers().get("search")->stats().successful_calls == 1,
                             "breaker saw the success");
                     require(governor->rate_limiters().get("search")->remaining_daily() ==
                                 std::optional<std::uint64_t>(2),
                             "rate limiter admitted one call");
                   }});

  tests.push_back({"runtime_guarded_call_failure_then_circuit_open", [] {
                     auto governor = rt::Governor::from_config(governor_config(), manual_clock());
                     for (int i = 0; i < 2; ++i) {
                       auto failed = governor->guarded_call(
                           "search", "openai", [] { return fail_with(br::FailureKind::Transient); });
                       require(!failed.ok() && failed.error().failure() != nullptr,
                               "service failure surfaces as a failure");
                     }

                     bool ran = false;
                     auto rejected = governor->guarded_call("search", "openai", [&ran] {
                       ran = true;
                       return CallOutcome::success("late");
                     });
                     require(!ran, "open circuit must not run the call");
                     require(!rejected.ok() && rejected.error().circuit_open(),
                             "open circuit is reported");
                     require(rejected.error().message().find("Circuit 'search' is OPEN") == 0,
                             "message: " + rejected.error().message());
                   }});

  tests.push_back({"runtime_guarded_call_maps_rate_limit_outcomes", [] {
                     auto governor = rt::Governor::from_config(governor_config(), manual_clock());
                     const auto ok = [] { return CallOutcome::success("ok"); };

                     require(governor->guarded_call("svc", "strict", ok).ok(), "first admitted");
                     auto refused = governor->guarded_call("svc", "strict", ok);
                     require(!refused.ok() && refused.error().rate_limited(),
                             "allow_wait=false rejects");
                     require(std::holds_alternative<tollgate::ratelimit::RateLimitExceededError>(
                                 refused.error().detail),
                             "carries the limiter error");

                     for (int i = 0; i < 3; ++i) {
                       require(governor->guarded_call("svc", "search", ok).ok(),
                               "within the daily cap");
                     }
                     auto spent = governor->guarded_call("svc", "search", ok);
                     require(!spent.ok() && spent.error().rate_limited(), "daily cap spent");
                     require(std::holds_alternative<rt::AdmissionTimeout>(spent.error().detail),
                             "waiting gave up");
                     require(!rt::is_retryable(spent.error()), "limiter refusals are not retried");
                     require(governor->breakers().get("svc")->stats().total_calls == 4,
                             "refused calls never reach the breaker");
                   }});

  tests.push_back({"runtime_retries_back_off_exponentially", [] {
                     auto clock = manual_clock();
                     int attempts = 0;
                     auto result = rt::call_with_retries(
                         [&attempts] {
                           ++attempts;
                           return attempts < 3 ? fail_with(br::FailureKind::Timeout)
                                               : CallOutcome::success("third time");
                         },
                         rt::RetryPolicy{}, *clock);
                     require(result.ok() && result.value() == "third time", "eventual success");
                     require(attempts == 3, "two retries");
                     require(clock->sleep_calls() == 2, "one sleep per retry");
                     require(clock->total_slept() == std::chrono::milliseconds(1'500),
                             "500ms then 1000ms");
                   }});

  tests.push_back({"runtime_retries_stop_after_max", [] {
                     auto clock = manual_clock();
                     int attempts = 0;
                     auto result = rt::call_with_retries(
                         [&attempts] {
                           ++attempts;
                           return fail_with(br::FailureKind::Transient);
                         },
                         rt::RetryPolicy{.max_retries = 3, .backoff_ms = 100}, *clock);
                     require(!result.ok(), "still failing");
                     require(attempts == 4, "one call plus three retries");
                     require(clock->total_slept() == std::chrono::milliseconds(700),
                             "100 + 200 + 400");
                   }});

  tests.push_back({"runtime_backoff_stops_doubling", [] {
                     const rt::RetryPolicy policy{.max_retries = 100, .backoff_ms = 1};
                     require(rt::backoff_delay(policy, 3) == std::chrono::milliseconds(8),
                             "1ms doubled three times");
                     require(rt::backoff_delay(policy, 64) == std::chrono::milliseconds(1 << 20),
                             "doubling stops at the twentieth retry");
                     require(rt::backoff_delay(rt::RetryPolicy{.backoff_ms = UINT64_MAX}, 5) ==
                                 std::chrono::milliseconds::max(),
                             "huge delays saturate");

                     auto clock = manual_clock();
                     int attempts = 0;
                     auto result = rt::call_with_retries(
                         [&attempts] {
                           ++attempts;
                           return fail_with(br::FailureKind::Transient);
                         },
                         rt::RetryPolicy{.max_retries = 70, .backoff_ms = 1}, *clock);
                     require(!result.ok() && attempts == 71, "every retry runs");
                     require(clock->sleep_calls() == 70, "one sleep per retry");
                     require(clock->total_slept() ==
                                 std::chrono::milliseconds((1 << 21) - 1 + 49 * (1 << 20)),
                             "capped delays add up");
                   }});

  tests.push_back({"runtime_non_retryable_failures_are_returned", [] {
                     for (const auto kind : {br::FailureKind::Validation,
                                             br::FailureKind::Authentication,
                                             br::FailureKind::Fatal}) {
                       auto clock = manual_clock();
                       int attempts = 0;
                       auto result = rt::call_with_retries(
                           [&attempts, kind] {
                             ++attempts;
                             return fail_with(kind);
                           },
                           rt::RetryPolicy{}, *clock);
                       require(!result.ok() && attempts == 1,
                               br::failure_kind_to_string(kind) + " should not be retried");
                       require(clock->sleep_calls() == 0, "no backoff");
                     }
                   }});

  tests.push_back({"runtime_retries_stop_when_circuit_opens", [] {
                     auto clock = manual_clock();
                     auto governor = rt::Governor::from_config(governor_config(), clock);
                     int attempts = 0;
                     auto result = governor->guarded_call_with_retries(
                         "search", "openai", rt::RetryPolicy{.max_retries = 5, .backoff_ms = 10},
                         [&attempts] {
                           ++attempts;
                           return fail_with(br::FailureKind::Transient);
                         });
                     require(!result.ok() && result.error().circuit_open(),
                             "the open circuit ends the retry loop");
                     require(attempts == 2, "only the calls before the circuit opened ran");
                     require(governor->breakers().get("search")->stats().rejected_calls == 1,
                             "one rejected attempt");
                   }});

  tests.push_back({"runtime_governor_tracks_usage_with_configured_budget", [] {
                     auto sink = std::make_shared<tollgate::testing::CollectingAlertSink>();
                     auto governor =
                         rt::Governor::from_config(governor_config(), manual_clock(), sink);
                     require(governor->alert_sink() == sink, "explicit sink is used");
                     require(governor->ledger() == nullptr, "ledger disabled");

                     const auto first = governor->track_usage(tollgate::cost::UsageRequest{
                         .provider = "openai", .model = "mystery-model", .input_tokens = 400'000});
                     require(first.ok(), "below budget");
                     const auto second = governor->track_usage(tollgate::cost::UsageRequest{
                         .provider = "openai", .model = "mystery-model", .input_tokens = 200'000});
                     require(!second.ok(), "enforced budget exceeded");
                     require(std::fabs(second.error().summary.total_cost_usd - 1.2) < 1e-9,
                             "summary in the error");
                     require(governor->global_tracker()->usages().size() == 2, "both records kept");

                     const auto job = governor->track_usage(
                         tollgate::cost::UsageRequest{.provider = "openai",
                                                      .model = "gpt-4o-mini",
                                                      .input_tokens = 1'000},
                         "job-42");
                     require(job.ok(), "separate scope has its own budget");
                     require(governor->trackers().size() == 2, "two trackers");
                     require(sink->count_from("cost_tracker") >= 1, "budget alerts delivered");

                     const auto snapshot = governor->snapshot();
                     require(snapshot.tokens.by_tracker.contains("job-42"), "snapshot sees job");
                     require(snapshot.budget.trackers_exceeded == 1, "global is exceeded");
                   }});

  tests.push_back({"runtime_from_disk_rejects_invalid_config", [] {
                     tollgate::testing::TempDir dir;
                     dir.create_file("config.toml",
                                     "[rate_limits.openai]\nrequests_per_minute = 0\n");
                     tollgate::testing::EnvGuard path("TOLLGATE_CONFIG_PATH",
                                                      (dir.path() / "config.toml").string());
                     tollgate::testing::EnvGuard env_limit("TOLLGATE_OPENAI_RATE_LIMIT_PER_MIN",
                                                           std::nullopt);

                     const auto parsed = tollgate::config::load_config();
                     require(parsed.ok() && parsed.value().rate_limits.at("openai")
                                                    .requests_per_minute == 0,
                             "the raw loader keeps the value for validate to report");
                     const auto governor = rt::Governor::from_disk();
                     require(!governor.ok(), "governor refuses an invalid config");
                     require(governor.error().find("requests_per_minute must be >= 1") !=
                                 std::string::npos,
                             "error: " + governor.error());
                   }});

  tests.push_back({"runtime_tracker_options_follow_config", [] {
                     auto config = governor_config();
                     config.alerts.budget_warning_percent = 60.0;
                     const auto options = rt::tracker_options(config);
                     require(options.budget_usd == std::optional<double>(1.0), "budget");
                     require(options.enforce_budget, "enforce");
                     require(options.warning_percent == 60.0, "warning percent");
                     require(!options.scope_id.has_value(), "no scope by default");
                   }});
}
