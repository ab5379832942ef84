#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tollgate/breaker/circuit_breaker.hpp"
#include "tollgate/common/json.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace br = tollgate::breaker;
namespace cfg = tollgate::config;
using tollgate::tests::require;

cfg::BreakerConfig small_config() {
  return cfg::BreakerConfig{.failure_threshold = 3,
                            .success_threshold = 2,
                            .recovery_timeout_ms = 10'000,
                            .half_open_max_calls = 1,
                            .failure_rate_threshold = 0.5,
                            .min_calls_for_rate = 100,
                            .excluded_failure_kinds = {"validation"}};
}

br::Failure transient(const std::string &message = "upstream 503") {
  return br::Failure{.kind = br::FailureKind::Transient, .message = message};
}

void trip(br::CircuitBreaker &breaker, std::uint32_t count) {
  for (std::uint32_t i = 0; i < count; ++i) {
    breaker.record_failure(transient());
  }
}

} // namespace

void register_breaker_tests(std::vector<tollgate::tests::TestCase> &tests) {
  using tollgate::testing::CollectingAlertSink;
  using tollgate::testing::manual_clock;

  tests.push_back({"breaker_opens_exactly_at_failure_threshold", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("openai", small_config(), clock);
                     for (std::uint32_t i = 1; i < 3; ++i) {
                       breaker.record_failure(transient());
                       require(breaker.is_closed(),
                               "breaker opened early after " + std::to_string(i) + " failures");
                     }
                     breaker.record_failure(transient());
                     require(breaker.is_open(), "third consecutive failure should open");
                   }});

  tests.push_back({"breaker_success_resets_consecutive_failures", [] {
                     br::CircuitBreaker breaker("svc", small_config(), manual_clock());
                     trip(breaker, 2);
                     breaker.record_success();
                     trip(breaker, 2);
                     require(breaker.is_closed(), "interleaved success should keep circuit closed");
                     require(breaker.stats().consecutive_failures == 2,
                             "consecutive failures should restart after a success");
                   }});

  tests.push_back({"breaker_failure_rate_opens_after_min_calls", [] {
                     auto config = small_config();
                     config.failure_threshold = 50;
                     config.min_calls_for_rate = 4;
                     config.failure_rate_threshold = 0.5;
                     br::CircuitBreaker breaker("rate", config, manual_clock());

                     breaker.record_success();
                     breaker.record_failure(transient());
                     breaker.record_success();
                     require(breaker.is_closed(), "too few samples for the rate rule");
                     breaker.record_failure(transient());
                     require(breaker.is_open(), "2 of 4 failed should reach the 50% rate");
                     const auto reason = breaker.stats().last_failure_reason;
                     require(reason.has_value() && *reason == "upstream 503",
                             "last failure reason should be kept");
                   }});

  tests.push_back({"breaker_zero_min_calls_disables_rate_rule", [] {
                     auto config = small_config();
                     config.failure_threshold = 2;
                     config.min_calls_for_rate = 0;
                     br::CircuitBreaker breaker("svc", config, manual_clock());
                     breaker.record_failure(transient());
                     require(breaker.is_closed(), "a single failure is not a 100% rate trip");
                     breaker.record_failure(transient());
                     require(breaker.is_open(), "consecutive rule still applies");
                   }});

  tests.push_back({"breaker_open_rejects_with_circuit_open_error", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("anthropic", small_config(), clock);
                     trip(breaker, 3);
                     clock->advance(std::chrono::seconds(4));

                     require(!breaker.can_execute(), "open circuit should refuse calls");
                     auto permit = breaker.acquire();
                     require(!permit.has_value(), "acquire should refuse while open");
                     require(breaker.stats().rejected_calls == 1,
                             "acquire should record the rejection");

                     const auto error = breaker.open_error();
                     require(error.breaker_name == "anthropic", "error should carry the name");
                     require(error.time_remaining == std::chrono::seconds(6),
                             "error should carry the remaining recovery time");
                     require(error.message() ==
                                 "Circuit 'anthropic' is OPEN. Retry in 6.0s. Last failure: "
                                 "upstream 503",
                             "unexpected message: " + error.message());
                   }});

  tests.push_back({"breaker_recovers_to_half_open_after_timeout", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("svc", small_config(), clock);
                     trip(breaker, 3);

                     clock->advance(std::chrono::milliseconds(9'999));
                     require(breaker.state() == br::CircuitState::Open,
                             "still open just before the timeout");
                     clock->advance(std::chrono::milliseconds(2));
                     require(breaker.state() == br::CircuitState::HalfOpen,
                             "half-open just after the timeout");
                     require(breaker.time_remaining().count() == 0,
                             "no time remaining outside OPEN");
                   }});

  tests.push_back({"breaker_half_open_limits_trial_calls", [] {
                     auto clock = manual_clock();
                     auto config = small_config();
                     config.half_open_max_calls = 2;
                     br::CircuitBreaker breaker("svc", config, clock);
                     trip(breaker, 3);
                     clock->advance(std::chrono::seconds(11));

                     require(breaker.can_execute(), "first trial call admitted");
                     require(breaker.can_execute(), "second trial call admitted");
                     require(!breaker.can_execute(), "third trial call over the limit");
                     require(breaker.stats().half_open_in_flight == 2, "two trial calls in flight");

                     breaker.record_success();
                     require(breaker.stats().half_open_in_flight == 1,
                             "success should release a trial slot");
                     require(breaker.can_execute(), "released slot can be reused");
                   }});

  tests.push_back({"breaker_half_open_closes_after_success_threshold", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("svc", small_config(), clock);
                     trip(breaker, 3);
                     clock->advance(std::chrono::seconds(11));

                     require(breaker.can_execute(), "trial call admitted");
                     breaker.record_success();
                     require(breaker.is_half_open(), "one success is not enough");
                     require(breaker.can_execute(), "second trial call admitted");
                     breaker.record_success();
                     require(breaker.is_closed(), "second success should close");
                     const auto stats = breaker.stats();
                     require(stats.consecutive_failures == 0, "closing clears failures");
                     require(stats.half_open_in_flight == 0, "closing clears trial calls");
                   }});

  tests.push_back({"breaker_half_open_failure_reopens", [] {
                     auto clock = manual_clock();
                     auto config = small_config();
                     config.success_threshold = 5;
                     config.half_open_max_calls = 5;
                     br::CircuitBreaker breaker("svc", config, clock);
                     trip(breaker, 3);
                     clock->advance(std::chrono::seconds(11));

                     for (int i = 0; i < 4; ++i) {
                       require(breaker.can_execute(), "trial call should be admitted");
                       breaker.record_success();
                     }
                     require(breaker.can_execute(), "last trial call admitted");
                     breaker.record_failure(transient("still down"));
                     require(breaker.is_open(), "a single trial failure reopens");
                     require(breaker.time_remaining() == std::chrono::seconds(10),
                             "reopening restarts the recovery timer");
                     require(breaker.stats().half_open_in_flight == 0,
                             "reopening clears trial slots");
                   }});

  tests.push_back({"breaker_repeated_success_in_closed_is_stable", [] {
                     br::CircuitBreaker breaker("svc", small_config(), manual_clock());
                     for (int i = 0; i < 10; ++i) {
                       breaker.record_success();
                     }
                     const auto stats = breaker.stats();
                     require(stats.state == br::CircuitState::Closed, "state should not change");
                     require(stats.consecutive_failures == 0, "no failures to count");
                     require(stats.consecutive_successes == 0,
                             "closed successes are not counted as recovery");
                     require(stats.successful_calls == 10 && stats.total_calls == 10,
                             "lifetime counters should count every success");
                   }});

  tests.push_back({"breaker_excluded_kind_is_not_counted", [] {
                     br::CircuitBreaker breaker("svc", small_config(), manual_clock());
                     for (int i = 0; i < 10; ++i) {
                       breaker.record_failure(
                           br::Failure{.kind = br::FailureKind::Validation, .message = "bad"});
                     }
                     const auto stats = breaker.stats();
                     require(stats.state == br::CircuitState::Closed,
                             "validation errors must not trip the circuit");
                     require(stats.failed_calls == 0 && stats.total_calls == 0,
                             "excluded failures should not be counted");
                     require(!stats.last_failure_reason.has_value(),
                             "excluded failures should not set a reason");
                   }});

  tests.push_back({"breaker_excluded_kind_releases_trial_slot", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("svc", small_config(), clock);
                     trip(breaker, 3);
                     clock->advance(std::chrono::seconds(11));

                     require(breaker.can_execute(), "trial call admitted");
                     require(!breaker.can_execute(), "single trial slot taken");
                     breaker.record_failure(
                         br::Failure{.kind = br::FailureKind::Validation, .message = "bad input"});
                     require(breaker.is_half_open(), "excluded failure should not reopen");
                     require(breaker.can_execute(), "slot should be free again");
                   }});

  tests.push_back({"breaker_permit_without_outcome_counts_as_failure", [] {
                     br::CircuitBreaker breaker("svc", small_config(), manual_clock());
                     {
                       auto permit = breaker.acquire();
                       require(permit.has_value(), "closed circuit should admit");
                     }
                     const auto stats = breaker.stats();
                     require(stats.failed_calls == 1, "dropped permit should record a failure");
                     require(stats.last_failure_reason ==
                                 std::optional<std::string>("call ended without reporting an outcome"),
                             "dropped permit reason mismatch");

                     {
                       auto permit = breaker.acquire();
                       permit->success();
                     }
                     require(breaker.stats().successful_calls == 1,
                             "explicit success should be recorded exactly once");
                     require(breaker.stats().failed_calls == 1,
                             "reported permit should not add a failure on destruction");
                   }});

  tests.push_back({"breaker_call_wraps_outcomes", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("svc", small_config(), clock);

                     auto ok = breaker.call([] {
                       return tollgate::common::Result<int, br::Failure>::success(42);
                     });
                     require(ok.ok() && ok.value() == 42, "successful call should pass through");

                     for (int i = 0; i < 3; ++i) {
                       auto failed = breaker.call([] {
                         return tollgate::common::Result<int, br::Failure>::failure(
                             br::Failure{.kind = br::FailureKind::Timeout, .message = "slow"});
                       });
                       require(!failed.ok(), "failure should surface");
                       require(!failed.error().rejected(), "failure is not a rejection");
                       require(failed.error().failure()->kind == br::FailureKind::Timeout,
                               "failure kind should be kept");
                     }

                     bool ran = false;
                     auto rejected = breaker.call([&ran] {
                       ran = true;
                       return tollgate::common::Result<void, br::Failure>::success();
                     });
                     require(!ran, "open circuit must not run the call");
                     require(!rejected.ok() && rejected.error().rejected(),
                             "open circuit should reject");
                     require(rejected.error().open_error()->last_failure ==
                                 std::optional<std::string>("slow"),
                             "rejection should carry the last failure");
                   }});

  tests.push_back({"breaker_notifies_state_changes", [] {
                     auto clock = manual_clock();
                     auto sink = std::make_shared<CollectingAlertSink>();
                     br::CircuitBreaker breaker("openai", small_config(), clock, sink);

                     std::vector<std::pair<br::CircuitState, br::CircuitState>> seen;
                     breaker.on_state_change(
                         [&seen](const std::string &, br::CircuitState from, br::CircuitState to) {
                           seen.emplace_back(from, to);
                         });

                     trip(breaker, 3);
                     clock->advance(std::chrono::seconds(11));
                     (void)breaker.state();
                     require(breaker.can_execute(), "trial call admitted");
                     breaker.record_success();
                     require(breaker.can_execute(), "trial call admitted");
                     breaker.record_success();

                     require(seen.size() == 3, "expected three transitions");
                     require(seen[0].second == br::CircuitState::Open, "first transition opens");
                     require(seen[1].second == br::CircuitState::HalfOpen,
                             "second transition recovers");
                     require(seen[2].second == br::CircuitState::Closed, "third transition closes");

                     require(sink->count_from("circuit_breaker") == 3, "one alert per transition");
                     require(sink->count(tollgate::alerts::AlertLevel::Error) == 1,
                             "opening is an error alert");
                     const auto alerts = sink->alerts();
                     require(alerts.front().metadata.at("service") == "openai",
                             "alert should name the service");
                     require(alerts.front().message.find("closed -> open") != std::string::npos,
                             "alert should describe the transition");
                   }});

  tests.push_back({"breaker_throwing_callback_does_not_break_transition", [] {
                     tollgate::testing::ObserverScope scope;
                     br::CircuitBreaker breaker("svc", small_config(), manual_clock());
                     breaker.on_state_change([](const std::string &, br::CircuitState,
                                                br::CircuitState) {
                       throw std::runtime_error("listener failed");
                     });
                     trip(breaker, 3);
                     require(breaker.is_open(), "transition should still happen");
                     require(scope.log().of<tollgate::observability::ErrorEvent>().size() == 1,
                             "callback failure should be reported");
                     require(scope.log().of<tollgate::observability::BreakerStateChangeEvent>()
                                     .size() == 1,
                             "transition should be observed");
                   }});

  tests.push_back({"breaker_force_open_and_reset", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("svc", small_config(), clock);
                     breaker.record_success();
                     breaker.force_open();
                     require(breaker.is_open(), "force_open should open");
                     require(!breaker.can_execute(), "forced open refuses calls");
                     require(breaker.time_remaining() == std::chrono::seconds(10),
                             "forced open uses the recovery timeout");

                     breaker.reset();
                     const auto stats = breaker.stats();
                     require(stats.state == br::CircuitState::Closed, "reset closes");
                     require(stats.total_calls == 0 && stats.successful_calls == 0 &&
                                 stats.rejected_calls == 0,
                             "reset zeroes counters");
                     require(!stats.last_failure_at.has_value(), "reset clears failure time");
                   }});

  tests.push_back({"breaker_snapshot_json_fields", [] {
                     auto clock = manual_clock();
                     br::CircuitBreaker breaker("openai", small_config(), clock);
                     trip(breaker, 3);
                     const auto json = breaker.to_json();
                     for (const std::string field :
                          {"\"name\":\"openai\"", "\"state\":\"open\"", "\"config\":{",
                           "\"total_calls\":3", "\"failed_calls\":3", "\"rejected_calls\":0",
                           "\"consecutive_failures\":3", "\"last_failure_reason\":\"upstream 503\"",
                           "\"time_remaining_seconds\":10.0"}) {
                       require(json.find(field) != std::string::npos,
                               "missing " + field + " in " + json);
                     }

                     namespace js = tollgate::common;
                     require(js::json_get_string(json, "name") == "openai", "name field");
                     require(js::json_get_string(json, "state") == "open", "state field");
                     const auto config = js::json_get_object(json, "config");
                     require(js::json_get_number(config, "failure_threshold") == 3.0,
                             "config object: " + config);
                     require(js::json_get_array(json, "config").empty(),
                             "config is an object, not an array");
                     require(js::json_get_number(json, "time_remaining_seconds") == 10.0,
                             "remaining seconds");
                     require(js::json_get_raw(json, "last_success_at") == "null",
                             "no success yet");
                   }});

  tests.push_back({"breaker_call_admitted_while_closed_does_not_close_half_open", [] {
                     auto clock = manual_clock();
                     auto config = small_config();
                     config.failure_threshold = 1;
                     config.success_threshold = 1;
                     config.recovery_timeout_ms = 1'000;
                     br::CircuitBreaker breaker("svc", config, clock);

                     auto slow = breaker.acquire();
                     require(slow.has_value(), "closed circuit admits");
                     breaker.record_failure(transient());
                     require(breaker.is_open(), "one failure opens");

                     clock->advance(std::chrono::milliseconds(1'500));
                     auto trial = breaker.acquire();
                     require(trial.has_value(), "trial call admitted after recovery");

                     slow->success();
                     auto stats = breaker.stats();
                     require(stats.state == br::CircuitState::HalfOpen,
                             "older call must not close the circuit");
                     require(stats.half_open_in_flight == 1, "trial slot still held");
                     require(stats.consecutive_successes == 0, "older call not counted");
                     require(stats.successful_calls == 1, "older call still in the totals");
                     require(!breaker.can_execute(), "no second trial slot opened");

                     trial->success();
                     require(breaker.is_closed(), "the trial call closes the circuit");
                   }});

  tests.push_back({"breaker_trial_call_from_earlier_half_open_is_ignored", [] {
                     auto clock = manual_clock();
                     auto config = small_config();
                     config.success_threshold = 1;
                     config.half_open_max_calls = 2;
                     br::CircuitBreaker breaker("svc", config, clock);
                     trip(breaker, 3);

                     clock->advance(std::chrono::seconds(11));
                     auto first = breaker.acquire();
                     auto second = breaker.acquire();
                     require(first.has_value() && second.has_value(), "two trial calls admitted");
                     first->failure(transient("still down"));
                     require(breaker.is_open(), "failed trial call reopens");

                     clock->advance(std::chrono::seconds(11));
                     auto third = breaker.acquire();
                     require(third.has_value(), "new trial call admitted");

                     second->failure(transient("late"));
                     require(breaker.is_half_open(), "late failure does not reopen");
                     require(breaker.stats().half_open_in_flight == 1, "new slot still held");

                     third->success();
                     require(breaker.is_closed(), "current trial call closes");
                   }});

  tests.push_back({"breaker_concurrent_admission_respects_half_open_limit", [] {
                     auto clock = manual_clock();
                     auto config = small_config();
                     config.half_open_max_calls = 3;
                     br::CircuitBreaker breaker("svc", config, clock);
                     trip(breaker, 3);
                     clock->advance(std::chrono::seconds(11));

                     std::atomic<int> admitted{0};
                     std::vector<std::thread> workers;
                     for (int i = 0; i < 16; ++i) {
                       workers.emplace_back([&breaker, &admitted] {
                         for (int j = 0; j < 8; ++j) {
                           if (breaker.can_execute()) {
                             admitted.fetch_add(1);
                           }
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }

                     require(admitted.load() == 3,
                             "admitted " + std::to_string(admitted.load()) + " calls");
                     const auto stats = breaker.stats();
                     require(stats.state == br::CircuitState::HalfOpen, "still half-open");
                     require(stats.half_open_in_flight == 3, "every slot taken");
                   }});

  tests.push_back({"breaker_scenario_threshold_then_single_trial_call", [] {
                     auto clock = manual_clock();
                     auto config = small_config();
                     config.recovery_timeout_ms = 60'000;
                     br::CircuitBreaker breaker("svc", config, clock);

                     trip(breaker, 3);
                     require(breaker.is_open(), "three failures open the circuit");
                     require(!breaker.can_execute(), "open circuit refuses");

                     clock->advance(std::chrono::seconds(61));
                     require(breaker.can_execute(), "first call after recovery is admitted");
                     require(breaker.stats().half_open_in_flight == 1, "one trial call in flight");
                     require(!breaker.can_execute(), "only one trial call at a time");
                   }});
}
