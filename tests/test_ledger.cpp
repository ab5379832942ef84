#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tollgate/cost/cost_tracker.hpp"
#include "tollgate/cost/ledger.hpp"
#include "tollgate/runtime/governor.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace ct = tollgate::cost;
using tollgate::tests::require;

ct::UsageRecord make_record(const std::string &model, const std::uint64_t input,
                            const double cost, const tollgate::common::TimePoint at,
                            std::optional<std::string> run_id = std::nullopt) {
  ct::UsageRecord record;
  record.provider = "openai";
  record.model = model;
  record.input_tokens = input;
  record.output_tokens = input / 10;
  record.estimated_cost_usd = cost;
  record.run_id = std::move(run_id);
  record.timestamp = at;
  return record;
}

} // namespace

void register_ledger_tests(std::vector<tollgate::tests::TestCase> &tests) {
  tests.push_back({"ledger_append_and_query", [] {
                     tollgate::testing::TempDir dir;
                     ct::UsageLedger ledger(dir.path() / "nested" / "usage.db");
                     require(ledger.is_open(), "ledger should open: " + ledger.open_error());

                     const auto now = tollgate::testing::manual_clock()->now();
                     require(ledger.append("global", make_record("gpt-4o", 1'000, 0.25, now,
                                                                  std::string("run-1")))
                                 .ok(),
                             "first append");
                     require(ledger.append("job", make_record("gpt-4o-mini", 2'000, 0.5, now))
                                 .ok(),
                             "second append");
                     require(ledger.append("global", make_record("gpt-4o", 500, 0.125, now,
                                                                 std::string("run-2")))
                                 .ok(),
                             "third append");

                     const auto count = ledger.count();
                     require(count.ok() && count.value() == 3, "three rows");

                     const auto all = ledger.entries();
                     require(all.ok() && all.value().size() == 3, "every entry");
                     require(all.value()[0].tracker == "global" &&
                                 all.value()[1].tracker == "job",
                             "insertion order");
                     require(all.value()[0].record.run_id == std::optional<std::string>("run-1"),
                             "run id stored");
                     require(!all.value()[1].record.run_id.has_value(), "null run id stays null");
                     require(all.value()[1].record.output_tokens == 200, "tokens stored");
                     require(std::chrono::duration_cast<std::chrono::seconds>(
                                 all.value()[0].record.timestamp - now)
                                     .count() == 0,
                             "timestamp stored");

                     const auto by_run = ledger.entries(ct::UsageFilter{.run_id = "run-2"});
                     require(by_run.ok() && by_run.value().size() == 1 &&
                                 by_run.value()[0].record.input_tokens == 500,
                             "run filter");

                     const auto global = ledger.summary({}, std::string("global"));
                     require(global.ok() && global.value().calls_count == 2, "tracker filter");
                     require(std::fabs(global.value().total_cost_usd - 0.375) < 1e-9,
                             "tracker cost");

                     const auto buckets = ledger.costs(ct::CostPeriod::Daily, 3, now);
                     require(buckets.ok() && buckets.value().size() == 3, "three daily buckets");
                     require(std::fabs(buckets.value()[2].cost_usd - 0.875) < 1e-9 &&
                                 buckets.value()[2].calls == 3,
                             "today holds every record");
                     require(buckets.value()[0].calls == 0, "earlier days are empty");

                     const auto too_many = ledger.costs(ct::CostPeriod::Daily, 100'000'000'000, now);
                     require(!too_many.ok() && too_many.error().find("3660") != std::string::npos,
                             "daily bucket count is capped");
                   }});

  tests.push_back({"ledger_reopen_keeps_rows", [] {
                     tollgate::testing::TempDir dir;
                     const auto path = dir.path() / "usage.db";
                     const auto now = tollgate::testing::manual_clock()->now();
                     {
                       ct::UsageLedger ledger(path);
                       require(ledger.append("global", make_record("gpt-4o", 10, 0.01, now)).ok(),
                               "append");
                     }
                     ct::UsageLedger reopened(path);
                     const auto count = reopened.count();
                     require(count.ok() && count.value() == 1, "row survives reopen");
                   }});

  tests.push_back({"ledger_unopenable_path_reports_error", [] {
                     tollgate::testing::TempDir dir;
                     dir.create_file("blocker", "not a directory");
                     ct::UsageLedger ledger(dir.path() / "blocker" / "usage.db");
                     require(!ledger.is_open(), "a file in the way prevents opening");
                     require(!ledger.open_error().empty(), "error is kept");

                     const auto appended = ledger.append(
                         "global", make_record("gpt-4o", 1, 0.0,
                                               tollgate::testing::manual_clock()->now()));
                     require(!appended.ok(), "append fails");
                     require(appended.error().find("usage ledger not initialized") == 0,
                             "append error: " + appended.error());
                     require(!ledger.count().ok() && !ledger.entries().ok(), "queries fail");
                   }});

  tests.push_back({"ledger_tracker_writes_through", [] {
                     tollgate::testing::TempDir dir;
                     auto ledger = std::make_shared<ct::UsageLedger>(dir.path() / "usage.db");
                     auto clock = tollgate::testing::manual_clock();
                     ct::CostTracker tracker("job-7", ct::TrackerOptions{.scope_id = "batch"},
                                             nullptr, clock, nullptr, ledger);
                     (void)tracker.track_usage(ct::UsageRequest{.provider = "anthropic",
                                                                .model = "claude-3-haiku",
                                                                .input_tokens = 1'000'000,
                                                                .run_id = "run-9"});

                     const auto rows = ledger->entries();
                     require(rows.ok() && rows.value().size() == 1, "one row written");
                     const auto &entry = rows.value()[0];
                     require(entry.tracker == "job-7", "tracker name stored");
                     require(entry.record.scope == std::optional<std::string>("batch"),
                             "tracker scope stored");
                     require(std::fabs(entry.record.estimated_cost_usd -
                                       tracker.summary().total_cost_usd) < 1e-9,
                             "cost matches the tracker");
                     require(tracker.usages().size() == 1, "tracker keeps its own copy");
                   }});

  tests.push_back({"ledger_enabled_in_governor", [] {
                     tollgate::testing::TempDir dir;
                     auto config = tollgate::testing::quiet_config();
                     config.ledger.enabled = true;
                     config.ledger.path = (dir.path() / "usage.db").string();
                     auto governor = tollgate::runtime::Governor::from_config(
                         config, tollgate::testing::manual_clock());
                     require(governor->ledger() != nullptr && governor->ledger()->is_open(),
                             "ledger opened");

                     (void)governor->track_usage(ct::UsageRequest{
                         .provider = "openai", .model = "gpt-4o", .input_tokens = 100});
                     (void)governor->track_usage(
                         ct::UsageRequest{
                             .provider = "openai", .model = "gpt-4o", .input_tokens = 100},
                         "nightly");
                     const auto count = governor->ledger()->count();
                     require(count.ok() && count.value() == 2, "every tracker writes through");
                     const auto nightly = governor->ledger()->summary({}, std::string("nightly"));
                     require(nightly.ok() && nightly.value().calls_count == 1, "per tracker rows");
                   }});

  tests.push_back({"ledger_failure_does_not_stop_governor", [] {
                     tollgate::testing::ObserverScope scope;
                     tollgate::testing::TempDir dir;
                     dir.create_file("blocker", "x");
                     auto config = tollgate::testing::quiet_config();
                     config.ledger.enabled = true;
                     config.ledger.path = (dir.path() / "blocker" / "usage.db").string();
                     auto governor = tollgate::runtime::Governor::from_config(
                         config, tollgate::testing::manual_clock());
                     require(governor->ledger() == nullptr, "no ledger");
                     require(!scope.log().of<tollgate::observability::ErrorEvent>().empty(),
                             "open failure is reported");
                     require(governor
                                 ->track_usage(ct::UsageRequest{
                                     .provider = "openai", .model = "gpt-4o", .input_tokens = 1})
                                 .ok(),
                             "tracking continues");
                   }});
}
