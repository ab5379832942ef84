#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tollgate/cost/cost_tracker.hpp"
#include "tollgate/cost/pricing.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace {

namespace ct = tollgate::cost;
using tollgate::tests::require;

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

ct::UsageRequest request(const std::string &model, std::uint64_t input, std::uint64_t output) {
  return ct::UsageRequest{.provider = "openai",
                          .model = model,
                          .input_tokens = input,
                          .output_tokens = output};
}

class FailingUsageSink final : public ct::IUsageSink {
public:
  tollgate::common::Status append(const std::string &, const ct::UsageRecord &) override {
    ++attempts;
    return tollgate::common::Status::error("disk full");
  }

  int attempts = 0;
};

} // namespace

void register_cost_tracker_tests(std::vector<tollgate::tests::TestCase> &tests) {
  using tollgate::testing::CollectingAlertSink;
  using tollgate::testing::manual_clock;

  tests.push_back({"pricing_strips_vendor_prefix_then_falls_back", [] {
                     const ct::PriceTable prices;
                     const auto sonnet = prices.price_for("anthropic/claude-3-5-sonnet-20241022");
                     require(near(sonnet.input_per_million, 3.0) &&
                                 near(sonnet.output_per_million, 15.0),
                             "vendor-prefixed sonnet should resolve");
                     const auto haiku = prices.price_for("anthropic/claude-3-5-haiku-20241022");
                     require(near(haiku.input_per_million, 0.8),
                             "bare model price wins over the prefixed entry");
                     const auto mini = prices.price_for("openai/gpt-4o-mini");
                     require(near(mini.input_per_million, 0.15), "prefix stripped for gpt-4o-mini");

                     const auto unknown = prices.price_for("mystery-model");
                     require(near(unknown.input_per_million, 2.0) &&
                                 near(unknown.output_per_million, 8.0),
                             "unknown models use the default tier");
                     require(!prices.has_model("mystery-model"), "unknown model is not listed");
                     require(prices.has_model("openai/gpt-4o"), "prefixed known model is listed");
                   }});

  tests.push_back({"pricing_config_overrides_builtins", [] {
                     tollgate::config::PricingConfig pricing;
                     pricing.default_price = {.input_per_million = 1.0,
                                              .output_per_million = 1.0};
                     pricing.models["gpt-4o"] = {.input_per_million = 5.0,
                                                 .output_per_million = 20.0};
                     pricing.models["local-llm"] = {.input_per_million = 0.0,
                                                    .output_per_million = 0.0};
                     const ct::PriceTable prices(pricing);
                     require(near(prices.price_for("gpt-4o").input_per_million, 5.0),
                             "configured price overrides builtin");
                     require(near(prices.estimate("local-llm", 1'000'000, 1'000'000), 0.0),
                             "free model costs nothing");
                     require(near(prices.estimate("other", 500'000, 0), 0.5),
                             "configured default tier applies");
                     require(near(prices.price_for("gpt-4o-mini").input_per_million, 0.15),
                             "untouched builtins stay");
                   }});

  tests.push_back({"cost_estimate_uses_per_million_rates", [] {
                     ct::CostTracker tracker("global", {}, nullptr, manual_clock());
                     require(near(tracker.estimate_cost("gpt-4o", 1'000'000, 1'000'000), 12.5),
                             "gpt-4o million in and out");
                     require(near(tracker.estimate_cost("gpt-4o-mini", 2'000, 1'000),
                                  2'000 / 1e6 * 0.15 + 1'000 / 1e6 * 0.60),
                             "small gpt-4o-mini call");
                     require(tracker.usages().empty(), "estimating records nothing");
                   }});

  tests.push_back({"cost_summary_is_sum_of_usages", [] {
                     ct::CostTracker tracker("global", {}, nullptr, manual_clock());
                     double previous = 0.0;
                     double expected = 0.0;
                     const std::vector<std::tuple<std::string, std::uint64_t, std::uint64_t>> calls = {
                         {"gpt-4o", 1'200, 300},
                         {"claude-3-5-sonnet-20241022", 5'000, 800},
                         {"mystery-model", 10, 0},
                         {"gpt-4o-mini", 0, 0},
                         {"gpt-3.5-turbo", 77'777, 33'333}};
                     for (const auto &[model, in, out] : calls) {
                       expected += tracker.estimate_cost(model, in, out);
                       auto result = tracker.track_usage(request(model, in, out));
                       require(result.ok(), "no budget enforcement here");
                       const double total = tracker.summary().total_cost_usd;
                       require(total >= previous, "total cost must never decrease");
                       previous = total;
                     }

                     double from_records = 0.0;
                     for (const auto &record : tracker.usages()) {
                       from_records += record.estimated_cost_usd;
                     }
                     const auto summary = tracker.summary();
                     require(near(summary.total_cost_usd, expected), "summary equals estimates");
                     require(near(summary.total_cost_usd, from_records), "summary equals records");
                     require(summary.calls_count == 5, "five calls");
                     require(summary.total_input_tokens == 1'200 + 5'000 + 10 + 77'777,
                             "input tokens summed");
                   }});

  tests.push_back({"cost_summary_breaks_down_by_provider_and_layer", [] {
                     ct::CostTracker tracker("global", {}, nullptr, manual_clock());
                     auto first = request("gpt-4o", 100, 10);
                     first.layer = "planner";
                     auto second = request("claude-3-5-sonnet-20241022", 200, 20);
                     second.provider = "anthropic";
                     second.layer = "planner";
                     auto third = request("gpt-4o", 300, 30);
                     (void)tracker.track_usage(first);
                     (void)tracker.track_usage(second);
                     (void)tracker.track_usage(third);

                     const auto summary = tracker.summary();
                     require(summary.by_provider.at("openai").calls == 2, "two openai calls");
                     require(summary.by_provider.at("anthropic").input_tokens == 200,
                             "anthropic tokens");
                     require(summary.by_layer.at("planner").calls == 2, "two planner calls");
                     require(summary.by_layer.at("unknown").calls == 1,
                             "untagged records grouped as unknown");
                   }});

  tests.push_back({"cost_summary_filters_by_run_and_scope", [] {
                     ct::CostTracker tracker("jobs", {.scope_id = "job-7"}, nullptr,
                                             manual_clock());
                     auto a = request("gpt-4o", 1'000, 0);
                     a.run_id = "run-1";
                     auto b = request("gpt-4o", 2'000, 0);
                     b.run_id = "run-2";
                     auto c = request("gpt-4o", 4'000, 0);
                     c.run_id = "run-1";
                     c.scope = "job-9";
                     (void)tracker.track_usage(a);
                     (void)tracker.track_usage(b);
                     (void)tracker.track_usage(c);

                     require(tracker.usages()[0].scope == std::optional<std::string>("job-7"),
                             "tracker scope fills untagged records");
                     require(tracker.summary({.run_id = "run-1"}).total_input_tokens == 5'000,
                             "run filter");
                     require(tracker.summary({.scope = "job-7"}).calls_count == 2,
                             "scope filter");
                     require(tracker.summary({.run_id = "run-1", .scope = "job-7"})
                                     .total_input_tokens == 1'000,
                             "both filters must match");
                     require(tracker.summary({.run_id = "none"}).calls_count == 0,
                             "no matches gives an empty summary");
                   }});

  tests.push_back({"cost_budget_scenario_exceeds_with_record_kept", [] {
                     tollgate::testing::ObserverScope scope;
                     ct::CostTracker tracker("global",
                                             {.budget_usd = 1.0, .enforce_budget = true}, nullptr,
                                             manual_clock());
                     auto result = tracker.track_usage(request("mystery-model", 600'000, 0));
                     require(!result.ok(), "going over an enforced budget should fail");
                     const auto &error = result.error();
                     require(near(error.summary.total_cost_usd, 1.2), "summary cost is 1.20");
                     require(near(error.budget_usd, 1.0), "budget carried");
                     require(error.message() ==
                                 "Token budget exceeded: $1.2000 / $1.00 (600000 tokens across 1 "
                                 "calls)",
                             "unexpected message: " + error.message());
                     require(tracker.usages().size() == 1, "record kept despite the failure");
                     require(tracker.is_budget_exceeded(), "tracker reports exceeded");
                     require(tracker.remaining_budget() == std::optional<double>(0.0),
                             "remaining clamps at zero");
                     require(scope.log().of<tollgate::observability::BudgetExceededEvent>().size() ==
                                 1,
                             "exceeding should be observed");
                   }});

  tests.push_back({"cost_budget_reached_exactly_is_not_exceeded", [] {
                     ct::CostTracker tracker("global",
                                             {.budget_usd = 1.0, .enforce_budget = true}, nullptr,
                                             manual_clock());
                     auto result = tracker.track_usage(request("mystery-model", 500'000, 0));
                     require(result.ok(), "exactly at the budget is allowed");
                     require(!tracker.is_budget_exceeded(), "not strictly above");
                     require(tracker.budget_status().level == ct::BudgetLevel::Critical,
                             "100% is critical");
                   }});

  tests.push_back({"cost_budget_not_enforced_only_reports", [] {
                     ct::CostTracker tracker("global", {.budget_usd = 1.0}, nullptr,
                                             manual_clock());
                     auto result = tracker.track_usage(request("mystery-model", 600'000, 0));
                     require(result.ok(), "unenforced budget never fails the call");
                     require(tracker.is_budget_exceeded(), "but it is still exceeded");
                     const auto status = tracker.budget_status();
                     require(status.is_exceeded && status.level == ct::BudgetLevel::Exceeded,
                             "status shows exceeded");
                     require(status.to_json().find("\"status\":\"exceeded\"") != std::string::npos,
                             "json status");
                   }});

  tests.push_back({"cost_without_budget_is_unlimited", [] {
                     ct::CostTracker tracker("global", {}, nullptr, manual_clock());
                     (void)tracker.track_usage(request("gpt-4-turbo", 10'000'000, 10'000'000));
                     require(!tracker.remaining_budget().has_value(), "no ceiling");
                     require(!tracker.is_budget_exceeded(), "never exceeded");
                     const auto status = tracker.budget_status();
                     require(status.level == ct::BudgetLevel::Ok, "unlimited is ok");
                     require(!status.used_percent.has_value(), "no percent without a ceiling");
                   }});

  tests.push_back({"cost_budget_levels", [] {
                     const auto ok = ct::make_budget_status("t", 10.0, 7.9, 80.0, 90.0);
                     const auto warning = ct::make_budget_status("t", 10.0, 8.0, 80.0, 90.0);
                     const auto critical = ct::make_budget_status("t", 10.0, 9.5, 80.0, 90.0);
                     const auto exceeded = ct::make_budget_status("t", 10.0, 10.01, 80.0, 90.0);
                     require(ok.level == ct::BudgetLevel::Ok, "below warning");
                     require(warning.level == ct::BudgetLevel::Warning, "at warning");
                     require(critical.level == ct::BudgetLevel::Critical, "above critical");
                     require(exceeded.level == ct::BudgetLevel::Exceeded, "over budget");
                     require(near(*critical.remaining_usd, 0.5), "remaining");
                     require(near(*warning.used_percent, 80.0), "percent");
                   }});

  tests.push_back({"cost_threshold_alerts_fire_once_per_level", [] {
                     auto sink = std::make_shared<CollectingAlertSink>();
                     ct::CostTracker tracker("global", {.budget_usd = 1.0}, nullptr,
                                             manual_clock(), sink);
                     (void)tracker.track_usage(request("mystery-model", 390'000, 0));
                     require(sink->alerts().empty(), "78% is below warning");
                     (void)tracker.track_usage(request("mystery-model", 20'000, 0));
                     require(sink->count(tollgate::alerts::AlertLevel::Warning) == 1,
                             "warning at 82%");
                     (void)tracker.track_usage(request("mystery-model", 1'000, 0));
                     require(sink->alerts().size() == 1, "same level does not repeat");
                     (void)tracker.track_usage(request("mystery-model", 40'000, 0));
                     require(sink->count(tollgate::alerts::AlertLevel::Critical) == 1,
                             "critical at 90.2%");
                     (void)tracker.track_usage(request("mystery-model", 100'000, 0));
                     require(sink->count(tollgate::alerts::AlertLevel::Critical) == 2,
                             "exceeded is a critical alert");
                     require(sink->count_from("cost_tracker") == 3, "three alerts in total");
                     require(sink->alerts().back().metadata.at("tracker") == "global",
                             "alert names the tracker");

                     tracker.reset();
                     sink->clear();
                     (void)tracker.track_usage(request("mystery-model", 420'000, 0));
                     require(sink->count(tollgate::alerts::AlertLevel::Warning) == 1,
                             "reset re-arms the alerts");
                   }});

  tests.push_back({"cost_hourly_and_daily_series_are_dense", [] {
                     auto clock = manual_clock();
                     clock->advance(std::chrono::hours(10) + std::chrono::minutes(30));
                     ct::CostTracker tracker("global", {}, nullptr, clock);

                     (void)tracker.track_usage(request("mystery-model", 500'000, 0));
                     clock->advance(std::chrono::hours(2));
                     (void)tracker.track_usage(request("mystery-model", 250'000, 0));
                     (void)tracker.track_usage(request("mystery-model", 250'000, 0));

                     const auto hourly = tracker.hourly_costs(4);
                     require(hourly.size() == 4, "one bucket per hour");
                     require(near(hourly[0].cost_usd, 0.0), "09:00 bucket empty");
                     require(near(hourly[1].cost_usd, 1.0) && hourly[1].calls == 1,
                             "10:00 bucket has the first call");
                     require(near(hourly[2].cost_usd, 0.0) && hourly[2].calls == 0,
                             "11:00 bucket zero-filled");
                     require(near(hourly[3].cost_usd, 1.0) && hourly[3].calls == 2,
                             "12:00 bucket has two calls");
                     require(hourly[3].start == tollgate::common::floor_to_hour(clock->now()),
                             "last bucket is the current hour");

                     const auto daily = tracker.daily_costs(7);
                     require(daily.size() == 7, "seven days");
                     require(near(daily[6].cost_usd, 2.0) && daily[6].calls == 3,
                             "today holds everything");
                     for (std::size_t i = 0; i < 6; ++i) {
                       require(near(daily[i].cost_usd, 0.0), "earlier days are zero");
                     }

                     require(tracker.hourly_costs(1'000'000'000).size() ==
                                 tollgate::cost::MAX_HOURLY_BUCKETS,
                             "hourly series is clamped");
                     require(tracker.daily_costs(SIZE_MAX).size() ==
                                 tollgate::cost::MAX_DAILY_BUCKETS,
                             "daily series is clamped");
                   }});

  tests.push_back({"cost_reset_clears_records", [] {
                     ct::CostTracker tracker("global", {.budget_usd = 1.0}, nullptr,
                                             manual_clock());
                     (void)tracker.track_usage(request("gpt-4o", 1'000, 1'000));
                     tracker.reset();
                     require(tracker.usages().empty(), "records cleared");
                     require(near(tracker.summary().total_cost_usd, 0.0), "summary cleared");
                     require(tracker.remaining_budget() == std::optional<double>(1.0),
                             "full budget again");
                   }});

  tests.push_back({"cost_usage_sink_failure_is_reported_not_propagated", [] {
                     tollgate::testing::ObserverScope scope;
                     auto sink = std::make_shared<FailingUsageSink>();
                     ct::CostTracker tracker("global", {}, nullptr, manual_clock(), nullptr, sink);
                     auto result = tracker.track_usage(request("gpt-4o", 10, 10));
                     require(result.ok(), "ledger failure must not fail tracking");
                     require(sink->attempts == 1, "record written through");
                     const auto errors = scope.log().of<tollgate::observability::ErrorEvent>();
                     require(errors.size() == 1 && errors[0].component == "cost_tracker",
                             "ledger failure should be reported");
                     require(errors[0].message.find("disk full") != std::string::npos,
                             "report carries the cause");
                   }});

  tests.push_back({"cost_tracker_json_fields", [] {
                     ct::CostTracker tracker("global", {.budget_usd = 5.0}, nullptr,
                                             manual_clock());
                     (void)tracker.track_usage(request("gpt-4o", 1'000, 0));
                     const auto json = tracker.to_json();
                     for (const std::string field :
                          {"\"name\":\"global\"", "\"budget_usd\":5.00", "\"summary\":{",
                           "\"by_provider\":{\"openai\"", "\"hourly_costs\":[",
                           "\"daily_costs\":[", "\"status\":\"ok\""}) {
                       require(json.find(field) != std::string::npos,
                               "missing " + field + " in " + json);
                     }
                   }});
}
