#include "tollgate/cli/commands.hpp"

#include "tollgate/common/strings.hpp"
#include "tollgate/config/config.hpp"
#include "tollgate/cost/ledger.hpp"
#include "tollgate/cost/pricing.hpp"
#include "tollgate/doctor/diagnostics.hpp"
#include "tollgate/metrics/aggregator.hpp"
#include "tollgate/runtime/governor.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::uint64_t> parse_count(const std::string &text) {
  std::uint64_t value = 0;
  const auto *begin = text.data();
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "init") {
    const bool force = take_flag(args, "--force");
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    if (config::config_exists() && !force) {
      std::cerr << "config already exists at " << path.value().string()
                << " (use --force to overwrite)\n";
      return 1;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    std::cout << "Wrote " << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (action == "validate") {
    auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      std::cerr << "invalid: " << validation.error() << "\n";
      return 1;
    }
    for (const auto &warning : validation.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "valid\n";
    return 0;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

int run_doctor(std::vector<std::string> args) {
  const bool as_json = take_flag(args, "--json");
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[FAIL] Config load: " << cfg.error() << "\n";
    return 1;
  }

  const auto report = doctor::run_diagnostics(cfg.value());
  if (as_json) {
    std::cout << report.to_json() << "\n";
  } else {
    doctor::print_diagnostics_report(report);
  }
  return report.healthy() ? 0 : 1;
}

int run_snapshot() {
  auto governor = runtime::Governor::from_disk();
  if (!governor.ok()) {
    std::cerr << governor.error() << "\n";
    return 1;
  }
  auto &gov = *governor.value();
  for (const auto &[service, _] : gov.config().breakers) {
    (void)gov.breakers().get_or_create(service);
  }
  for (const auto &[provider, _] : gov.config().rate_limits) {
    (void)gov.rate_limiters().get_or_create(provider);
  }
  (void)gov.global_tracker();
  std::cout << gov.snapshot().to_json() << "\n";
  return 0;
}

int run_pricing() {
  auto cfg = config::load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const cost::PriceTable prices(cfg.value().pricing);
  std::cout << "USD per 1M tokens (input / output)\n";
  for (const auto &[model, price] : prices.models()) {
    std::cout << "  " << model << ": " << common::format_fixed(price.input_per_million, 2)
              << " / " << common::format_fixed(price.output_per_million, 2) << "\n";
  }
  std::cout << "  (default): " << common::format_fixed(prices.default_price().input_per_million, 2)
            << " / " << common::format_fixed(prices.default_price().output_per_million, 2)
            << "\n";
  return 0;
}

int run_estimate(const std::vector<std::string> &args) {
  if (args.size() != 3) {
    std::cerr << "usage: tollgate estimate <model> <input_tokens> <output_tokens>\n";
    return 1;
  }
  const auto input = parse_count(args[1]);
  const auto output = parse_count(args[2]);
  if (!input.has_value() || !output.has_value()) {
    std::cerr << "token counts must be non-negative integers\n";
    return 1;
  }
  auto cfg = config::load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const cost::PriceTable prices(cfg.value().pricing);
  const auto price = prices.price_for(args[0]);
  std::cout << args[0] << (prices.has_model(args[0]) ? "" : " (default pricing)") << ": $"
            << common::format_fixed(prices.estimate(args[0], *input, *output), 6) << " ("
            << common::format_fixed(price.input_per_million, 2) << " / "
            << common::format_fixed(price.output_per_million, 2) << " per 1M tokens)\n";
  return 0;
}

int run_usage(std::vector<std::string> args) {
  std::string db;
  std::string run_id;
  std::string scope;
  std::string period_raw = "daily";
  std::string count_raw = "7";
  const bool has_db = take_option(args, "--db", "", db);
  const bool has_run = take_option(args, "--run", "", run_id);
  const bool has_scope = take_option(args, "--scope", "", scope);
  (void)take_option(args, "--period", "", period_raw);
  (void)take_option(args, "--count", "-n", count_raw);
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  const auto period = cost::parse_period(period_raw);
  if (!period.has_value()) {
    std::cerr << "--period must be hourly or daily\n";
    return 1;
  }
  const auto count = parse_count(count_raw);
  if (!count.has_value() || *count == 0) {
    std::cerr << "--count must be a positive integer\n";
    return 1;
  }
  if (*count > cost::max_buckets(*period)) {
    std::cerr << "--count must be at most " << cost::max_buckets(*period) << " for "
              << period_raw << " history\n";
    return 1;
  }

  if (!has_db) {
    auto cfg = config::load_validated_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    db = config::expand_path(cfg.value().ledger.path);
  }
  if (!std::filesystem::exists(db)) {
    std::cerr << "usage ledger not found: " << db << "\n";
    return 1;
  }

  cost::UsageLedger ledger(db);
  if (!ledger.is_open()) {
    std::cerr << "cannot open usage ledger " << db << ": " << ledger.open_error() << "\n";
    return 1;
  }

  cost::UsageFilter filter;
  if (has_run) {
    filter.run_id = run_id;
  }
  if (has_scope) {
    filter.scope = scope;
  }
  auto summary = ledger.summary(filter);
  if (!summary.ok()) {
    std::cerr << summary.error() << "\n";
    return 1;
  }
  auto buckets = ledger.costs(*period, static_cast<std::size_t>(*count),
                              common::default_clock()->now(), filter);
  if (!buckets.ok()) {
    std::cerr << buckets.error() << "\n";
    return 1;
  }

  const auto history = metrics::make_cost_history(*period, std::move(buckets.value()));

  std::cout << "{\"summary\":" << summary.value().to_json()
            << ",\"history\":" << history.to_json() << "}\n";
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  tollgate" << RESET << DIM
            << "  circuit breakers, rate limits and budgets for metered APIs" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "tollgate [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "      Print the effective configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config init" << RESET << DIM << "      Write a default config file (--force)" << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM << "  Check the configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "      Print the config file location" << RESET << "\n\n";

  std::cout << BOLD << "  COSTS" << RESET << "\n";
  std::cout << "  " << GREEN << "pricing" << RESET << DIM << "          List model prices" << RESET << "\n";
  std::cout << "  " << GREEN << "estimate" << RESET << " M I O" << DIM << "   Cost of I input and O output tokens on model M" << RESET << "\n";
  std::cout << "  " << GREEN << "usage" << RESET << DIM
            << "            Ledger summary [--db PATH] [--run ID] [--scope S] [--period hourly|daily] [--count N]"
            << RESET << "\n\n";

  std::cout << BOLD << "  DIAGNOSTICS" << RESET << "\n";
  std::cout << "  " << GREEN << "doctor" << RESET << DIM << "           Run health diagnostics (--json)" << RESET << "\n";
  std::cout << "  " << GREEN << "snapshot" << RESET << DIM << "         Health snapshot JSON of the configured services" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "          Show version" << RESET << "\n\n";
}

} // namespace

std::string version_string() {
#ifdef TOLLGATE_VERSION
  std::string version = TOLLGATE_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef TOLLGATE_GIT_COMMIT
  const std::string commit = TOLLGATE_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "tollgate " + version;
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "doctor") {
    return run_doctor(std::move(args));
  }
  if (subcommand == "snapshot") {
    return run_snapshot();
  }
  if (subcommand == "pricing") {
    return run_pricing();
  }
  if (subcommand == "estimate") {
    return run_estimate(args);
  }
  if (subcommand == "usage") {
    return run_usage(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tollgate::cli
