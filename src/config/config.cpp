#include "tollgate/config/config.hpp"

#include "tollgate/breaker/failure.hpp"
#include "tollgate/common/strings.hpp"
#include "tollgate/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#if !defined(_WIN32)
extern char **environ;
#endif

namespace tollgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tollgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *RATE_LIMIT_SUFFIX = "_RATE_LIMIT_PER_MIN";
constexpr const char *DAILY_LIMIT_SUFFIX = "_DAILY_LIMIT";
constexpr const char *ENV_PREFIX = "TOLLGATE_";

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("TOLLGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() ||
      !(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TOLLGATE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(expand_path(env_file));
  }
  // Earlier files win: set_env_if_missing never overwrites.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::string> env_value(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return common::trim(value);
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(text);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<double> parse_double(const std::string &text) {
  try {
    std::size_t consumed = 0;
    const double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<double> budget_from(double value) {
  if (value <= 0.0) {
    return std::nullopt;
  }
  return value;
}

BreakerConfig read_breaker(const common::TomlDocument &doc, const std::string &table,
                           BreakerConfig base) {
  const auto u32 = [&](const char *key, std::uint32_t fallback) {
    return static_cast<std::uint32_t>(doc.get_u64(table + "." + key, fallback));
  };
  base.failure_threshold = u32("failure_threshold", base.failure_threshold);
  base.success_threshold = u32("success_threshold", base.success_threshold);
  base.recovery_timeout_ms = doc.get_u64(table + ".recovery_timeout_ms", base.recovery_timeout_ms);
  base.half_open_max_calls = u32("half_open_max_calls", base.half_open_max_calls);
  base.failure_rate_threshold =
      doc.get_double(table + ".failure_rate_threshold", base.failure_rate_threshold);
  base.min_calls_for_rate = u32("min_calls_for_rate", base.min_calls_for_rate);
  base.excluded_failure_kinds =
      doc.get_string_array(table + ".excluded_failure_kinds", base.excluded_failure_kinds);
  return base;
}

RateLimitConfig read_rate_limit(const common::TomlDocument &doc, const std::string &table,
                                RateLimitConfig base) {
  base.requests_per_minute = static_cast<std::uint32_t>(
      doc.get_u64(table + ".requests_per_minute", base.requests_per_minute));
  if (doc.has(table + ".daily_limit")) {
    const std::uint64_t daily = doc.get_u64(table + ".daily_limit", 0);
    base.daily_limit = daily == 0 ? std::nullopt : std::optional<std::uint64_t>(daily);
  }
  base.allow_wait = doc.get_bool(table + ".allow_wait", base.allow_wait);
  base.max_wait_ms = doc.get_u64(table + ".max_wait_ms", base.max_wait_ms);
  return base;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

void write_breaker(std::ostream &out, const std::string &name, const BreakerConfig &breaker) {
  out << "\n[breakers." << name << "]\n";
  out << "failure_threshold = " << breaker.failure_threshold << "\n";
  out << "success_threshold = " << breaker.success_threshold << "\n";
  out << "recovery_timeout_ms = " << breaker.recovery_timeout_ms << "\n";
  out << "half_open_max_calls = " << breaker.half_open_max_calls << "\n";
  out << "failure_rate_threshold = " << breaker.failure_rate_threshold << "\n";
  out << "min_calls_for_rate = " << breaker.min_calls_for_rate << "\n";
  out << "excluded_failure_kinds = " << string_array_to_toml(breaker.excluded_failure_kinds)
      << "\n";
}

void write_rate_limit(std::ostream &out, const std::string &name, const RateLimitConfig &limit) {
  out << "\n[rate_limits." << name << "]\n";
  out << "requests_per_minute = " << limit.requests_per_minute << "\n";
  out << "daily_limit = " << limit.daily_limit.value_or(0) << "\n";
  out << "allow_wait = " << bool_to_toml(limit.allow_wait) << "\n";
  out << "max_wait_ms = " << limit.max_wait_ms << "\n";
}

bool is_valid_backend_list(const std::string &value, const std::vector<std::string> &allowed) {
  const auto parts = common::split_list(common::to_lower(value));
  if (parts.empty()) {
    return false;
  }
  for (const auto &part : parts) {
    bool found = false;
    for (const auto &candidate : allowed) {
      found = found || part == candidate;
    }
    if (!found) {
      return false;
    }
  }
  return true;
}

common::Status validate_breaker(const std::string &name, const BreakerConfig &breaker) {
  const std::string prefix = "breakers." + name + ".";
  if (breaker.failure_threshold == 0) {
    return common::Status::error(prefix + "failure_threshold must be >= 1");
  }
  if (breaker.success_threshold == 0) {
    return common::Status::error(prefix + "success_threshold must be >= 1");
  }
  if (breaker.half_open_max_calls == 0) {
    return common::Status::error(prefix + "half_open_max_calls must be >= 1");
  }
  if (!(breaker.failure_rate_threshold > 0.0 && breaker.failure_rate_threshold <= 1.0)) {
    return common::Status::error(prefix + "failure_rate_threshold must be in (0, 1]");
  }
  for (const auto &kind : breaker.excluded_failure_kinds) {
    if (!breaker::parse_failure_kind(kind).has_value()) {
      return common::Status::error(prefix + "excluded_failure_kinds has unknown kind: " + kind);
    }
  }
  return common::Status::success();
}

void collect_breaker_warnings(const std::string &name, const BreakerConfig &breaker,
                              std::vector<std::string> &warnings) {
  if (breaker.recovery_timeout_ms == 0) {
    warnings.push_back("breakers." + name +
                       ".recovery_timeout_ms is 0; open circuits retry immediately");
  }
  if (breaker.min_calls_for_rate > 0 && breaker.min_calls_for_rate < breaker.failure_threshold) {
    warnings.push_back("breakers." + name +
                       ".min_calls_for_rate is below failure_threshold; the rate rule may open "
                       "the circuit first");
  }
}

} // namespace

common::Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  if (const char *profile = std::getenv("USERPROFILE"); profile != nullptr && *profile != '\0') {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(profile));
  }
  return common::Result<std::filesystem::path>::failure("HOME is not set");
}

std::string expand_path(std::string value) {
  if (value == "~" || common::starts_with(value, "~/")) {
    if (const auto home = home_dir(); home.ok()) {
      value = home.value().string() + value.substr(1);
    }
  }
  const std::string marker = "$HOME";
  if (const auto pos = value.find(marker); pos != std::string::npos) {
    if (const auto home = home_dir(); home.ok()) {
      value.replace(pos, marker.size(), home.value().string());
    }
  }
  return value;
}

common::Result<std::filesystem::path> config_dir() {
  std::filesystem::path dir;
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    dir = std::filesystem::is_directory(*override_path, ec) ? *override_path
                                                             : override_path->parent_path();
    if (dir.empty()) {
      dir = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
  } else {
    const auto home = home_dir();
    if (!home.ok()) {
      return common::Result<std::filesystem::path>::failure(home.error());
    }
    dir = home.value() / CONFIG_FOLDER;
  }
  return common::Result<std::filesystem::path>::success(dir);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto backend = env_value("TOLLGATE_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = *backend;
  }
  if (const auto budget = env_value("TOLLGATE_BUDGET_USD"); budget.has_value()) {
    if (const auto parsed = parse_double(*budget); parsed.has_value()) {
      config.budget.budget_usd = budget_from(*parsed);
    }
  }
  if (const auto enforce = env_value("TOLLGATE_ENFORCE_BUDGET"); enforce.has_value()) {
    const std::string normalized = common::to_lower(*enforce);
    config.budget.enforce = normalized == "true" || normalized == "1" || normalized == "yes";
  }

  // TOLLGATE_<PROVIDER>_RATE_LIMIT_PER_MIN / TOLLGATE_<PROVIDER>_DAILY_LIMIT, for configured
  // providers and for any provider named only in the environment.
  std::vector<std::string> providers;
  for (const auto &[name, _] : config.rate_limits) {
    providers.push_back(name);
  }
#if !defined(_WIN32)
  const std::string prefix(ENV_PREFIX);
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string line(*entry);
    const std::string name = line.substr(0, line.find('='));
    for (const std::string suffix : {RATE_LIMIT_SUFFIX, DAILY_LIMIT_SUFFIX}) {
      if (!common::starts_with(name, prefix) || name.size() <= prefix.size() + suffix.size() ||
          name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        continue;
      }
      const std::string provider = common::to_lower(
          name.substr(prefix.size(), name.size() - prefix.size() - suffix.size()));
      if (config.rate_limits.find(provider) == config.rate_limits.end() &&
          std::find(providers.begin(), providers.end(), provider) == providers.end()) {
        providers.push_back(provider);
      }
    }
  }
#endif

  for (const auto &provider : providers) {
    const std::string key = std::string(ENV_PREFIX) + common::env_key(provider);
    const auto rpm = env_value(key + RATE_LIMIT_SUFFIX);
    const auto daily = env_value(key + DAILY_LIMIT_SUFFIX);
    if (!rpm.has_value() && !daily.has_value()) {
      continue;
    }
    RateLimitConfig limit = config.rate_limit_for(provider);
    if (rpm.has_value()) {
      if (const auto parsed = parse_u64(*rpm); parsed.has_value() && *parsed > 0) {
        limit.requests_per_minute = static_cast<std::uint32_t>(*parsed);
      }
    }
    if (daily.has_value()) {
      if (const auto parsed = parse_u64(*daily); parsed.has_value()) {
        limit.daily_limit = *parsed == 0 ? std::nullopt : std::optional<std::uint64_t>(*parsed);
      }
    }
    config.rate_limits[provider] = limit;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  config.alerts.sink = doc.get_string("alerts.sink", config.alerts.sink);
  config.alerts.budget_warning_percent =
      doc.get_double("alerts.budget_warning_percent", config.alerts.budget_warning_percent);
  config.alerts.budget_critical_percent =
      doc.get_double("alerts.budget_critical_percent", config.alerts.budget_critical_percent);
  config.alerts.rate_limit_warning_percent = doc.get_double(
      "alerts.rate_limit_warning_percent", config.alerts.rate_limit_warning_percent);

  config.breaker_defaults = read_breaker(doc, "breakers.default", config.breaker_defaults);
  for (const auto &name : doc.child_tables("breakers")) {
    if (name == "default") {
      continue;
    }
    const BreakerConfig base = config.breaker_for(name);
    config.breakers[name] = read_breaker(doc, "breakers." + name, base);
  }

  config.rate_limit_defaults =
      read_rate_limit(doc, "rate_limits.default", config.rate_limit_defaults);
  for (const auto &name : doc.child_tables("rate_limits")) {
    if (name == "default") {
      continue;
    }
    const RateLimitConfig base = config.rate_limit_for(name);
    config.rate_limits[name] = read_rate_limit(doc, "rate_limits." + name, base);
  }

  if (doc.has("budget.budget_usd")) {
    config.budget.budget_usd = budget_from(doc.get_double("budget.budget_usd", 0.0));
  }
  config.budget.enforce = doc.get_bool("budget.enforce", config.budget.enforce);

  config.pricing.default_price.input_per_million = doc.get_double(
      "pricing.default_input_per_million", config.pricing.default_price.input_per_million);
  config.pricing.default_price.output_per_million = doc.get_double(
      "pricing.default_output_per_million", config.pricing.default_price.output_per_million);
  for (const auto &entry : doc.table_entries("pricing.models")) {
    const auto rates = doc.get_double_array(entry.key);
    if (!rates.has_value() || rates->size() != 2) {
      return common::Result<Config>::failure("pricing.models entry '" + entry.name +
                                             "' must be [input_per_million, output_per_million]");
    }
    config.pricing.models[entry.name] =
        ModelPrice{.input_per_million = (*rates)[0], .output_per_million = (*rates)[1]};
  }

  config.ledger.enabled = doc.get_bool("ledger.enabled", config.ledger.enabled);
  config.ledger.path = doc.get_string("ledger.path", config.ledger.path);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.error());
  }
  const auto path = path_result.value();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = parsed.value();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_validated_config() {
  auto loaded = load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto validation = validate_config(loaded.value());
  if (!validation.ok()) {
    return common::Result<Config>::failure("invalid configuration: " + validation.error());
  }
  return loaded;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  out << "\n[alerts]\n";
  out << "sink = " << common::quote_toml_string(config.alerts.sink) << "\n";
  out << "budget_warning_percent = " << config.alerts.budget_warning_percent << "\n";
  out << "budget_critical_percent = " << config.alerts.budget_critical_percent << "\n";
  out << "rate_limit_warning_percent = " << config.alerts.rate_limit_warning_percent << "\n";

  write_breaker(out, "default", config.breaker_defaults);
  for (const auto &[name, breaker] : config.breakers) {
    write_breaker(out, name, breaker);
  }

  write_rate_limit(out, "default", config.rate_limit_defaults);
  for (const auto &[name, limit] : config.rate_limits) {
    write_rate_limit(out, name, limit);
  }

  out << "\n[budget]\n";
  out << "budget_usd = " << config.budget.budget_usd.value_or(0.0) << "\n";
  out << "enforce = " << bool_to_toml(config.budget.enforce) << "\n";

  out << "\n[pricing]\n";
  out << "default_input_per_million = " << config.pricing.default_price.input_per_million << "\n";
  out << "default_output_per_million = " << config.pricing.default_price.output_per_million
      << "\n";
  out << "\n[pricing.models]\n";
  for (const auto &[model, price] : config.pricing.models) {
    out << common::quote_toml_string(model) << " = [" << price.input_per_million << ", "
        << price.output_per_million << "]\n";
  }

  out << "\n[ledger]\n";
  out << "enabled = " << bool_to_toml(config.ledger.enabled) << "\n";
  out << "path = " << common::quote_toml_string(config.ledger.path) << "\n";
  return out.str();
}

common::Status save_config_to(const Config &config, const std::filesystem::path &path) {
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }
  file << render_config(config);
  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::error(path.error());
  }
  return save_config_to(config, path.value());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_valid_backend_list(config.observability.backend, {"log", "none", "noop"})) {
    return Warnings::failure("Invalid observability.backend: " + config.observability.backend);
  }
  if (!is_valid_backend_list(config.alerts.sink, {"log", "none", "noop"})) {
    return Warnings::failure("Invalid alerts.sink: " + config.alerts.sink);
  }

  const auto &alerts = config.alerts;
  if (alerts.budget_warning_percent <= 0.0 || alerts.budget_critical_percent > 100.0 ||
      alerts.budget_warning_percent > alerts.budget_critical_percent) {
    return Warnings::failure(
        "alerts budget percentages must satisfy 0 < warning <= critical <= 100");
  }
  if (alerts.rate_limit_warning_percent <= 0.0 || alerts.rate_limit_warning_percent > 100.0) {
    return Warnings::failure("alerts.rate_limit_warning_percent must be in (0, 100]");
  }

  if (const auto status = validate_breaker("default", config.breaker_defaults); !status.ok()) {
    return Warnings::failure(status.error());
  }
  collect_breaker_warnings("default", config.breaker_defaults, warnings);
  for (const auto &[name, breaker] : config.breakers) {
    if (const auto status = validate_breaker(name, breaker); !status.ok()) {
      return Warnings::failure(status.error());
    }
    collect_breaker_warnings(name, breaker, warnings);
  }

  const auto check_limit = [&](const std::string &name,
                               const RateLimitConfig &limit) -> common::Status {
    if (limit.requests_per_minute == 0) {
      return common::Status::error("rate_limits." + name + ".requests_per_minute must be >= 1");
    }
    if (limit.daily_limit.has_value() && *limit.daily_limit < limit.requests_per_minute) {
      warnings.push_back("rate_limits." + name + ".daily_limit is below requests_per_minute");
    }
    if (!limit.allow_wait && limit.max_wait_ms > 0) {
      warnings.push_back("rate_limits." + name + ".max_wait_ms is ignored when allow_wait = false");
    }
    return common::Status::success();
  };
  if (const auto status = check_limit("default", config.rate_limit_defaults); !status.ok()) {
    return Warnings::failure(status.error());
  }
  for (const auto &[name, limit] : config.rate_limits) {
    if (const auto status = check_limit(name, limit); !status.ok()) {
      return Warnings::failure(status.error());
    }
  }

  if (config.budget.budget_usd.has_value() && !std::isfinite(*config.budget.budget_usd)) {
    return Warnings::failure("budget.budget_usd must be a finite amount");
  }
  if (config.budget.enforce && !config.budget.budget_usd.has_value()) {
    warnings.push_back("budget.enforce is set but no budget_usd is configured");
  }

  const auto check_price = [](const std::string &name, const ModelPrice &price) {
    return price.input_per_million >= 0.0 && price.output_per_million >= 0.0
               ? common::Status::success()
               : common::Status::error("Negative price for model: " + name);
  };
  if (const auto status = check_price("default", config.pricing.default_price); !status.ok()) {
    return Warnings::failure(status.error());
  }
  for (const auto &[model, price] : config.pricing.models) {
    if (const auto status = check_price(model, price); !status.ok()) {
      return Warnings::failure(status.error());
    }
    if (price.input_per_million == 0.0 && price.output_per_million == 0.0) {
      warnings.push_back("pricing.models." + model + " is free; usage will not count toward budget");
    }
  }

  if (config.ledger.enabled && common::trim(config.ledger.path).empty()) {
    return Warnings::failure("ledger.path must be set when the ledger is enabled");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace tollgate::config
