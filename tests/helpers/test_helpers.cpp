#include "tests/helpers/test_helpers.hpp"

#include "tollgate/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace tollgate::testing {

config::Config quiet_config() {
  config::Config config;
  config.observability.backend = "none";
  config.alerts.sink = "none";
  config.ledger.enabled = false;
  return config;
}

std::shared_ptr<common::ManualClock> manual_clock() {
  return std::make_shared<common::ManualClock>();
}

void CollectingAlertSink::deliver(const alerts::Alert &alert) {
  std::lock_guard<std::mutex> lock(mutex_);
  alerts_.push_back(alert);
}

std::vector<alerts::Alert> CollectingAlertSink::alerts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return alerts_;
}

std::size_t CollectingAlertSink::count(const alerts::AlertLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &alert : alerts_) {
    total += alert.level == level ? 1 : 0;
  }
  return total;
}

std::size_t CollectingAlertSink::count_from(const std::string &source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &alert : alerts_) {
    total += alert.source == source ? 1 : 0;
  }
  return total;
}

void CollectingAlertSink::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  alerts_.clear();
}

void CountingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(log_->mutex);
  log_->events.push_back(event);
}

void CountingObserver::record_metric(const observability::ObserverMetric &) { ++log_->metrics; }

ObserverScope::ObserverScope() : log_(std::make_shared<ObserverLog>()) {
  observability::set_global_observer(std::make_unique<CountingObserver>(log_));
}

ObserverScope::~ObserverScope() { observability::set_global_observer(nullptr); }

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("tollgate-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

} // namespace tollgate::testing
