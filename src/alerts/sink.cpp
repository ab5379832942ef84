#include "tollgate/alerts/sink.hpp"

#include "tollgate/common/strings.hpp"

#include <iostream>

namespace tollgate::alerts {

LogAlertSink::LogAlertSink() : out_(std::cerr) {}

LogAlertSink::LogAlertSink(std::ostream &out) : out_(out) {}

void LogAlertSink::deliver(const Alert &alert) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[ALERT:" << common::to_upper(level_to_string(alert.level)) << "] [" << alert.source
       << "] " << alert.message;
  for (const auto &[key, value] : alert.metadata) {
    out_ << " " << key << "=" << value;
  }
  out_ << "\n";
}

void MultiAlertSink::add(std::shared_ptr<IAlertSink> sink) {
  if (sink != nullptr) {
    sinks_.push_back(std::move(sink));
  }
}

void MultiAlertSink::deliver(const Alert &alert) {
  for (auto &sink : sinks_) {
    sink->deliver(alert);
  }
}

std::shared_ptr<IAlertSink> create_alert_sink(const config::Config &config) {
  const auto parts = common::split_list(common::to_lower(config.alerts.sink));
  if (parts.empty()) {
    return std::make_shared<NoopAlertSink>();
  }
  if (parts.size() == 1) {
    if (parts.front() == "none" || parts.front() == "noop") {
      return std::make_shared<NoopAlertSink>();
    }
    return std::make_shared<LogAlertSink>();
  }

  auto multi = std::make_shared<MultiAlertSink>();
  for (const auto &part : parts) {
    if (part == "log") {
      multi->add(std::make_shared<LogAlertSink>());
    }
  }
  return multi;
}

} // namespace tollgate::alerts
