#pragma once

#include "tollgate/alerts/alert.hpp"
#include "tollgate/config/schema.hpp"

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace tollgate::alerts {

/// Outbound delivery of one alert. Delivery, retry and de-duplication belong to the sink.
class IAlertSink {
public:
  virtual ~IAlertSink() = default;

  virtual void deliver(const Alert &alert) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// "[ALERT:WARNING] [source] message" lines on a stream (stderr by default).
class LogAlertSink final : public IAlertSink {
public:
  LogAlertSink();
  explicit LogAlertSink(std::ostream &out);

  void deliver(const Alert &alert) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream &out_;
  std::mutex mutex_;
};

class NoopAlertSink final : public IAlertSink {
public:
  void deliver(const Alert &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

class MultiAlertSink final : public IAlertSink {
public:
  void add(std::shared_ptr<IAlertSink> sink);

  void deliver(const Alert &alert) override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::shared_ptr<IAlertSink>> sinks_;
};

[[nodiscard]] std::shared_ptr<IAlertSink> create_alert_sink(const config::Config &config);

} // namespace tollgate::alerts
