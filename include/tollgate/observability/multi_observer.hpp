#pragma once

#include "tollgate/observability/observer.hpp"

#include <exception>
#include <memory>
#include <vector>

namespace tollgate::observability {

/// Fans out to every child. A child that throws does not stop delivery to the rest; the first
/// exception is rethrown once all children have been called.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void for_each(Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace tollgate::observability
