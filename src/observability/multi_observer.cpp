#include "tollgate/observability/multi_observer.hpp"

namespace tollgate::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

template <typename Fn> void MultiObserver::for_each(Fn &&fn) {
  std::exception_ptr first_error;
  for (auto &observer : observers_) {
    try {
      fn(*observer);
    } catch (const std::exception &) {
      if (first_error == nullptr) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error != nullptr) {
    std::rethrow_exception(first_error);
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each([&event](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each([&metric](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each([](IObserver &observer) { observer.flush(); });
}

} // namespace tollgate::observability
