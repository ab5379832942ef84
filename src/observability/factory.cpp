#include "tollgate/observability/factory.hpp"

#include "tollgate/common/strings.hpp"
#include "tollgate/observability/log_observer.hpp"
#include "tollgate/observability/multi_observer.hpp"

#include <algorithm>

namespace tollgate::observability {

namespace {

// Unknown names fall back to logging; validate_config rejects them before this point.
std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  std::vector<std::string> backends;
  for (auto &part : common::split_list(common::to_lower(config.observability.backend))) {
    if (std::find(backends.begin(), backends.end(), part) == backends.end()) {
      backends.push_back(std::move(part));
    }
  }

  if (backends.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backends.size() == 1) {
    return make_backend(backends.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &backend : backends) {
    multi->add(make_backend(backend));
  }
  return multi;
}

} // namespace tollgate::observability
