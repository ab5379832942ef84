#pragma once

#include "tollgate/config/schema.hpp"
#include "tollgate/observability/observer.hpp"

#include <memory>

namespace tollgate::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace tollgate::observability
