#pragma once

#include "matrixnotify/config/schema.hpp"
#include "matrixnotify/observability/observer.hpp"

#include <memory>

namespace matrixnotify::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace matrixnotify::observability
