#include "matrixnotify/observability/factory.hpp"

#include "matrixnotify/common/fs.hpp"
#include "matrixnotify/observability/log_observer.hpp"
#include "matrixnotify/observability/noop_observer.hpp"

namespace matrixnotify::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  return std::make_unique<LogObserver>();
}

} // namespace matrixnotify::observability
