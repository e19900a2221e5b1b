#include "postbox/observability/factory.hpp"

#include "postbox/common/fs.hpp"
#include "postbox/observability/log_observer.hpp"
#include "postbox/observability/noop_observer.hpp"

namespace postbox::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  return std::make_unique<LogObserver>(parse_log_level(config.observability.level));
}

} // namespace postbox::observability
