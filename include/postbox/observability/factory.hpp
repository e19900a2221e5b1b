#pragma once

#include "postbox/config/schema.hpp"
#include "postbox/observability/observer.hpp"

#include <memory>

namespace postbox::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace postbox::observability
