#pragma once

#include "postbox/observability/observer.hpp"

#include <memory>

namespace postbox::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_operation_start(const std::string &operation, const std::string &folder);
void record_operation_end(const std::string &operation, std::chrono::milliseconds duration,
                          bool success);
void record_session(const std::string &protocol, const std::string &action,
                    const std::string &detail = "");
void record_message_skipped(const std::string &message_id, const std::string &reason);
void record_messages_fetched(std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace postbox::observability
