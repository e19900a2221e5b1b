#include "postbox/observability/global.hpp"

#include <mutex>

namespace postbox::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_operation_start(const std::string &operation, const std::string &folder) {
  record_event(OperationStartEvent{.operation = operation, .folder = folder});
}

void record_operation_end(const std::string &operation, const std::chrono::milliseconds duration,
                          const bool success) {
  record_event(OperationEndEvent{.operation = operation, .duration = duration, .success = success});
  record_metric(OperationLatencyMetric{.operation = operation, .latency = duration});
}

void record_session(const std::string &protocol, const std::string &action,
                    const std::string &detail) {
  record_event(SessionEvent{.protocol = protocol, .action = action, .detail = detail});
}

void record_message_skipped(const std::string &message_id, const std::string &reason) {
  record_event(MessageSkippedEvent{.message_id = message_id, .reason = reason});
}

void record_messages_fetched(const std::uint64_t count) {
  record_metric(MessagesFetchedMetric{.count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace postbox::observability
