#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace postbox::observability {

struct OperationStartEvent {
  std::string operation;
  std::string folder;
};

struct OperationEndEvent {
  std::string operation;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct SessionEvent {
  std::string protocol;
  std::string action;
  std::string detail;
};

struct MessageSkippedEvent {
  std::string message_id;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<OperationStartEvent, OperationEndEvent, SessionEvent,
                                   MessageSkippedEvent, ErrorEvent>;

struct MessagesFetchedMetric {
  std::uint64_t count = 0;
};

struct OperationLatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<MessagesFetchedMetric, OperationLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace postbox::observability
