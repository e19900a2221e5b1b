#include "postbox/observability/log_observer.hpp"

#include "postbox/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace postbox::observability {

namespace {

const char *level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

LogLevel parse_log_level(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level) : out_(std::cerr), min_level_(min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  out_ << "[" << level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, OperationStartEvent>) {
          log_line(LogLevel::Debug, "operation.start name=" + evt.operation +
                                        (evt.folder.empty() ? "" : " folder=" + evt.folder));
        } else if constexpr (std::is_same_v<T, OperationEndEvent>) {
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn,
                   "operation.end name=" + evt.operation +
                       " success=" + (evt.success ? std::string("true") : std::string("false")) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          log_line(LogLevel::Debug, "session." + evt.action + " protocol=" + evt.protocol +
                                        (evt.detail.empty() ? "" : " " + evt.detail));
        } else if constexpr (std::is_same_v<T, MessageSkippedEvent>) {
          log_line(LogLevel::Warn,
                   "fetch.skip id=" + evt.message_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, MessagesFetchedMetric>) {
          log_line(LogLevel::Debug, "metric.messages_fetched=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, OperationLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.operation_latency_ms{" + m.operation +
                                        "}=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace postbox::observability
