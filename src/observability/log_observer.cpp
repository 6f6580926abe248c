#include "matrixnotify/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace matrixnotify::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DeliveryStartEvent>) {
          log_line(out_, "INFO", "delivery.start path=" + evt.path + " room=" + evt.room_id);
        } else if constexpr (std::is_same_v<T, DeliveryEndEvent>) {
          log_line(out_, "INFO",
                   "delivery.end path=" + evt.path +
                       " success=" + (evt.success ? std::string("true") : std::string("false")) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(out_, "DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace matrixnotify::observability
