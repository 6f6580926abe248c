#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace matrixnotify::observability {

struct DeliveryStartEvent {
  std::string path;
  std::string room_id;
};

struct DeliveryEndEvent {
  std::string path;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<DeliveryStartEvent, DeliveryEndEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<RequestLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace matrixnotify::observability
