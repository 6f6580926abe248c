#include "matrixnotify/observability/global.hpp"

#include <mutex>

namespace matrixnotify::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
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

void record_delivery_start(const std::string &path, const std::string &room_id) {
  record_event(DeliveryStartEvent{.path = path, .room_id = room_id});
}

void record_delivery_end(const std::string &path, std::chrono::milliseconds duration,
                         const bool success) {
  record_event(DeliveryEndEvent{.path = path, .duration = duration, .success = success});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace matrixnotify::observability
