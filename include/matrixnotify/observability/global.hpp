#pragma once

#include "matrixnotify/observability/observer.hpp"

#include <memory>

namespace matrixnotify::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_delivery_start(const std::string &path, const std::string &room_id);
void record_delivery_end(const std::string &path, std::chrono::milliseconds duration,
                         bool success);
void record_error(const std::string &component, const std::string &message);

} // namespace matrixnotify::observability
