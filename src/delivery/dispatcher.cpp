#include "matrixnotify/delivery/dispatcher.hpp"

#include "matrixnotify/delivery/validation.hpp"
#include "matrixnotify/observability/global.hpp"

#include <chrono>

namespace matrixnotify::delivery {

Dispatcher::Dispatcher(std::shared_ptr<http::HttpClient> http_client,
                       std::shared_ptr<process::IProcessRunner> process_runner,
                       DispatcherOptions options)
    : http_client_(std::move(http_client)), process_runner_(std::move(process_runner)),
      options_(std::move(options)) {}

DeliveryStrategy Dispatcher::select_strategy(const DeliveryRequest &request) const {
  if (request.use_e2e) {
    return EncryptedStrategy(process_runner_, options_.e2e_client);
  }
  return PlaintextStrategy(http_client_, options_.http_timeout_ms);
}

DeliveryResult Dispatcher::dispatch(const DeliveryRequest &request) const {
  if (auto error = validate_request(request); error.has_value()) {
    observability::record_error("delivery", error->to_string());
    return DeliveryResult::failure(std::move(*error));
  }

  const std::string path(path_name(request.path()));
  observability::record_delivery_start(path, request.room_id);
  const auto started = std::chrono::steady_clock::now();

  auto result = attempt(select_strategy(request), request);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric(observability::RequestLatencyMetric{.latency = elapsed});
  observability::record_delivery_end(path, elapsed, result.ok());
  if (!result.ok()) {
    observability::record_error("delivery", result.error().to_string());
  }
  return result;
}

std::string format_success(const DeliveryRequest &request) {
  return "Message '" + request.message + "' sent successfully to room '" + request.room_id +
         "' (" + std::string(e2e_label(request.path())) + " E2E).";
}

std::string format_failure(const DeliveryRequest &request, const DeliveryError &error) {
  return "An error occurred while sending the message '" + request.message + "' to room '" +
         request.room_id + "' (" + std::string(e2e_label(request.path())) + " E2E):\n" +
         error.detail;
}

} // namespace matrixnotify::delivery
