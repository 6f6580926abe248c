#include "matrixnotify/delivery/strategy.hpp"

#include "matrixnotify/common/fs.hpp"
#include "matrixnotify/common/json_util.hpp"
#include "matrixnotify/delivery/payload.hpp"
#include "matrixnotify/delivery/validation.hpp"

namespace matrixnotify::delivery {

namespace {

constexpr std::uint16_t HTTP_OK = 200;

DeliveryResult transport_failure(const http::HttpResponse &response) {
  if (response.timeout) {
    return DeliveryResult::failure(
        DeliveryError::transport(0, "Request timed out: " + response.network_error_message));
  }
  if (response.network_error) {
    return DeliveryResult::failure(
        DeliveryError::transport(0, "Request failed: " + response.network_error_message));
  }
  return DeliveryResult::failure(DeliveryError::transport(
      response.status,
      "Status code: " + std::to_string(response.status) + ".\nResponse: " + response.body));
}

} // namespace

PlaintextStrategy::PlaintextStrategy(std::shared_ptr<http::HttpClient> http_client,
                                     const std::uint64_t timeout_ms)
    : http_client_(std::move(http_client)), timeout_ms_(timeout_ms) {}

DeliveryResult PlaintextStrategy::attempt(const DeliveryRequest &request) const {
  if (auto error = validate_credentials(request); error.has_value()) {
    return DeliveryResult::failure(std::move(*error));
  }
  if (http_client_ == nullptr) {
    return DeliveryResult::failure(DeliveryError::transport(0, "http client unavailable"));
  }

  const std::string transaction_id = generate_transaction_id();
  const std::string body = build_payload(request.message).to_json();
  const http::HeaderMap headers = {
      {"Authorization", "Bearer " + request.access_token},
      {"Content-Type", "application/json"},
      {"Content-Length", std::to_string(body.size())},
  };

  const auto response = http_client_->put_json(
      build_send_url(request.homeserver_url, request.room_id, transaction_id), headers, body,
      timeout_ms_);
  if (response.network_error || response.timeout || response.status != HTTP_OK) {
    return transport_failure(response);
  }

  DeliveryOutcome outcome;
  outcome.path = DeliveryPath::Plaintext;
  outcome.transaction_id = transaction_id;
  outcome.http_status = response.status;
  outcome.event_id = common::json_get_string(response.body, "event_id");
  outcome.detail = response.body;
  return DeliveryResult::success(std::move(outcome));
}

EncryptedStrategy::EncryptedStrategy(std::shared_ptr<process::IProcessRunner> runner,
                                     std::string client)
    : runner_(std::move(runner)), client_(std::move(client)) {}

std::vector<std::string> EncryptedStrategy::build_command(const DeliveryRequest &request) const {
  return {client_, "-m", request.message, "--room", request.room_id, "--html"};
}

DeliveryResult EncryptedStrategy::attempt(const DeliveryRequest &request) const {
  if (runner_ == nullptr) {
    return DeliveryResult::failure(DeliveryError::subprocess("process runner unavailable"));
  }

  auto run = runner_->run(build_command(request));
  if (!run.ok()) {
    return DeliveryResult::failure(DeliveryError::subprocess(run.error()));
  }

  const auto &result = run.value();
  if (result.exit_code != 0) {
    std::string detail = "Command '" + client_ + "' returned non-zero " +
                         process::describe_exit(result) + ".";
    std::string output = common::trim(result.stderr_text);
    if (output.empty()) {
      output = common::trim(result.stdout_text);
    }
    if (!output.empty()) {
      detail += "\n" + output;
    }
    return DeliveryResult::failure(DeliveryError::subprocess(std::move(detail)));
  }

  DeliveryOutcome outcome;
  outcome.path = DeliveryPath::EndToEnd;
  outcome.exit_code = result.exit_code;
  outcome.detail = common::trim(result.stdout_text);
  return DeliveryResult::success(std::move(outcome));
}

DeliveryResult attempt(const DeliveryStrategy &strategy, const DeliveryRequest &request) {
  return std::visit([&request](const auto &impl) { return impl.attempt(request); }, strategy);
}

} // namespace matrixnotify::delivery
