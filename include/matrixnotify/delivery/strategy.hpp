#pragma once

#include "matrixnotify/common/result.hpp"
#include "matrixnotify/config/schema.hpp"
#include "matrixnotify/delivery/types.hpp"
#include "matrixnotify/http/http_client.hpp"
#include "matrixnotify/process/process_runner.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace matrixnotify::delivery {

using DeliveryResult = common::Result<DeliveryOutcome, DeliveryError>;

/// Sends the event straight to the homeserver's client-server API.
class PlaintextStrategy {
public:
  explicit PlaintextStrategy(std::shared_ptr<http::HttpClient> http_client,
                             std::uint64_t timeout_ms = 0);

  [[nodiscard]] DeliveryResult attempt(const DeliveryRequest &request) const;

private:
  std::shared_ptr<http::HttpClient> http_client_;
  std::uint64_t timeout_ms_ = 0;
};

/// Hands the message to an external E2E-capable client (matrix-commander by default),
/// which owns the credentials and the encryption store.
class EncryptedStrategy {
public:
  explicit EncryptedStrategy(std::shared_ptr<process::IProcessRunner> runner,
                             std::string client = config::DEFAULT_E2E_CLIENT);

  [[nodiscard]] std::vector<std::string> build_command(const DeliveryRequest &request) const;
  [[nodiscard]] DeliveryResult attempt(const DeliveryRequest &request) const;

private:
  std::shared_ptr<process::IProcessRunner> runner_;
  std::string client_;
};

using DeliveryStrategy = std::variant<PlaintextStrategy, EncryptedStrategy>;

[[nodiscard]] DeliveryResult attempt(const DeliveryStrategy &strategy,
                                     const DeliveryRequest &request);

} // namespace matrixnotify::delivery
