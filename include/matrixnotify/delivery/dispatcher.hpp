#pragma once

#include "matrixnotify/delivery/strategy.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace matrixnotify::delivery {

struct DispatcherOptions {
  std::string e2e_client = config::DEFAULT_E2E_CLIENT;
  /// 0 keeps the HTTP client's default (no timeout with libcurl).
  std::uint64_t http_timeout_ms = 0;
};

/// Validates a request and runs exactly one delivery strategy. Never exits the process;
/// callers decide what to print and which exit code to use.
class Dispatcher {
public:
  Dispatcher(std::shared_ptr<http::HttpClient> http_client,
             std::shared_ptr<process::IProcessRunner> process_runner,
             DispatcherOptions options = {});

  [[nodiscard]] DeliveryStrategy select_strategy(const DeliveryRequest &request) const;
  [[nodiscard]] DeliveryResult dispatch(const DeliveryRequest &request) const;

private:
  std::shared_ptr<http::HttpClient> http_client_;
  std::shared_ptr<process::IProcessRunner> process_runner_;
  DispatcherOptions options_;
};

/// "Message '...' sent successfully to room '...' (with|without E2E)."
[[nodiscard]] std::string format_success(const DeliveryRequest &request);

/// "An error occurred while sending the message '...' to room '...' (... E2E):" plus the
/// error detail on the next line.
[[nodiscard]] std::string format_failure(const DeliveryRequest &request,
                                         const DeliveryError &error);

} // namespace matrixnotify::delivery
