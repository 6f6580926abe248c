#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace matrixnotify::http {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// Issues a PUT with `body` as payload. `timeout_ms == 0` leaves the transport default.
  [[nodiscard]] virtual HttpResponse put_json(const std::string &url, const HeaderMap &headers,
                                              const std::string &body,
                                              std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse put_json(const std::string &url, const HeaderMap &headers,
                                      const std::string &body, std::uint64_t timeout_ms) override;
};

} // namespace matrixnotify::http
