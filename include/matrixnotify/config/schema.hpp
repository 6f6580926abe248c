#pragma once

#include <string>

namespace matrixnotify::config {

inline constexpr const char *DEFAULT_HOMESERVER_URL = "https://matrix-client.matrix.org";
inline constexpr const char *DEFAULT_E2E_CLIENT = "matrix-commander";

struct MatrixConfig {
  std::string homeserver_url = DEFAULT_HOMESERVER_URL;
  std::string access_token;
};

struct E2eConfig {
  std::string client = DEFAULT_E2E_CLIENT;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  MatrixConfig matrix;
  E2eConfig e2e;
  ObservabilityConfig observability;
};

} // namespace matrixnotify::config
