#include "matrixnotify/config/config.hpp"

#include "matrixnotify/common/fs.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace matrixnotify::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".matrix-notify";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("MATRIX_NOTIFY_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

void override_from_env(const char *name, std::string &target) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    target = value;
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

void apply_document(const common::TomlDocument &doc, Config &config) {
  if (doc.has("matrix.homeserver_url")) {
    config.matrix.homeserver_url = expand_config_value(doc.get_string("matrix.homeserver_url"));
  }
  if (doc.has("matrix.access_token")) {
    config.matrix.access_token = expand_config_value(doc.get_string("matrix.access_token"));
  }
  if (doc.has("e2e.client")) {
    config.e2e.client = expand_config_value(doc.get_string("e2e.client"));
  }
  if (doc.has("observability.backend")) {
    config.observability.backend = doc.get_string("observability.backend");
  }
}

void apply_env_overrides(Config &config) {
  override_from_env("MATRIX_NOTIFY_HOMESERVER_URL", config.matrix.homeserver_url);
  override_from_env("MATRIX_NOTIFY_ACCESS_TOKEN", config.matrix.access_token);
  override_from_env("MATRIX_NOTIFY_E2E_CLIENT", config.e2e.client);
  override_from_env("MATRIX_NOTIFY_OBSERVABILITY", config.observability.backend);
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    // No HOME: run on defaults and environment only.
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::ostringstream content;
  content << file.rdbuf();

  auto doc = common::parse_toml(content.str());
  if (!doc.ok()) {
    return common::Result<Config>::failure("Invalid config file " + path.string() + ": " +
                                           doc.error());
  }

  apply_document(doc.value(), config);
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

} // namespace matrixnotify::config
