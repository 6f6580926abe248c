#include "test_framework.hpp"

#include "matrixnotify/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using matrixnotify::testing::ScopedEnv;

// Clears every variable that load_config() reads.
struct CleanEnv {
  ScopedEnv homeserver{"MATRIX_NOTIFY_HOMESERVER_URL", std::nullopt};
  ScopedEnv token{"MATRIX_NOTIFY_ACCESS_TOKEN", std::nullopt};
  ScopedEnv client{"MATRIX_NOTIFY_E2E_CLIENT", std::nullopt};
  ScopedEnv observability{"MATRIX_NOTIFY_OBSERVABILITY", std::nullopt};
  ScopedEnv path{"MATRIX_NOTIFY_CONFIG_PATH", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<matrixnotify::tests::TestCase> &tests) {
  using matrixnotify::tests::require;
  namespace config = matrixnotify::config;

  tests.push_back({"config_defaults_without_file", [] {
                     CleanEnv env;
                     matrixnotify::testing::TempWorkspace workspace;
                     config::set_config_path_override(workspace.path() / "missing.toml");
                     const auto cfg = config::load_config();
                     config::clear_config_path_override();
                     require(cfg.ok(), "missing file is not an error");
                     require(cfg.value().matrix.homeserver_url == "https://matrix-client.matrix.org",
                             "default homeserver");
                     require(cfg.value().matrix.access_token.empty(), "no token by default");
                     require(cfg.value().e2e.client == "matrix-commander", "default client");
                     require(cfg.value().observability.backend == "none", "quiet by default");
                   }});

  tests.push_back({"config_reads_file", [] {
                     CleanEnv env;
                     matrixnotify::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml",
                         "[matrix]\nhomeserver_url = \"https://hs.example.org\"\n"
                         "access_token = \"file-token\"\n\n[e2e]\nclient = \"/usr/local/bin/mc\"\n"
                         "\n[observability]\nbackend = \"log\"\n");
                     config::set_config_path_override(path);
                     const auto cfg = config::load_config();
                     config::clear_config_path_override();
                     require(cfg.ok(), "config should load: " + (cfg.ok() ? "" : cfg.error()));
                     require(cfg.value().matrix.homeserver_url == "https://hs.example.org",
                             "homeserver from file");
                     require(cfg.value().matrix.access_token == "file-token", "token from file");
                     require(cfg.value().e2e.client == "/usr/local/bin/mc", "client from file");
                     require(cfg.value().observability.backend == "log", "backend from file");
                   }});

  tests.push_back({"config_env_overrides_file", [] {
                     CleanEnv env;
                     matrixnotify::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml", "[matrix]\naccess_token = \"file-token\"\n");
                     ScopedEnv token("MATRIX_NOTIFY_ACCESS_TOKEN", std::string("env-token"));
                     ScopedEnv client("MATRIX_NOTIFY_E2E_CLIENT", std::string("mc-env"));
                     config::set_config_path_override(path);
                     const auto cfg = config::load_config();
                     config::clear_config_path_override();
                     require(cfg.ok(), "config should load");
                     require(cfg.value().matrix.access_token == "env-token", "env wins");
                     require(cfg.value().e2e.client == "mc-env", "client from env");
                   }});

  tests.push_back({"config_path_from_env", [] {
                     CleanEnv env;
                     matrixnotify::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "custom.toml", "[matrix]\nhomeserver_url = \"https://env-path.example\"\n");
                     ScopedEnv config_path("MATRIX_NOTIFY_CONFIG_PATH", path.string());
                     config::clear_config_path_override();
                     const auto resolved = config::config_path();
                     require(resolved.ok() && resolved.value() == path, "env path used");
                     const auto cfg = config::load_config();
                     require(cfg.ok() &&
                                 cfg.value().matrix.homeserver_url == "https://env-path.example",
                             "file at env path loaded");
                   }});

  tests.push_back({"config_expands_env_references", [] {
                     CleanEnv env;
                     ScopedEnv secret("MATRIX_NOTIFY_TEST_SECRET", std::string("expanded-token"));
                     matrixnotify::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml", "[matrix]\naccess_token = \"${MATRIX_NOTIFY_TEST_SECRET}\"\n");
                     config::set_config_path_override(path);
                     const auto cfg = config::load_config();
                     config::clear_config_path_override();
                     require(cfg.ok() && cfg.value().matrix.access_token == "expanded-token",
                             "env reference expanded");
                   }});

  tests.push_back({"config_invalid_file_is_error", [] {
                     CleanEnv env;
                     matrixnotify::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file("config.toml", "[matrix\nbroken\n");
                     config::set_config_path_override(path);
                     const auto cfg = config::load_config();
                     config::clear_config_path_override();
                     require(!cfg.ok(), "broken file should fail");
                     require(cfg.error().find(path.string()) != std::string::npos,
                             "error names the file");
                   }});
}
