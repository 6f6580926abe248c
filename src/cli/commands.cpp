#include "matrixnotify/cli/commands.hpp"

#include "matrixnotify/common/fs.hpp"
#include "matrixnotify/config/config.hpp"
#include "matrixnotify/delivery/dispatcher.hpp"
#include "matrixnotify/observability/factory.hpp"
#include "matrixnotify/observability/global.hpp"
#include "matrixnotify/observability/log_observer.hpp"

#include <iostream>
#include <optional>
#include <regex>
#include <sstream>

namespace matrixnotify::cli {

namespace {

constexpr const char *USAGE =
    "usage: matrix-notify [--config PATH] --message TEXT --room-id ROOM [--use-e2e BOOL]\n"
    "                     [--homeserver-url URL] [--access-token TOKEN] [--verbose]\n";

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// "-h", "--flag" and the like, but not "-", "-5", "-0.5" or text containing a space.
bool looks_like_option(const std::string &arg) {
  static const std::regex negative_number(R"(^-\d+$|^-\d*\.\d+$)");
  return arg.size() > 1 && arg.front() == '-' && arg.find(' ') == std::string::npos &&
         !std::regex_match(arg, negative_number);
}

// Accepts both "--name value" and "--name=value". The last occurrence wins.
// A separate value that looks like an option is refused; "--name=-h" passes it through.
bool take_option(std::vector<std::string> &args, const std::string &name,
                 std::optional<std::string> &out_value, std::string &error) {
  const std::string prefix = name + "=";
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == name) {
      if (i + 1 >= args.size() || looks_like_option(args[i + 1])) {
        error = "argument " + name + ": expected one argument";
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], prefix)) {
      out_value = args[i].substr(prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  bool found = false;
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      found = true;
      continue;
    }
    ++i;
  }
  return found;
}

bool has_flag(const std::vector<std::string> &args, const std::string &long_name,
              const std::string &short_name) {
  for (const auto &arg : args) {
    if (arg == long_name || arg == short_name) {
      return true;
    }
  }
  return false;
}

std::string join_tokens(const std::vector<std::string> &args) {
  std::ostringstream out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

int usage_error(std::ostream &err, const std::string &message) {
  err << USAGE << "matrix-notify: error: " << message << "\n";
  return EXIT_USAGE;
}

bool parse_use_e2e(const std::optional<std::string> &value) {
  return value.has_value() && common::to_lower(common::trim(*value)) == "true";
}

} // namespace

std::string version_string() {
#ifdef MATRIXNOTIFY_VERSION
  return std::string("matrix-notify ") + MATRIXNOTIFY_VERSION;
#else
  return "matrix-notify 0.1.0";
#endif
}

void print_help(std::ostream &out) {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  out << BOLD << "matrix-notify" << RESET << DIM
      << " - send a message to a Matrix room, optionally end-to-end encrypted" << RESET << "\n";
  out << DIM << version_string() << RESET << "\n\n";
  out << USAGE << "\n";

  out << BOLD << "OPTIONS" << RESET << "\n";
  out << "  " << GREEN << "--message TEXT" << RESET << DIM
      << "          Message to send (HTML allowed)" << RESET << "\n";
  out << "  " << GREEN << "--room-id ROOM" << RESET << DIM
      << "          Room ID, e.g. '!xyz:matrix.org'" << RESET << "\n";
  out << "  " << GREEN << "--use-e2e BOOL" << RESET << DIM
      << "          Send through " << config::DEFAULT_E2E_CLIENT
      << " with end-to-end encryption (case-insensitive, default 'False')" << RESET << "\n";
  out << "  " << GREEN << "--homeserver-url URL" << RESET << DIM
      << "    Homeserver URL, not needed with E2E (default '" << config::DEFAULT_HOMESERVER_URL
      << "')" << RESET << "\n";
  out << "  " << GREEN << "--access-token TOKEN" << RESET << DIM
      << "    Access token of the sending account, not needed with E2E" << RESET << "\n";
  out << "  " << GREEN << "--config PATH" << RESET << DIM
      << "           Config file (default ~/.matrix-notify/config.toml)" << RESET << "\n";
  out << "  " << GREEN << "--verbose" << RESET << DIM
      << "               Log delivery events to stderr" << RESET << "\n";
  out << "  " << GREEN << "--help, --version" << RESET << "\n\n";

  out << BOLD << "E2E SETUP" << RESET << "\n";
  out << DIM << "  " << config::DEFAULT_E2E_CLIENT
      << " needs a credentials file and a verified session before the first send:" << RESET
      << "\n";
  out << "  " << config::DEFAULT_E2E_CLIENT
      << " --login PASSWORD --device NAME --user-login @bot:example.org \\\n"
      << "      --password SECRET --homeserver https://example.org --room-default '!room:example.org'\n";
  out << "  " << config::DEFAULT_E2E_CLIENT << " --verify emoji\n";
}

int run_cli(std::vector<std::string> args, const CliDependencies &deps, std::ostream &out,
            std::ostream &err) {
  std::string parse_error;
  std::optional<std::string> config_file;
  std::optional<std::string> message;
  std::optional<std::string> room_id;
  std::optional<std::string> use_e2e;
  std::optional<std::string> homeserver_url;
  std::optional<std::string> access_token;
  if (!take_option(args, "--config", config_file, parse_error) ||
      !take_option(args, "--message", message, parse_error) ||
      !take_option(args, "--room-id", room_id, parse_error) ||
      !take_option(args, "--use-e2e", use_e2e, parse_error) ||
      !take_option(args, "--homeserver-url", homeserver_url, parse_error) ||
      !take_option(args, "--access-token", access_token, parse_error)) {
    return usage_error(err, parse_error);
  }
  // Only arguments left after option values were consumed can ask for help.
  if (has_flag(args, "--help", "-h")) {
    print_help(out);
    return EXIT_OK;
  }
  if (has_flag(args, "--version", "-V")) {
    out << version_string() << "\n";
    return EXIT_OK;
  }
  const bool verbose = take_flag(args, "--verbose");

  if (!args.empty()) {
    return usage_error(err, "unrecognized arguments: " + join_tokens(args));
  }
  if (!message.has_value() || !room_id.has_value()) {
    std::string missing;
    if (!message.has_value()) {
      missing = "--message";
    }
    if (!room_id.has_value()) {
      missing += missing.empty() ? "--room-id" : ", --room-id";
    }
    return usage_error(err, "the following arguments are required: " + missing);
  }

  if (config_file.has_value()) {
    config::set_config_path_override(std::filesystem::path(*config_file));
  } else {
    config::clear_config_path_override();
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    err << cfg.error() << "\n";
    return EXIT_FAILURE_DELIVERY;
  }

  if (verbose) {
    observability::set_global_observer(std::make_unique<observability::LogObserver>(err));
  } else {
    observability::set_global_observer(observability::create_observer(cfg.value()));
  }

  delivery::DeliveryRequest request;
  request.message = *message;
  request.room_id = *room_id;
  request.use_e2e = parse_use_e2e(use_e2e);
  request.homeserver_url = homeserver_url.value_or(cfg.value().matrix.homeserver_url);
  request.access_token = access_token.value_or(cfg.value().matrix.access_token);

  delivery::DispatcherOptions options;
  options.e2e_client = cfg.value().e2e.client;
  const delivery::Dispatcher dispatcher(deps.http_client, deps.process_runner, options);

  const auto result = dispatcher.dispatch(request);
  // The observer may write to `err`, which does not outlive this call.
  observability::set_global_observer(nullptr);
  if (!result.ok()) {
    out << delivery::format_failure(request, result.error()) << "\n";
    return EXIT_FAILURE_DELIVERY;
  }

  // The E2E client's own output comes first, as if it had written to the terminal.
  const auto &outcome = result.value();
  if (outcome.path == delivery::DeliveryPath::EndToEnd && !outcome.detail.empty()) {
    out << outcome.detail << "\n";
  }
  out << delivery::format_success(request) << "\n";
  return EXIT_OK;
}

int run_cli(int argc, char **argv) {
  CliDependencies deps;
  deps.http_client = std::make_shared<http::CurlHttpClient>();
  deps.process_runner = std::make_shared<process::PosixProcessRunner>();
  return run_cli(collect_args(argc - 1, argv + 1), deps, std::cout, std::cerr);
}

} // namespace matrixnotify::cli
