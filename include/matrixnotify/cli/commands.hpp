#pragma once

#include "matrixnotify/http/http_client.hpp"
#include "matrixnotify/process/process_runner.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace matrixnotify::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILURE_DELIVERY = 1;
inline constexpr int EXIT_USAGE = 2;

struct CliDependencies {
  std::shared_ptr<http::HttpClient> http_client;
  std::shared_ptr<process::IProcessRunner> process_runner;
};

void print_help(std::ostream &out);
[[nodiscard]] std::string version_string();

/// Parses `args` (without the program name), sends the message and returns the exit code.
/// Delivery results go to `out`; usage and configuration errors go to `err`.
[[nodiscard]] int run_cli(std::vector<std::string> args, const CliDependencies &deps,
                          std::ostream &out, std::ostream &err);

/// Process entry point using libcurl and fork/exec.
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace matrixnotify::cli
