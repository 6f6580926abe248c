#pragma once

#include "matrixnotify/common/result.hpp"

#include <string>
#include <vector>

namespace matrixnotify::process {

struct ProcessResult {
  int exit_code = 0;
  /// Non-zero when the child was killed by a signal; exit_code is -1 then.
  int term_signal = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// Runs a program to completion. A failure Result means the child could not be
/// started at all; a non-zero exit is reported through ProcessResult.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;
  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &argv) = 0;
};

class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult>
  run(const std::vector<std::string> &argv) override;
};

[[nodiscard]] std::string describe_exit(const ProcessResult &result);

} // namespace matrixnotify::process
