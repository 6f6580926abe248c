#include "matrixnotify/process/process_runner.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace matrixnotify::process {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Returns false once the write end is closed.
bool read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return true;
    }
    return false;
  }
}

void close_pipe(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

} // namespace

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &argv) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<ProcessResult>::failure("command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    std::vector<char *> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      cargs.push_back(const_cast<char *>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    execvp(cargs[0], cargs.data());
    const std::string message =
        "failed to execute " + argv.front() + ": " + std::strerror(errno) + "\n";
    (void)!write(STDERR_FILENO, message.data(), message.size());
    _exit(127);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  stdout_pipe[1] = -1;
  stderr_pipe[1] = -1;
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  ProcessResult result;
  bool stdout_open = true;
  bool stderr_open = true;
  while (stdout_open || stderr_open) {
    struct pollfd poll_fds[2] = {
        {.fd = stdout_open ? stdout_pipe[0] : -1, .events = POLLIN, .revents = 0},
        {.fd = stderr_open ? stderr_pipe[0] : -1, .events = POLLIN, .revents = 0},
    };
    if (poll(poll_fds, 2, -1) < 0 && errno != EINTR) {
      break;
    }
    if (stdout_open) {
      stdout_open = read_into_buffer(stdout_pipe[0], result.stdout_text);
    }
    if (stderr_open) {
      stderr_open = read_into_buffer(stderr_pipe[0], result.stderr_text);
    }
  }
  close_pipe(stdout_pipe);
  close_pipe(stderr_pipe);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return common::Result<ProcessResult>::failure("failed to wait for " + argv.front() + ": " +
                                                    std::strerror(errno));
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else {
    result.exit_code = -1;
    result.term_signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  }
  return common::Result<ProcessResult>::success(std::move(result));
}

std::string describe_exit(const ProcessResult &result) {
  if (result.term_signal != 0) {
    return "terminated by signal " + std::to_string(result.term_signal);
  }
  return "exit status " + std::to_string(result.exit_code);
}

} // namespace matrixnotify::process
