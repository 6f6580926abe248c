#include "test_framework.hpp"

#include "matrixnotify/delivery/strategy.hpp"
#include "matrixnotify/process/process_runner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <memory>
#include <sstream>

void register_process_tests(std::vector<matrixnotify::tests::TestCase> &tests) {
  using matrixnotify::tests::contains;
  using matrixnotify::tests::require;
  namespace proc = matrixnotify::process;
  namespace dl = matrixnotify::delivery;

  tests.push_back({"process_captures_output_and_exit_code", [] {
                     proc::PosixProcessRunner runner;
                     const auto result =
                         runner.run({"sh", "-c", "echo out; echo err >&2; exit 3"});
                     require(result.ok(), "sh should start");
                     require(result.value().exit_code == 3, "exit code 3");
                     require(result.value().stdout_text == "out\n", "stdout captured");
                     require(result.value().stderr_text == "err\n", "stderr captured");
                     require(proc::describe_exit(result.value()) == "exit status 3", "describe");
                   }});

  tests.push_back({"process_arguments_are_not_shell_expanded", [] {
                     proc::PosixProcessRunner runner;
                     const auto result = runner.run({"printf", "%s", "$HOME <b>'x'</b>"});
                     require(result.ok() && result.value().exit_code == 0, "printf should run");
                     require(result.value().stdout_text == "$HOME <b>'x'</b>",
                             "argument passed verbatim: " + result.value().stdout_text);
                   }});

  tests.push_back({"process_missing_binary_exits_127", [] {
                     proc::PosixProcessRunner runner;
                     const auto result = runner.run({"matrix-notify-no-such-binary-xyz"});
                     require(result.ok(), "fork itself succeeds");
                     require(result.value().exit_code == 127, "exec failure is 127");
                     require(contains(result.value().stderr_text, "failed to execute"),
                             "exec error reported: " + result.value().stderr_text);
                   }});

  tests.push_back({"process_empty_command_rejected", [] {
                     proc::PosixProcessRunner runner;
                     require(!runner.run({}).ok(), "empty argv should fail");
                   }});

  tests.push_back({"process_signal_termination", [] {
                     proc::PosixProcessRunner runner;
                     const auto result = runner.run({"sh", "-c", "kill -TERM $$"});
                     require(result.ok(), "sh should start");
                     require(result.value().exit_code == -1, "no exit code");
                     require(result.value().term_signal == 15, "SIGTERM recorded");
                     require(proc::describe_exit(result.value()) == "terminated by signal 15",
                             "describe signal");
                   }});

  tests.push_back({"process_large_output_does_not_block", [] {
                     proc::PosixProcessRunner runner;
                     const auto result = runner.run(
                         {"sh", "-c", "head -c 200000 /dev/zero; head -c 100000 /dev/zero >&2"});
                     require(result.ok() && result.value().exit_code == 0, "should finish");
                     require(result.value().stdout_text.size() == 200000, "all stdout read");
                     require(result.value().stderr_text.size() == 100000, "all stderr read");
                   }});

  tests.push_back({"process_encrypted_strategy_with_script_client", [] {
                     matrixnotify::testing::TempWorkspace workspace;
                     const auto args_file = workspace.path() / "args.txt";
                     const auto client = workspace.create_script(
                         "fake-commander",
                         "for a in \"$@\"; do printf '%s\\n' \"$a\"; done > '" +
                             args_file.string() + "'");
                     const dl::EncryptedStrategy strategy(
                         std::make_shared<proc::PosixProcessRunner>(), client.string());

                     dl::DeliveryRequest request;
                     request.room_id = "!abc:matrix.org";
                     request.message = "<b>hi</b> there";
                     request.use_e2e = true;
                     const auto result = strategy.attempt(request);
                     require(result.ok(), "script exits 0");

                     std::ifstream in(args_file);
                     std::stringstream recorded;
                     recorded << in.rdbuf();
                     require(recorded.str() == "-m\n<b>hi</b> there\n--room\n!abc:matrix.org\n--html\n",
                             "unexpected args: " + recorded.str());
                   }});

  tests.push_back({"process_encrypted_strategy_script_failure", [] {
                     matrixnotify::testing::TempWorkspace workspace;
                     const auto client = workspace.create_script(
                         "failing-commander",
                         "echo 'ERROR: matrix-commander: E153: Credentials file was not found.' >&2\n"
                         "exit 1");
                     const dl::EncryptedStrategy strategy(
                         std::make_shared<proc::PosixProcessRunner>(), client.string());

                     dl::DeliveryRequest request;
                     request.room_id = "!abc:matrix.org";
                     request.message = "hi";
                     request.use_e2e = true;
                     const auto result = strategy.attempt(request);
                     require(!result.ok(), "script exits 1");
                     require(contains(result.error().detail, "E153"), "stderr text kept");
                   }});
}
