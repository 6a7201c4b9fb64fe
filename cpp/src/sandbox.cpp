#include "progeval/sandbox.hpp"

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <system_error>

#include "progeval/bytecode.hpp"
#include "progeval/channel.hpp"
#include "progeval/errors.hpp"
#include "progeval/parser.hpp"
#include "progeval/vm.hpp"

namespace progeval {

const char* const kTimeoutDiagnostic = "Timeout Error: execution exceeded time limit";

namespace {

RunResult failed(const std::string& diagnostic) {
  RunResult out;
  out.ok = false;
  out.diagnostic = diagnostic;
  return out;
}

int reap(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

// Held from pipe creation until the parent has closed its write end, so a
// fork on another thread never inherits a write end that is not its own.
std::mutex& spawn_mutex() {
  static std::mutex m;
  return m;
}

}  // namespace

std::string describe_worker_exit(int status) {
  if (status == -1) {
    return "Error: worker exited without a result";
  }
  if (WIFSIGNALED(status)) {
    const int sig = WTERMSIG(status);
    return "Error: worker killed by signal " + std::to_string(sig) + " (" + ::strsignal(sig) + ")";
  }
  if (WIFEXITED(status)) {
    return "Error: worker exited with status " + std::to_string(WEXITSTATUS(status)) + " without a result";
  }
  return "Error: worker exited without a result";
}

RunResult execute_program(const std::string& program, const std::string& function_to_run, const Value& input) {
  try {
    const Module module = parse_module(program);
    const CompiledModule compiled = compile_module(module);
    const VMResult result = run_function(compiled, function_to_run, {input});
    if (result.is_error) {
      return failed("Error: " + result.err.message + "\n" + format_error(result));
    }
    RunResult out;
    out.ok = true;
    out.value = result.value;
    return out;
  } catch (const ParseError& e) {
    return failed(std::string("Error: ") + e.what() + "\nSyntaxError: " + e.what());
  } catch (const std::exception& e) {
    return failed(std::string("Error: ") + e.what());
  }
}

RunResult run_in_worker(const std::function<RunResult()>& work, int timeout_seconds) {
  std::unique_ptr<OneShotChannel> channel;
  std::chrono::steady_clock::time_point deadline;
  pid_t pid = -1;
  {
    const std::lock_guard<std::mutex> lock(spawn_mutex());
    try {
      channel = std::make_unique<OneShotChannel>();
    } catch (const std::system_error& e) {
      return failed(std::string("Error: cannot create result channel: ") + e.what());
    }

    deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    pid = ::fork();
    if (pid < 0) {
      return failed(std::string("Error: cannot start worker: ") + std::strerror(errno));
    }

    if (pid == 0) {
      channel->close_read_end();
      RunResult result;
      try {
        result = work();
      } catch (const std::exception& e) {
        result = failed(std::string("Error: ") + e.what());
      }
      const bool sent = channel->send(encode_result(result));
      ::_exit(sent ? 0 : 1);
    }

    channel->close_write_end();
  }

  std::string message;
  const OneShotChannel::Status status = channel->receive(deadline, &message);
  if (status == OneShotChannel::Status::TimedOut || status == OneShotChannel::Status::Error) {
    ::kill(pid, SIGKILL);
    reap(pid);
    return failed(status == OneShotChannel::Status::TimedOut ? std::string(kTimeoutDiagnostic)
                                                            : std::string("Error: reading the worker result failed"));
  }

  const int exit_status = reap(pid);
  if (status == OneShotChannel::Status::Ok) {
    return decode_result(message);
  }
  return failed(describe_worker_exit(exit_status));
}

RunResult Sandbox::run(const std::string& program, const std::string& function_to_run, const Value& input,
                       int timeout_seconds) const {
  return run_in_worker([&]() { return execute_program(program, function_to_run, input); }, timeout_seconds);
}

}  // namespace progeval
