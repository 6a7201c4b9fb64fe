#pragma once

#include <functional>
#include <string>

#include "progeval/result_codec.hpp"
#include "progeval/value.hpp"

namespace progeval {

// Diagnostic of a run that was killed at its deadline.
extern const char* const kTimeoutDiagnostic;

// Parses and runs `program`, then calls `function_to_run(input)`, all in the
// calling process. Never throws.
RunResult execute_program(const std::string& program, const std::string& function_to_run, const Value& input);

// Runs `work` in a forked worker and returns what it produced. The worker is
// killed once `timeout_seconds` have passed; a worker that dies without a
// result yields a failed result naming its exit status or signal. Never throws.
RunResult run_in_worker(const std::function<RunResult()>& work, int timeout_seconds);

// Diagnostic for a worker that ended without sending a result; `status` is a
// waitpid status, or -1 when it could not be collected.
std::string describe_worker_exit(int status);

// Runs execute_program in a forked worker that is killed once `timeout_seconds`
// have passed. Contains crashes and hangs only; the worker has the same
// filesystem and network access as the caller. Never throws.
class Sandbox {
 public:
  RunResult run(const std::string& program, const std::string& function_to_run, const Value& input,
                int timeout_seconds) const;
};

}  // namespace progeval
