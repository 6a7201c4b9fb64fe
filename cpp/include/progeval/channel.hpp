#pragma once

#include <chrono>
#include <string>

namespace progeval {

// Single-use pipe between a forked worker (the only writer) and the process
// that created it (the only reader). One message, then the channel is spent.
// Move-only; both ends are closed on destruction.
class OneShotChannel {
 public:
  enum class Status {
    Ok,
    TimedOut,
    Closed,  // writer went away without sending anything
    Error,
  };

  // Throws std::system_error when the pipe cannot be created.
  OneShotChannel();
  ~OneShotChannel();

  OneShotChannel(const OneShotChannel&) = delete;
  OneShotChannel& operator=(const OneShotChannel&) = delete;
  OneShotChannel(OneShotChannel&& other) noexcept;
  OneShotChannel& operator=(OneShotChannel&& other) noexcept;

  void close_read_end();
  void close_write_end();

  // Writes the whole message and closes the write end. Only the first call can
  // succeed.
  bool send(const std::string& message);

  // Reads until the writer closes its end or `deadline` passes. Only the first
  // call can return Ok.
  Status receive(std::chrono::steady_clock::time_point deadline, std::string* message);

 private:
  int read_fd_ = -1;
  int write_fd_ = -1;
  bool sent_ = false;
  bool received_ = false;
};

}  // namespace progeval
