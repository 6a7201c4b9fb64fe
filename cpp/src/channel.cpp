#include "progeval/channel.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <utility>

namespace progeval {

namespace {

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

OneShotChannel::OneShotChannel() {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  read_fd_ = fds[0];
  write_fd_ = fds[1];
}

OneShotChannel::~OneShotChannel() {
  close_fd(read_fd_);
  close_fd(write_fd_);
}

OneShotChannel::OneShotChannel(OneShotChannel&& other) noexcept
    : read_fd_(std::exchange(other.read_fd_, -1)),
      write_fd_(std::exchange(other.write_fd_, -1)),
      sent_(other.sent_),
      received_(other.received_) {}

OneShotChannel& OneShotChannel::operator=(OneShotChannel&& other) noexcept {
  if (this != &other) {
    close_fd(read_fd_);
    close_fd(write_fd_);
    read_fd_ = std::exchange(other.read_fd_, -1);
    write_fd_ = std::exchange(other.write_fd_, -1);
    sent_ = other.sent_;
    received_ = other.received_;
  }
  return *this;
}

void OneShotChannel::close_read_end() { close_fd(read_fd_); }

void OneShotChannel::close_write_end() { close_fd(write_fd_); }

bool OneShotChannel::send(const std::string& message) {
  if (sent_ || write_fd_ < 0) {
    return false;
  }
  sent_ = true;
  std::size_t written = 0;
  while (written < message.size()) {
    const ssize_t n = ::write(write_fd_, message.data() + written, message.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      close_fd(write_fd_);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  close_fd(write_fd_);
  return true;
}

OneShotChannel::Status OneShotChannel::receive(std::chrono::steady_clock::time_point deadline,
                                               std::string* message) {
  if (received_ || read_fd_ < 0) {
    return Status::Error;
  }
  received_ = true;
  message->clear();

  char buffer[4096];
  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      close_fd(read_fd_);
      return Status::TimedOut;
    }
    pollfd pfd{read_fd_, POLLIN, 0};
    // poll takes an int; long deadlines are waited out in slices.
    const int wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(left.count(), 60000));
    const int ready = ::poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      close_fd(read_fd_);
      return Status::Error;
    }
    if (ready == 0) {
      continue;
    }
    const ssize_t n = ::read(read_fd_, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      close_fd(read_fd_);
      return Status::Error;
    }
    if (n == 0) {
      close_fd(read_fd_);
      return message->empty() ? Status::Closed : Status::Ok;
    }
    message->append(buffer, static_cast<std::size_t>(n));
  }
}

}  // namespace progeval
