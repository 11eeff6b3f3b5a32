/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx / ttyACMx - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <cstring> // for strerror
#include <iostream>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h> // write(), read(), close()

// Qube headers
#include "io/SerialChannel.hpp"

using namespace qube::io;

std::optional<speed_t> qube::io::toSpeed(int baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  default:
    return std::nullopt;
  }
}

SerialChannel::~SerialChannel() { close(); }

std::string SerialChannel::lastError() const {
  std::lock_guard<std::mutex> lock(errMtx_);
  return lastError_;
}

void SerialChannel::setError(std::string reason) {
  std::cerr << reason << "\n";
  std::lock_guard<std::mutex> lock(errMtx_);
  lastError_ = std::move(reason);
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();
  {
    std::lock_guard<std::mutex> lock(fdMtx_);
    if (users_ > 0) {
      setError("open: previous handle still in use");
      return false;
    }
  }
  rx_buffer_.clear();

  // open non-blocking, dont become ctrl-TTY
  int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    setError("Error " + std::to_string(errno) + " from open: " + strerror(errno));
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd, &tty) != 0) {
    setError("Error " + std::to_string(errno) + " from tcgetattr: " + strerror(errno));
    ::close(fd);
    return false;
  }

  // 8N1 raw, no flow control
  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~(PARENB | CSTOPB);
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    setError("Error " + std::to_string(errno) + " from tcsetattr: " + strerror(errno));
    ::close(fd);
    return false;
  }

  tcflush(fd, TCIFLUSH); // drop whatever queued up before we attached

  const int wake = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake < 0) {
    setError("Error " + std::to_string(errno) + " from eventfd: " + strerror(errno));
    ::close(fd);
    return false;
  }

  std::lock_guard<std::mutex> lock(fdMtx_);
  ownedFd_ = fd;
  wakeFd_ = wake;
  closePending_ = false;
  fd_.store(fd);
  return true;
}

// -------------------------------------------------------------------
// fd pinning
// readLine()/writeLine() pin the descriptor for their whole call. A
// close() that arrives meanwhile only unpublishes it and signals the
// eventfd; the last user to leave does the ::close().
// -------------------------------------------------------------------
int SerialChannel::acquire(int* wakeFd) {
  std::lock_guard<std::mutex> lock(fdMtx_);
  if (ownedFd_ < 0 || closePending_)
    return -1;
  ++users_;
  if (wakeFd)
    *wakeFd = wakeFd_;
  return ownedFd_;
}

void SerialChannel::release() {
  std::lock_guard<std::mutex> lock(fdMtx_);
  if (--users_ == 0 && closePending_)
    releaseFdsLocked();
}

void SerialChannel::releaseFdsLocked() {
  if (ownedFd_ >= 0)
    ::close(ownedFd_);
  if (wakeFd_ >= 0)
    ::close(wakeFd_);
  ownedFd_ = -1;
  wakeFd_ = -1;
  closePending_ = false;
}

bool SerialChannel::writeLine(const std::string& line) {

  const int fd = acquire();
  if (fd < 0) {
    setError("write: channel closed");
    return false;
  }
  struct Pin {
    SerialChannel* self;
    ~Pin() { self->release(); }
  } pin{ this };

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  // POSIX write loop; a full tx queue gets a bounded wait for POLLOUT
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd, POLLOUT, 0 };
      if (::poll(&pfd, 1, 100) <= 0) {
        setError("write: tx queue stalled");
        return false;
      }
    } else {
      setError("Error " + std::to_string(errno) + " from write: " + strerror(errno));
      close();
      return false;
    }
  }

  return true;
}

std::optional<std::string> SerialChannel::takeLine() {
  while (true) {
    const auto pos = rx_buffer_.find('\n');
    if (pos == std::string::npos) {
      if (rx_buffer_.size() > kMaxPartialLine)
        rx_buffer_.clear(); // runaway garbage without a terminator
      return std::nullopt;
    }
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!line.empty())
      return line;
  }
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error; the latter two
// also close the descriptor.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto line = takeLine())
    return line;

  int wake = -1;
  const int fd = acquire(&wake);
  if (fd < 0)
    return std::nullopt;
  struct Pin {
    SerialChannel* self;
    ~Pin() { self->release(); }
  } pin{ this };

  char temp[256];
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    if (fd_.load() < 0)
      return std::nullopt; // closed by another thread

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());
    if (ms <= 0)
      break;

    pollfd fds[2] = { { fd, POLLIN, 0 }, { wake, POLLIN, 0 } };
    int rc = ::poll(fds, 2, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      setError(std::string("poll: ") + strerror(errno));
      close();
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout
    if (fds[1].revents != 0)
      return std::nullopt; // close() requested, leave the fd untouched

    const pollfd& pfd = fds[0];
    if (pfd.revents & (POLLERR | POLLNVAL)) {
      setError("poll: device error");
      close();
      return std::nullopt;
    }

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(fd, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        setError("read: device disconnected");
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        setError(std::string("read: ") + strerror(errno));
        close();
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    }
  }
  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  std::lock_guard<std::mutex> lock(fdMtx_);
  fd_.store(-1);
  if (ownedFd_ < 0 || closePending_)
    return;
  if (users_ == 0) {
    releaseFdsLocked();
    return;
  }
  // a reader/writer is inside; it closes on its way out
  closePending_ = true;
  const std::uint64_t one = 1;
  if (::write(wakeFd_, &one, sizeof(one)) != sizeof(one))
    std::cerr << "Error " << errno << " from eventfd write: " << strerror(errno) << "\n";
}
