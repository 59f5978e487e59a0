/* @file SocketChannel.cpp
 * @brief IO abstraction layer that wraps a TCP socket - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstddef>
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <netdb.h> // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h> // TCP_NODELAY
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h> // write(), read(), close()

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Logging.hpp"
#include "io/SocketChannel.hpp"

using namespace vibedj::io;

SocketChannel::~SocketChannel() { close(); }

SocketChannel::SocketChannel(SocketChannel&& other) noexcept
    : fd_(other.fd_.exchange(-1)), peerClosed_(other.peerClosed_.load()), rx_buffer_(std::move(other.rx_buffer_)) {}

SocketChannel& SocketChannel::operator=(SocketChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_.exchange(-1);
    peerClosed_ = other.peerClosed_.load();
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool SocketChannel::open(const std::string& host, std::uint16_t port) {
  auto log = vibedj::core::logging::get("playback");
  close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  if (const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res); rc != 0) {
    log->error("getaddrinfo {}:{} failed: {}", host, port, gai_strerror(rc));
    return false;
  }

  int connected = -1;
  for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0)
      continue;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      connected = fd;
      break;
    }
    ::close(fd);
  }
  ::freeaddrinfo(res);

  if (connected < 0) {
    log->error("connect {}:{} failed: {}", host, port, strerror(errno));
    return false;
  }

  int one = 1;
  ::setsockopt(connected, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  rx_buffer_.clear();
  peerClosed_ = false;
  fd_ = connected;
  return true;
}

bool SocketChannel::writeLine(const std::string& line) {
  if (!isOpen())
    return false;
  const int fd = fd_.load();

  std::string out = line;
  if (!out.ends_with("\r\n"))
    out += "\r\n";

  std::size_t total = 0;
  while (total < out.size()) {
    const ssize_t written = ::send(fd, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd, POLLOUT, 0 };
      ::poll(&pfd, 1, 100);
    } else {
      vibedj::core::logging::get("playback")->error("send failed: {}", strerror(errno));
      peerClosed_ = true;
      return false;
    }
  }
  return true;
}

std::optional<std::string> SocketChannel::takeBufferedLine() {
  const auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;
  std::string line = rx_buffer_.substr(0, pos);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  rx_buffer_.erase(0, pos + 1);
  return line;
}

// -------------------------------------------------------------------
// SocketChannel::readLine
// Line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// A peer close is only recorded here: the fd stays owned until close().
// -------------------------------------------------------------------
std::optional<std::string> SocketChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto buffered = takeBufferedLine())
    return buffered;
  if (!isOpen())
    return std::nullopt;

  const int fd = fd_.load();
  char temp[4096];
  pollfd pfd{ fd, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    const auto msLeft =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    const int rc = ::poll(&pfd, 1, static_cast<int>(msLeft.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      vibedj::core::logging::get("playback")->error("poll failed: {}", strerror(errno));
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP | POLLERR)) {
      const ssize_t n = ::recv(fd, temp, sizeof(temp), 0);
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // peer closed
        peerClosed_ = true;
        return takeBufferedLine();
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      } else {
        vibedj::core::logging::get("playback")->error("recv failed: {}", strerror(errno));
        peerClosed_ = true;
        return std::nullopt;
      }

      if (auto line = takeBufferedLine())
        return line;
    }
  }
  return std::nullopt; // timeout/partial
}

void SocketChannel::close() {
  const int fd = fd_.exchange(-1);
  if (fd >= 0)
    ::close(fd);
  peerClosed_ = false;
}
