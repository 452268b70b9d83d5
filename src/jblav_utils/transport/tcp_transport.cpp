/*
 * Copyright (c) 2026 JBL AV Bridge Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "jblav_utils/transport/tcp_transport.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include <rclcpp/rclcpp.hpp>

namespace jblav
{
namespace transport
{

namespace
{

const rclcpp::Logger & logger()
{
  static const rclcpp::Logger l = rclcpp::get_logger("JblAvTcpTransport");
  return l;
}

bool setNonBlocking(int fd)
{
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

OpenResult connectWithTimeout(int fd, const addrinfo * ai, int timeout_ms)
{
  int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
  if (ret == 0) {
    return OpenResult::OK;
  }
  if (errno == ECONNREFUSED) {
    return OpenResult::REFUSED;
  }
  if (errno != EINPROGRESS) {
    return OpenResult::FAILED;
  }

  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLOUT;
  do {
    ret = ::poll(&pfd, 1, timeout_ms);
  } while (ret < 0 && errno == EINTR);
  if (ret == 0) {
    return OpenResult::TIMED_OUT;
  }
  if (ret < 0) {
    return OpenResult::FAILED;
  }

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
    return OpenResult::FAILED;
  }
  if (so_error == 0) {
    return OpenResult::OK;
  }
  if (so_error == ECONNREFUSED) {
    return OpenResult::REFUSED;
  }
  if (so_error == ETIMEDOUT) {
    return OpenResult::TIMED_OUT;
  }
  errno = so_error;
  return OpenResult::FAILED;
}

} // namespace

const char * openResultName(OpenResult result)
{
  switch (result) {
    case OpenResult::OK: return "ok";
    case OpenResult::REFUSED: return "refused";
    case OpenResult::TIMED_OUT: return "timed out";
    case OpenResult::RESOLVE_FAILED: return "resolve failed";
    case OpenResult::FAILED: return "failed";
  }
  return "unknown";
}

OpenResult mergeOpenResult(OpenResult reported, OpenResult attempt)
{
  if (attempt == OpenResult::OK) {
    return OpenResult::OK;
  }
  if (reported == OpenResult::REFUSED || reported == OpenResult::TIMED_OUT) {
    return reported;
  }
  return attempt;
}

TcpTransport::~TcpTransport()
{
  close();
}

OpenResult TcpTransport::open(const TransportOptions & opts)
{
  close();
  opts_ = opts;

  if (opts_.host.empty()) {
    RCLCPP_ERROR(logger(), "No host configured");
    return OpenResult::RESOLVE_FAILED;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  const std::string port_str = std::to_string(opts_.port);
  addrinfo * result = nullptr;
  int ret = ::getaddrinfo(opts_.host.c_str(), port_str.c_str(), &hints, &result);
  if (ret != 0 || result == nullptr) {
    RCLCPP_WARN(
      logger(), "Failed to resolve host %s: %s",
      opts_.host.c_str(), ::gai_strerror(ret));
    return OpenResult::RESOLVE_FAILED;
  }

  // Try each resolved address until one connects
  OpenResult outcome = OpenResult::FAILED;
  for (addrinfo * ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (!setNonBlocking(fd)) {
      ::close(fd);
      continue;
    }

    const OpenResult attempt = connectWithTimeout(fd, ai, opts_.connect_timeout_ms);
    outcome = mergeOpenResult(outcome, attempt);
    if (attempt != OpenResult::OK) {
      RCLCPP_DEBUG(
        logger(), "Connect to %s:%u %s (errno %d)",
        opts_.host.c_str(), static_cast<unsigned>(opts_.port),
        openResultName(attempt), errno);
      ::close(fd);
      continue;
    }

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
    fd_.store(fd);
    break;
  }
  ::freeaddrinfo(result);

  if (outcome == OpenResult::OK) {
    RCLCPP_INFO(
      logger(), "Connected to %s:%u", opts_.host.c_str(), static_cast<unsigned>(opts_.port));
  }
  return outcome;
}

void TcpTransport::close()
{
  int fd = fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
}

bool TcpTransport::is_open() const
{
  return fd_.load() >= 0;
}

int TcpTransport::read(uint8_t * buf, size_t len)
{
  const int fd = fd_.load();
  if (fd < 0) {
    return kReadError;
  }

  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLIN;
  int ret = ::poll(&pfd, 1, opts_.read_timeout_ms);
  if (ret == 0 || (ret < 0 && errno == EINTR)) {
    return 0;
  }
  if (ret < 0) {
    return kReadError;
  }

  ssize_t n = ::recv(fd, buf, len, 0);
  if (n > 0) {
    return static_cast<int>(n);
  }
  if (n == 0) {
    return kPeerClosed;
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
    return 0;
  }
  RCLCPP_DEBUG(logger(), "recv failed: %s", std::strerror(errno));
  return kReadError;
}

int TcpTransport::write(const uint8_t * buf, size_t len)
{
  const int fd = fd_.load();
  if (fd < 0) {
    return -1;
  }

  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{};
      pfd.fd = fd;
      pfd.events = POLLOUT;
      if (::poll(&pfd, 1, opts_.write_timeout_ms) > 0) {
        continue;
      }
      RCLCPP_WARN(logger(), "send timed out after %zu of %zu bytes", sent, len);
      return -1;
    }
    RCLCPP_WARN(logger(), "send failed: %s", std::strerror(errno));
    return -1;
  }
  return static_cast<int>(sent);
}

} // namespace transport
} // namespace jblav
