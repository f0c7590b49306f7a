#include "olt-client/transport/TcpTransport.hpp"
#include "olt-client/Logger.hpp"
#include "olt-client/errors.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace oltclient {
namespace transport {

namespace {
constexpr int READ_POLL_MS = 100;
constexpr size_t READ_CHUNK = 4096;

bool set_blocking(int fd, bool blocking) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(fd, F_SETFL, flags) == 0;
}

// Wait for a non-blocking connect() to finish. Returns 0 on success,
// ETIMEDOUT on timeout, or the socket error.
int wait_connected(int fd, std::chrono::milliseconds timeout) {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLOUT;
  pfd.revents = 0;

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0)
      return ETIMEDOUT;

    int r = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (r < 0) {
      if (errno == EINTR)
        continue;
      return errno;
    }
    if (r == 0)
      return ETIMEDOUT;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
      return errno;
    return so_error;
  }
}
} // namespace

TcpTransport::TcpTransport(const std::string &device_name,
                           const std::string &host, uint16_t port,
                           std::chrono::milliseconds connect_timeout)
    : device_name_(device_name), host_(host), port_(port),
      connect_timeout_(connect_timeout) {}

TcpTransport::~TcpTransport() { disconnect(); }

int TcpTransport::open_socket() {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *results = nullptr;
  std::string port_str = std::to_string(port_);
  int rc = getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &results);
  if (rc != 0) {
    throw ConnectionError(fmt::format("Cannot resolve {}: {}", host_,
                                      gai_strerror(rc)));
  }

  std::string last_error = "no usable address";
  int fd = -1;
  for (auto *ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = strerror(errno);
      continue;
    }

    if (!set_blocking(fd, false)) {
      last_error = strerror(errno);
      close(fd);
      fd = -1;
      continue;
    }

    int err = 0;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
      err = (errno == EINPROGRESS) ? wait_connected(fd, connect_timeout_)
                                   : errno;
    }

    if (err == 0 && set_blocking(fd, true)) {
      break;
    }

    last_error = (err == ETIMEDOUT) ? "connection timeout" : strerror(err);
    close(fd);
    fd = -1;
  }
  freeaddrinfo(results);

  if (fd < 0) {
    throw ConnectionError(fmt::format("Cannot connect to {}:{}: {}", host_,
                                      port_, last_error));
  }
  return fd;
}

void TcpTransport::connect() {
  if (connected_)
    return;

  // A previous reader may still be parked after the peer closed
  disconnect();

  LOG_DEBUG(device_name_, "CONNECT", "Connecting to {}:{}", host_, port_);
  fd_ = open_socket();

  {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    buffer_.clear();
  }
  filter_.reset();
  bytes_received_ = 0;

  connected_ = true;
  running_ = true;
  reader_thread_ = std::thread([this]() { reader_loop(); });

  LOG_DEBUG(device_name_, "CONNECT", "Connected to {}:{}", host_, port_);
}

void TcpTransport::disconnect() {
  if (fd_ >= 0 && connected_) {
    // Polite logout; the result does not matter
    static const char quit[] = "quit\r\n";
    if (!write_all(quit, sizeof(quit) - 1)) {
      LOG_DEBUG(device_name_, "DISCONNECT", "quit not delivered: {}",
                strerror(errno));
    }
  }

  connected_ = false;
  running_ = false;

  if (fd_ >= 0) {
    shutdown(fd_, SHUT_RDWR);
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
    LOG_DEBUG(device_name_, "DISCONNECT", "Socket closed");
  }

  std::lock_guard<std::mutex> lock(buffer_mutex_);
  buffer_.clear();
}

bool TcpTransport::is_connected() const { return connected_.load(); }

bool TcpTransport::write_all(const char *data, size_t len) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  size_t sent = 0;
  while (sent < len) {
    ssize_t w = send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR)
      continue;
    if (w <= 0)
      return false;
    sent += static_cast<size_t>(w);
  }
  return true;
}

void TcpTransport::send_line(const std::string &line) {
  if (!connected_ || fd_ < 0) {
    throw ConnectionError("Not connected to " + host_);
  }

  std::string wire = line + "\r\n";
  if (!write_all(wire.data(), wire.size())) {
    connected_ = false;
    throw ConnectionError(
        fmt::format("Write to {}:{} failed: {}", host_, port_,
                    strerror(errno)));
  }
}

std::string TcpTransport::take_buffer() {
  std::lock_guard<std::mutex> lock(buffer_mutex_);
  std::string out;
  out.swap(buffer_);
  return out;
}

void TcpTransport::reader_loop() {
  char chunk[READ_CHUNK];

  while (running_.load(std::memory_order_relaxed)) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int r = poll(&pfd, 1, READ_POLL_MS);
    if (r < 0) {
      if (errno == EINTR)
        continue;
      LOG_WARN(device_name_, "READ", "poll failed: {}", strerror(errno));
      break;
    }
    if (r == 0)
      continue;

    ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      if (running_)
        LOG_WARN(device_name_, "READ", "recv failed: {}", strerror(errno));
      break;
    }
    if (n == 0) {
      if (running_)
        LOG_DEBUG(device_name_, "READ", "Connection closed by peer");
      break;
    }

    std::string replies;
    std::string data = filter_.feed(chunk, static_cast<size_t>(n), replies);
    if (!replies.empty() && !write_all(replies.data(), replies.size())) {
      LOG_WARN(device_name_, "READ", "Telnet option refusal not sent: {}",
               strerror(errno));
    }
    if (!data.empty()) {
      bytes_received_ += data.size();
      std::lock_guard<std::mutex> lock(buffer_mutex_);
      buffer_ += data;
    }
  }

  connected_ = false;
}

} // namespace transport
} // namespace oltclient
