#pragma once
#include "olt-client/transport/ByteStreamTransport.hpp"
#include "olt-client/transport/TelnetFilter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace oltclient {
namespace transport {

/// Telnet-port TCP connection with a background reader thread that
/// accumulates inbound bytes
class OLT_CLIENT_API TcpTransport : public ByteStreamTransport {
public:
  TcpTransport(const std::string &device_name, const std::string &host,
               uint16_t port, std::chrono::milliseconds connect_timeout);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;

  void connect() override;
  void disconnect() override;
  bool is_connected() const override;
  void send_line(const std::string &line) override;
  std::string take_buffer() override;

  /// Total bytes received (after telnet filtering) since connect
  uint64_t bytes_received() const { return bytes_received_.load(); }

private:
  int open_socket();
  void reader_loop();
  bool write_all(const char *data, size_t len);

  std::string device_name_;
  std::string host_;
  uint16_t port_;
  std::chrono::milliseconds connect_timeout_;

  int fd_{-1};
  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};
  std::thread reader_thread_;

  mutable std::mutex buffer_mutex_;
  std::string buffer_;
  std::mutex send_mutex_;
  TelnetFilter filter_;
  std::atomic<uint64_t> bytes_received_{0};
};

} // namespace transport
} // namespace oltclient
