#include "olt-client/errors.hpp"
#include "olt-client/query/QueryOrchestrator.hpp"
#include "olt-client/transport/TcpTransport.hpp"
#include "test_utils/FakeOltDevice.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace oltclient;
using namespace oltclient::test;
using namespace std::chrono_literals;

namespace {

const std::string IAC_DO_ECHO("\xFF\xFD\x01", 3);
const std::string IAC_WONT_ECHO("\xFF\xFC\x01", 3);

/// Serves a FakeOltDevice over a loopback TCP socket, one client at a time
class LoopbackOltServer {
public:
  explicit LoopbackOltServer(FakeOltDevice &device) : device_(device) {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    int yes = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) !=
            0 ||
        listen(listen_fd_, 4) != 0) {
      throw std::runtime_error("loopback server setup failed");
    }

    socklen_t len = sizeof(addr);
    getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    running_ = true;
    thread_ = std::thread([this]() { serve(); });
  }

  ~LoopbackOltServer() {
    running_ = false;
    if (thread_.joinable())
      thread_.join();
    close(listen_fd_);
  }

  uint16_t port() const { return port_; }

  std::string raw_received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return raw_;
  }

  /// Close the current client connection from the server side
  void drop_client() { drop_requested_ = true; }

private:
  void serve() {
    while (running_) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      if (poll(&pfd, 1, 50) <= 0)
        continue;
      int client = accept(listen_fd_, nullptr, nullptr);
      if (client < 0)
        continue;
      handle_client(client);
      close(client);
    }
  }

  void send_all(int fd, const std::string &data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t w = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (w <= 0)
        return;
      sent += static_cast<size_t>(w);
    }
  }

  void handle_client(int fd) {
    send_all(fd, IAC_DO_ECHO + device_.on_connect());

    std::string pending;
    char chunk[1024];
    while (running_ && !drop_requested_) {
      pollfd pfd{fd, POLLIN, 0};
      if (poll(&pfd, 1, 50) <= 0)
        continue;
      ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
      if (n <= 0)
        break;

      {
        std::lock_guard<std::mutex> lock(mutex_);
        raw_.append(chunk, static_cast<size_t>(n));
      }

      for (ssize_t i = 0; i < n; ++i) {
        // Client option replies are three-byte IAC sequences
        if (static_cast<uint8_t>(chunk[i]) == 0xFF) {
          i += 2;
          continue;
        }
        pending.push_back(chunk[i]);
      }

      size_t eol;
      while ((eol = pending.find("\r\n")) != std::string::npos) {
        std::string line = pending.substr(0, eol);
        pending.erase(0, eol + 2);
        if (line == "quit")
          return;
        send_all(fd, device_.handle_line(line));
      }
    }
    drop_requested_ = false;
  }

  FakeOltDevice &device_;
  int listen_fd_{-1};
  uint16_t port_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> drop_requested_{false};
  std::thread thread_;

  mutable std::mutex mutex_;
  std::string raw_;
};

bool wait_for(const std::function<bool()> &condition,
              std::chrono::milliseconds timeout = 2s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition())
      return true;
    std::this_thread::sleep_for(5ms);
  }
  return condition();
}

/// Port with nothing listening on it
uint16_t unused_port() {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
  close(fd);
  return ntohs(addr.sin_port);
}

} // namespace

class TcpTransportTest : public ::testing::Test {
protected:
  DeviceConfig loopback_config() {
    DeviceConfig config = fast_device_config();
    config.port = server_.port();
    config.connect_timeout = 1000ms;
    config.command_timeout = 1000ms;
    auto &t = config.timings;
    t.login_prompt = t.password_prompt = t.user_prompt = 1000ms;
    t.enable_password_prompt = t.privileged_prompt = t.paging_prompt = 1000ms;
    t.config_prompt = t.interface_prompt = t.exit_prompt = 1000ms;
    t.description_query = t.detail_query = 1000ms;
    return config;
  }

  FakeOltDevice device_;
  LoopbackOltServer server_{device_};
};

TEST_F(TcpTransportTest, RefusesOptionsAndStripsNegotiation) {
  transport::TcpTransport transport("OLT1", "127.0.0.1", server_.port(), 1s);
  transport.connect();
  ASSERT_TRUE(transport.is_connected());

  std::string received;
  ASSERT_TRUE(wait_for([&]() {
    received += transport.take_buffer();
    return received.find("Login: ") != std::string::npos;
  }));
  EXPECT_EQ(received.find('\xFF'), std::string::npos);
  EXPECT_TRUE(wait_for([&]() {
    return server_.raw_received().find(IAC_WONT_ECHO) != std::string::npos;
  }));
  EXPECT_GT(transport.bytes_received(), 0u);
}

TEST_F(TcpTransportTest, SendLineAppendsCrLf) {
  transport::TcpTransport transport("OLT1", "127.0.0.1", server_.port(), 1s);
  transport.connect();
  transport.send_line("admin");

  EXPECT_TRUE(wait_for([&]() {
    return server_.raw_received().find("admin\r\n") != std::string::npos;
  }));
  std::string received;
  EXPECT_TRUE(wait_for([&]() {
    received += transport.take_buffer();
    return received.find("Password: ") != std::string::npos;
  }));
}

TEST_F(TcpTransportTest, DisconnectSendsQuit) {
  transport::TcpTransport transport("OLT1", "127.0.0.1", server_.port(), 1s);
  transport.connect();
  transport.disconnect();

  EXPECT_FALSE(transport.is_connected());
  EXPECT_THROW(transport.send_line("enable"), ConnectionError);
  EXPECT_TRUE(wait_for([&]() {
    return server_.raw_received().find("quit\r\n") != std::string::npos;
  }));
}

TEST_F(TcpTransportTest, PeerCloseIsNoticed) {
  transport::TcpTransport transport("OLT1", "127.0.0.1", server_.port(), 1s);
  transport.connect();
  std::string received;
  ASSERT_TRUE(wait_for([&]() {
    received += transport.take_buffer();
    return received.find("Login: ") != std::string::npos;
  }));

  server_.drop_client();
  EXPECT_TRUE(wait_for([&]() { return !transport.is_connected(); }));
}

TEST_F(TcpTransportTest, RefusedConnectionThrows) {
  transport::TcpTransport transport("OLT1", "127.0.0.1", unused_port(), 500ms);
  EXPECT_THROW(transport.connect(), ConnectionError);
  EXPECT_FALSE(transport.is_connected());
}

TEST_F(TcpTransportTest, UnresolvableHostThrows) {
  transport::TcpTransport transport("OLT1", "no-such-host.invalid", 23, 500ms);
  EXPECT_THROW(transport.connect(), ConnectionError);
}

TEST_F(TcpTransportTest, QueryOverLoopback) {
  FakeUnit unit;
  unit.index = 3;
  unit.description = "rogersaade";
  device_.add_unit("0/1", unit);

  session::SessionPool pool(session::tcp_transport_factory());
  query::ResultCache cache;
  query::QueryOrchestrator orchestrator(loopback_config(), pool, cache);

  auto result = orchestrator.get_unit_info("RogerSaade");
  ASSERT_EQ(result.outcome, QueryOutcome::Found) << result.error_message;
  EXPECT_EQ(result.unit->status.unit_id, "EPON0/1:3");
  ASSERT_TRUE(result.unit->optical.has_value());
  ASSERT_TRUE(result.unit->optical->rx_power_dbm.has_value());
  EXPECT_DOUBLE_EQ(*result.unit->optical->rx_power_dbm, -14.55);
  EXPECT_EQ(device_.login_count(), 1u);

  pool.shutdown();
  EXPECT_TRUE(wait_for([&]() {
    return server_.raw_received().find("quit\r\n") != std::string::npos;
  }));
}
