#pragma once
#include "olt-client/export.h"
#include "olt-client/session/ContextNavigator.hpp"
#include "olt-client/session/PromptSynchronizer.hpp"
#include "olt-client/transport/ByteStreamTransport.hpp"
#include "olt-client/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace oltclient {
namespace session {

using TransportFactory =
    std::function<std::unique_ptr<transport::ByteStreamTransport>(
        const DeviceConfig &)>;

/// Factory producing a TcpTransport for the device's host and port
OLT_CLIENT_API TransportFactory tcp_transport_factory();

/// An open transport plus the synchronizer and navigator bound to it
class OLT_CLIENT_API PooledSession {
public:
  PooledSession(std::unique_ptr<transport::ByteStreamTransport> transport,
                const DeviceConfig &config);
  ~PooledSession();

  PooledSession(const PooledSession &) = delete;
  PooledSession &operator=(const PooledSession &) = delete;

  transport::ByteStreamTransport &transport() { return *transport_; }
  PromptSynchronizer &sync() { return sync_; }
  ContextNavigator &navigator() { return navigator_; }
  const DeviceConfig &config() const { return config_; }

  bool authenticated() const { return authenticated_; }
  void mark_authenticated() { authenticated_ = true; }

  std::chrono::steady_clock::time_point last_activity() const {
    return last_activity_;
  }
  void touch() { last_activity_ = std::chrono::steady_clock::now(); }

private:
  DeviceConfig config_;
  std::unique_ptr<transport::ByteStreamTransport> transport_;
  PromptSynchronizer sync_;
  ContextNavigator navigator_;
  bool authenticated_{false};
  std::chrono::steady_clock::time_point last_activity_;
};

/// Per-device storage; the mutex is held for as long as a lease exists
struct SessionSlot {
  std::mutex mutex;
  std::unique_ptr<PooledSession> session;
};

class SessionPool;

/// Exclusive use of one device's session. Releasing the lease refreshes the
/// session's idle clock.
class OLT_CLIENT_API SessionLease {
public:
  SessionLease(SessionLease &&other) noexcept = default;
  SessionLease &operator=(SessionLease &&) = delete;
  ~SessionLease();

  PooledSession &session() { return *slot_->session; }
  PromptSynchronizer &sync() { return slot_->session->sync(); }
  ContextNavigator &navigator() { return slot_->session->navigator(); }

  /// Disconnect and forget the session; the next acquire() rebuilds it.
  /// The lease must not be used for I/O afterwards.
  void invalidate();

  bool valid() const { return lock_.owns_lock() && slot_->session; }

private:
  friend class SessionPool;
  SessionLease(SessionPool &pool, SessionSlot &slot,
               std::unique_lock<std::mutex> lock);

  SessionPool *pool_;
  SessionSlot *slot_;
  std::unique_lock<std::mutex> lock_;
};

/// Keeps one authenticated session per device name and hands it out to one
/// caller at a time. Sessions idle longer than the TTL are rebuilt on the
/// next acquire().
class OLT_CLIENT_API SessionPool {
public:
  explicit SessionPool(
      TransportFactory factory = tcp_transport_factory(),
      std::chrono::milliseconds idle_ttl = std::chrono::minutes(5));
  ~SessionPool();

  SessionPool(const SessionPool &) = delete;
  SessionPool &operator=(const SessionPool &) = delete;

  /// Reuse or (re)build the device's session. Blocks while another caller
  /// holds the same device. Throws ConnectionError or AuthenticationError;
  /// nothing is left in the pool when it throws.
  SessionLease acquire(const DeviceConfig &config);

  /// Drop the device's session. Must not be called while holding its lease.
  void invalidate(const std::string &device_name);

  /// True when an authenticated session is pooled for the device
  bool has_session(const std::string &device_name);

  /// Disconnect sessions idle past the TTL. Devices currently leased are
  /// skipped. Returns the number closed.
  size_t close_idle();

  /// Disconnect every session (each sends quit first)
  void shutdown();

  std::chrono::milliseconds idle_ttl() const { return idle_ttl_; }

  struct Stats {
    uint64_t connects{0};
    uint64_t authentications{0};
    uint64_t reuses{0};
    uint64_t invalidations{0};
  };
  Stats get_stats() const;

private:
  friend class SessionLease;

  SessionSlot &slot_for(const std::string &device_name);
  SessionSlot *find_slot(const std::string &device_name);
  void record_invalidation(const std::string &device_name);

  TransportFactory factory_;
  std::chrono::milliseconds idle_ttl_;

  // Slots are never erased, so references stay valid without the map lock
  std::mutex slots_mutex_;
  std::map<std::string, std::unique_ptr<SessionSlot>> slots_;

  mutable std::mutex stats_mutex_;
  Stats stats_;
};

} // namespace session
} // namespace oltclient
