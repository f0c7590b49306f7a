#include "olt-client/session/SessionPool.hpp"
#include "olt-client/Logger.hpp"
#include "olt-client/errors.hpp"
#include "olt-client/session/SessionStateMachine.hpp"
#include "olt-client/transport/TcpTransport.hpp"

#include <vector>

namespace oltclient {
namespace session {

TransportFactory tcp_transport_factory() {
  return [](const DeviceConfig &config) {
    return std::make_unique<transport::TcpTransport>(
        config.name, config.host, config.port, config.connect_timeout);
  };
}

PooledSession::PooledSession(
    std::unique_ptr<transport::ByteStreamTransport> transport,
    const DeviceConfig &config)
    : config_(config), transport_(std::move(transport)),
      sync_(*transport_, config_.name, config_.timings.poll_interval),
      navigator_(sync_, config_),
      last_activity_(std::chrono::steady_clock::now()) {}

PooledSession::~PooledSession() {
  if (transport_->is_connected()) {
    transport_->disconnect();
  }
}

SessionLease::SessionLease(SessionPool &pool, SessionSlot &slot,
                           std::unique_lock<std::mutex> lock)
    : pool_(&pool), slot_(&slot), lock_(std::move(lock)) {}

SessionLease::~SessionLease() {
  if (lock_.owns_lock() && slot_->session) {
    slot_->session->touch();
  }
}

void SessionLease::invalidate() {
  if (!lock_.owns_lock() || !slot_->session)
    return;
  std::string name = slot_->session->config().name;
  slot_->session.reset();
  pool_->record_invalidation(name);
}

SessionPool::SessionPool(TransportFactory factory,
                         std::chrono::milliseconds idle_ttl)
    : factory_(std::move(factory)), idle_ttl_(idle_ttl) {}

SessionPool::~SessionPool() { shutdown(); }

SessionSlot &SessionPool::slot_for(const std::string &device_name) {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  auto &slot = slots_[device_name];
  if (!slot) {
    slot = std::make_unique<SessionSlot>();
  }
  return *slot;
}

SessionSlot *SessionPool::find_slot(const std::string &device_name) {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  auto it = slots_.find(device_name);
  return it == slots_.end() ? nullptr : it->second.get();
}

SessionLease SessionPool::acquire(const DeviceConfig &config) {
  SessionSlot &slot = slot_for(config.name);
  std::unique_lock<std::mutex> lock(slot.mutex);

  if (slot.session) {
    auto idle = std::chrono::steady_clock::now() - slot.session->last_activity();
    if (slot.session->authenticated() &&
        slot.session->transport().is_connected() && idle < idle_ttl_) {
      slot.session->touch();
      {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.reuses++;
      }
      LOG_DEBUG(config.name, "POOL", "Reusing authenticated session");
      return SessionLease(*this, slot, std::move(lock));
    }

    LOG_INFO(config.name, "POOL", "Session stale (idle {} ms), reconnecting",
             std::chrono::duration_cast<std::chrono::milliseconds>(idle)
                 .count());
    slot.session.reset();
  }

  auto session = std::make_unique<PooledSession>(factory_(config), config);

  LOG_INFO(config.name, "POOL", "Connecting to {}:{}", config.host,
           config.port);
  session->transport().connect();
  {
    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    stats_.connects++;
  }

  SessionStateMachine machine(session->sync(), session->config());
  LoginOutcome outcome = machine.run();
  if (!outcome.ready) {
    throw AuthenticationError(
        fmt::format("{}: {} did not complete (device sent: {})", config.name,
                    to_string(outcome.failed_step), outcome.detail));
  }

  session->mark_authenticated();
  session->touch();
  {
    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    stats_.authentications++;
  }
  LOG_INFO(config.name, "POOL", "Session ready");

  slot.session = std::move(session);
  return SessionLease(*this, slot, std::move(lock));
}

void SessionPool::invalidate(const std::string &device_name) {
  SessionSlot *slot = find_slot(device_name);
  if (!slot)
    return;

  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->session) {
    slot->session.reset();
    record_invalidation(device_name);
  }
}

bool SessionPool::has_session(const std::string &device_name) {
  SessionSlot *slot = find_slot(device_name);
  if (!slot)
    return false;

  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->session && slot->session->authenticated();
}

size_t SessionPool::close_idle() {
  std::vector<std::pair<std::string, SessionSlot *>> slots;
  {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (auto &[name, slot] : slots_) {
      slots.emplace_back(name, slot.get());
    }
  }

  size_t closed = 0;
  auto now = std::chrono::steady_clock::now();
  for (auto &[name, slot] : slots) {
    std::unique_lock<std::mutex> lock(slot->mutex, std::try_to_lock);
    if (!lock.owns_lock() || !slot->session)
      continue;
    if (now - slot->session->last_activity() >= idle_ttl_) {
      LOG_INFO(name, "POOL", "Closing idle session");
      slot->session.reset();
      closed++;
    }
  }
  return closed;
}

void SessionPool::shutdown() {
  std::vector<SessionSlot *> slots;
  {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (auto &entry : slots_) {
      slots.push_back(entry.second.get());
    }
  }

  for (auto *slot : slots) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->session) {
      LOG_DEBUG(slot->session->config().name, "POOL", "Shutting down session");
      slot->session.reset();
    }
  }
}

SessionPool::Stats SessionPool::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void SessionPool::record_invalidation(const std::string &device_name) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.invalidations++;
  }
  LOG_WARN(device_name, "POOL", "Session invalidated");
}

} // namespace session
} // namespace oltclient
