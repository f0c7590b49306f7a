#pragma once
#include "olt-client/export.h"
#include "olt-client/transport/ByteStreamTransport.hpp"

#include <algorithm>
#include <chrono>
#include <regex>
#include <string>
#include <thread>

namespace oltclient {
namespace session {

/// Poll `predicate` every `poll_interval` until it returns true or `timeout`
/// elapses. Returns the last predicate value; never throws on timeout.
template <typename Predicate>
bool wait_until(Predicate &&predicate, std::chrono::milliseconds timeout,
                std::chrono::milliseconds poll_interval) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (predicate())
      return true;
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return false;
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(poll_interval, remaining));
  }
}

/// What one synchronization point captured
struct SyncResult {
  std::string output; // text before the prompt (everything on timeout)
  std::string prompt; // matched prompt text, empty on timeout
  std::string trailing; // bytes after the prompt in the same read
  bool matched{false};

  /// Everything this synchronization point consumed
  std::string text() const { return output + prompt + trailing; }
};

/// Expect-style synchronization over an unframed byte stream.
///
/// Bytes drained from the transport collect in a pending buffer that is
/// searched for the prompt pattern on every poll. Each synchronization point
/// consumes the pending buffer, so content is delivered exactly once.
class OLT_CLIENT_API PromptSynchronizer {
public:
  PromptSynchronizer(transport::ByteStreamTransport &transport,
                     std::string device_name,
                     std::chrono::milliseconds poll_interval);

  /// Wait for `pattern`; on timeout return whatever arrived.
  SyncResult wait_for(const std::regex &pattern,
                      std::chrono::milliseconds timeout);

  /// Sleep `delay`, then write `line`. Throws ConnectionError.
  void send(const std::string &line, std::chrono::milliseconds delay);

  /// send() followed by wait_for()
  SyncResult exchange(const std::string &line, const std::regex &pattern,
                      std::chrono::milliseconds delay,
                      std::chrono::milliseconds timeout);

  /// Drop anything received but not yet consumed
  void discard_pending();

  const std::string &device_name() const { return device_name_; }
  std::chrono::milliseconds poll_interval() const { return poll_interval_; }

private:
  transport::ByteStreamTransport &transport_;
  std::string device_name_;
  std::chrono::milliseconds poll_interval_;
  std::string pending_;
};

} // namespace session
} // namespace oltclient
