#include "olt-client/session/PromptSynchronizer.hpp"
#include "olt-client/Logger.hpp"

namespace oltclient {
namespace session {

PromptSynchronizer::PromptSynchronizer(
    transport::ByteStreamTransport &transport, std::string device_name,
    std::chrono::milliseconds poll_interval)
    : transport_(transport), device_name_(std::move(device_name)),
      poll_interval_(poll_interval) {}

SyncResult PromptSynchronizer::wait_for(const std::regex &pattern,
                                        std::chrono::milliseconds timeout) {
  SyncResult result;
  std::smatch match;

  bool matched = wait_until(
      [&]() {
        pending_ += transport_.take_buffer();
        return std::regex_search(pending_, match, pattern);
      },
      timeout, poll_interval_);

  if (matched) {
    result.output = match.prefix().str();
    result.prompt = match.str(0);
    result.trailing = match.suffix().str();
    result.matched = true;
  } else {
    result.output = pending_;
    LOG_DEBUG(device_name_, "SYNC",
              "Prompt not seen within {} ms, returning {} bytes",
              timeout.count(), pending_.size());
  }
  pending_.clear();

  LOG_TRACE(device_name_, "SYNC", "<< {}",
            OltLogger::excerpt(result.text()));
  return result;
}

void PromptSynchronizer::send(const std::string &line,
                              std::chrono::milliseconds delay) {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  transport_.send_line(line);
}

SyncResult PromptSynchronizer::exchange(const std::string &line,
                                        const std::regex &pattern,
                                        std::chrono::milliseconds delay,
                                        std::chrono::milliseconds timeout) {
  LOG_TRACE(device_name_, "SYNC", ">> {}", line);
  send(line, delay);
  return wait_for(pattern, timeout);
}

void PromptSynchronizer::discard_pending() {
  pending_.clear();
  transport_.take_buffer();
}

} // namespace session
} // namespace oltclient
