#include "olt-client/session/ContextNavigator.hpp"
#include "olt-client/Logger.hpp"

namespace oltclient {
namespace session {

namespace {
const std::regex CONFIG_PROMPT(R"(\(config\)#)");
// Matches only once the prompt's closing "#" has arrived
const std::regex INTERFACE_PROMPT(R"(\(config-pon-[^)\s]*\)#)");
const std::regex PRIVILEGED_PROMPT("#");
} // namespace

ContextNavigator::ContextNavigator(PromptSynchronizer &sync,
                                   const DeviceConfig &config)
    : sync_(sync), config_(config) {}

bool ContextNavigator::enter(const std::string &port) {
  const auto &t = config_.timings;

  SyncResult config = sync_.exchange("configure terminal", CONFIG_PROMPT,
                                     t.navigation_delay, t.config_prompt);
  if (!config.matched) {
    LOG_DEBUG(config_.name, "CONTEXT", "No config prompt before epon {}",
              port);
  }

  SyncResult iface = sync_.exchange("interface epon " + port, INTERFACE_PROMPT,
                                    t.navigation_delay, t.interface_prompt);

  // Landing in another port's context must not count as success
  std::string seen = iface.text();
  if (!iface.matched || iface.prompt.find("config-pon-" + port + ")") ==
                            std::string::npos) {
    LOG_WARN(config_.name, "CONTEXT", "Failed to select interface epon {}: {}",
             port, OltLogger::excerpt(seen));
    current_.reset();
    return false;
  }

  current_ = port;
  LOG_DEBUG(config_.name, "CONTEXT", "Entered epon {}", port);
  return true;
}

bool ContextNavigator::exit() {
  const auto &t = config_.timings;
  SyncResult r = sync_.exchange("exit", PRIVILEGED_PROMPT, t.navigation_delay,
                                t.exit_prompt);
  if (current_) {
    LOG_DEBUG(config_.name, "CONTEXT", "Left epon {}", *current_);
  }
  current_.reset();
  return r.matched;
}

} // namespace session
} // namespace oltclient
