#pragma once
#include "olt-client/export.h"
#include "olt-client/session/PromptSynchronizer.hpp"
#include "olt-client/types.hpp"

#include <optional>
#include <string>

namespace oltclient {
namespace session {

/// Moves a privileged session into and out of an EPON interface context
class OLT_CLIENT_API ContextNavigator {
public:
  ContextNavigator(PromptSynchronizer &sync, const DeviceConfig &config);

  /// configure terminal + interface epon <port>. True only when the device
  /// answers with a prompt naming that exact port.
  bool enter(const std::string &port);

  /// Leave the interface context. True when a privileged prompt came back.
  bool exit();

  /// Port of the context we are in, if any
  const std::optional<std::string> &current() const { return current_; }

private:
  PromptSynchronizer &sync_;
  const DeviceConfig &config_;
  std::optional<std::string> current_;
};

} // namespace session
} // namespace oltclient
