#pragma once
#include "olt-client/export.h"
#include "olt-client/session/PromptSynchronizer.hpp"
#include "olt-client/types.hpp"

#include <string>

namespace oltclient {
namespace session {

enum class SessionStep {
  AwaitLogin,
  AwaitPassword,
  AwaitUserPrompt,
  AwaitEnablePassword,
  AwaitPrivilegedPrompt,
  DisablePaging,
  Ready,
  Failed
};

const char *to_string(SessionStep step);

struct LoginOutcome {
  bool ready{false};
  SessionStep failed_step{SessionStep::Ready};
  std::string detail; // excerpt of what the device sent instead
};

/// Drives login -> enable -> pagination disable on a fresh connection.
/// Any missing prompt stops the sequence; the owner must then discard the
/// transport.
class OLT_CLIENT_API SessionStateMachine {
public:
  SessionStateMachine(PromptSynchronizer &sync, const DeviceConfig &config);

  /// Run every step from AwaitLogin. Does not throw on a missing prompt;
  /// ConnectionError from the transport propagates.
  LoginOutcome run();

  SessionStep step() const { return step_; }

private:
  /// Perform the current step; false when its prompt never appeared
  bool advance(std::string &seen);

  PromptSynchronizer &sync_;
  const DeviceConfig &config_;
  SessionStep step_{SessionStep::AwaitLogin};
};

} // namespace session
} // namespace oltclient
