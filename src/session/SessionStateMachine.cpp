#include "olt-client/session/SessionStateMachine.hpp"
#include "olt-client/Logger.hpp"

namespace oltclient {
namespace session {

namespace {
const std::regex LOGIN_PROMPT("Login:", std::regex::icase);
const std::regex PASSWORD_PROMPT("Password:", std::regex::icase);
const std::regex USER_PROMPT(">");
const std::regex PRIVILEGED_PROMPT("#");

const char *ENABLE_COMMAND = "enable";
const char *PAGING_COMMAND = "terminal length 0";
} // namespace

const char *to_string(SessionStep step) {
  switch (step) {
  case SessionStep::AwaitLogin:
    return "AwaitLogin";
  case SessionStep::AwaitPassword:
    return "AwaitPassword";
  case SessionStep::AwaitUserPrompt:
    return "AwaitUserPrompt";
  case SessionStep::AwaitEnablePassword:
    return "AwaitEnablePassword";
  case SessionStep::AwaitPrivilegedPrompt:
    return "AwaitPrivilegedPrompt";
  case SessionStep::DisablePaging:
    return "DisablePaging";
  case SessionStep::Ready:
    return "Ready";
  case SessionStep::Failed:
    return "Failed";
  }
  return "Unknown";
}

SessionStateMachine::SessionStateMachine(PromptSynchronizer &sync,
                                         const DeviceConfig &config)
    : sync_(sync), config_(config) {}

LoginOutcome SessionStateMachine::run() {
  step_ = SessionStep::AwaitLogin;
  LoginOutcome outcome;

  while (step_ != SessionStep::Ready) {
    SessionStep current = step_;
    std::string seen;
    if (!advance(seen)) {
      step_ = SessionStep::Failed;
      outcome.failed_step = current;
      outcome.detail = OltLogger::excerpt(seen);
      LOG_ERROR(config_.name, "AUTH", "{} failed, device sent: {}",
                to_string(current), outcome.detail);
      return outcome;
    }
    LOG_TRACE(config_.name, "AUTH", "{} ok", to_string(current));
  }

  outcome.ready = true;
  LOG_DEBUG(config_.name, "AUTH", "Authentication successful");
  return outcome;
}

bool SessionStateMachine::advance(std::string &seen) {
  const auto &t = config_.timings;
  SyncResult r;

  switch (step_) {
  case SessionStep::AwaitLogin:
    r = sync_.wait_for(LOGIN_PROMPT, t.login_prompt);
    step_ = SessionStep::AwaitPassword;
    break;

  case SessionStep::AwaitPassword:
    sync_.send(config_.username, t.username_delay);
    r = sync_.wait_for(PASSWORD_PROMPT, t.password_prompt);
    step_ = SessionStep::AwaitUserPrompt;
    break;

  case SessionStep::AwaitUserPrompt:
    sync_.send(config_.password, t.credential_delay);
    r = sync_.wait_for(USER_PROMPT, t.user_prompt);
    step_ = SessionStep::AwaitEnablePassword;
    break;

  case SessionStep::AwaitEnablePassword:
    sync_.send(ENABLE_COMMAND, t.credential_delay);
    r = sync_.wait_for(PASSWORD_PROMPT, t.enable_password_prompt);
    step_ = SessionStep::AwaitPrivilegedPrompt;
    break;

  case SessionStep::AwaitPrivilegedPrompt:
    sync_.send(config_.enable_password, t.credential_delay);
    r = sync_.wait_for(PRIVILEGED_PROMPT, t.privileged_prompt);
    step_ = SessionStep::DisablePaging;
    break;

  case SessionStep::DisablePaging:
    sync_.send(PAGING_COMMAND, t.credential_delay);
    r = sync_.wait_for(PRIVILEGED_PROMPT, t.paging_prompt);
    step_ = SessionStep::Ready;
    break;

  case SessionStep::Ready:
  case SessionStep::Failed:
    return step_ == SessionStep::Ready;
  }

  seen = r.text();
  return r.matched;
}

} // namespace session
} // namespace oltclient
