#include "olt-client/types.hpp"

namespace oltclient {

const char *to_string(UnitState state) {
  return state == UnitState::Online ? "Online" : "Offline";
}

const char *to_string(LinkStatus status) {
  return status == LinkStatus::Up ? "Up" : "Down";
}

const char *to_string(QueryOutcome outcome) {
  switch (outcome) {
  case QueryOutcome::Found:
    return "found";
  case QueryOutcome::NotFound:
    return "not_found";
  case QueryOutcome::DeviceUnreachable:
    return "device_unreachable";
  case QueryOutcome::Disabled:
    return "disabled";
  }
  return "unknown";
}

} // namespace oltclient
