#pragma once
#include "olt-client/export.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace oltclient {
namespace transport {

/// Strips telnet option negotiation from an inbound byte stream.
///
/// The filter keeps its state between feed() calls so a sequence split
/// across two reads is still removed. Every DO is answered with WONT and
/// every WILL with DONT; those replies are appended to `replies` for the
/// caller to write back. NUL bytes are dropped.
class OLT_CLIENT_API TelnetFilter {
public:
  static constexpr uint8_t IAC = 255;
  static constexpr uint8_t DONT = 254;
  static constexpr uint8_t DO = 253;
  static constexpr uint8_t WONT = 252;
  static constexpr uint8_t WILL = 251;
  static constexpr uint8_t SB = 250;
  static constexpr uint8_t SE = 240;

  std::string feed(const char *data, size_t len, std::string &replies);

  void reset() { state_ = State::Data; }

private:
  enum class State { Data, Command, Option, Subnegotiation, SubnegotiationIac };

  State state_{State::Data};
  uint8_t pending_verb_{0};
};

} // namespace transport
} // namespace oltclient
