#include "olt-client/transport/TelnetFilter.hpp"

namespace oltclient {
namespace transport {

std::string TelnetFilter::feed(const char *data, size_t len,
                               std::string &replies) {
  std::string out;
  out.reserve(len);

  for (size_t i = 0; i < len; ++i) {
    auto byte = static_cast<uint8_t>(data[i]);

    switch (state_) {
    case State::Data:
      if (byte == IAC) {
        state_ = State::Command;
      } else if (byte != 0) {
        out.push_back(static_cast<char>(byte));
      }
      break;

    case State::Command:
      if (byte == IAC) {
        // Escaped 0xFF data byte
        out.push_back(static_cast<char>(byte));
        state_ = State::Data;
      } else if (byte == DO || byte == DONT || byte == WILL || byte == WONT) {
        pending_verb_ = byte;
        state_ = State::Option;
      } else if (byte == SB) {
        state_ = State::Subnegotiation;
      } else {
        // Two-byte command (NOP, GA, ...)
        state_ = State::Data;
      }
      break;

    case State::Option:
      if (pending_verb_ == DO) {
        replies.push_back(static_cast<char>(IAC));
        replies.push_back(static_cast<char>(WONT));
        replies.push_back(static_cast<char>(byte));
      } else if (pending_verb_ == WILL) {
        replies.push_back(static_cast<char>(IAC));
        replies.push_back(static_cast<char>(DONT));
        replies.push_back(static_cast<char>(byte));
      }
      pending_verb_ = 0;
      state_ = State::Data;
      break;

    case State::Subnegotiation:
      if (byte == IAC)
        state_ = State::SubnegotiationIac;
      break;

    case State::SubnegotiationIac:
      state_ = (byte == SE) ? State::Data : State::Subnegotiation;
      break;
    }
  }

  return out;
}

} // namespace transport
} // namespace oltclient
