#pragma once
#include "olt-client/export.h"

#include <string>

namespace oltclient {
namespace transport {

/// One raw byte-stream connection to a device. Inbound bytes accumulate in
/// an internal buffer until take_buffer() drains them; there is no framing.
class OLT_CLIENT_API ByteStreamTransport {
public:
  virtual ~ByteStreamTransport() = default;

  /// Open the connection. Throws ConnectionError on refusal or timeout.
  virtual void connect() = 0;

  /// Close the connection and drop any buffered bytes. Safe to repeat.
  virtual void disconnect() = 0;

  virtual bool is_connected() const = 0;

  /// Write one command line followed by CR LF.
  /// Throws ConnectionError when the connection is gone.
  virtual void send_line(const std::string &line) = 0;

  /// Return everything received since the previous call and clear it.
  virtual std::string take_buffer() = 0;
};

} // namespace transport
} // namespace oltclient
