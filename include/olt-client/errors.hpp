#pragma once

#include <stdexcept>
#include <string>

namespace oltclient {

/// Base for hard failures inside the client. Parse problems are never
/// reported this way; parsers return an empty optional instead.
class OltError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Transport could not be established, was refused, or was lost mid-query
class ConnectionError : public OltError {
public:
  using OltError::OltError;
};

/// An expected prompt never appeared during login or enable
class AuthenticationError : public OltError {
public:
  using OltError::OltError;
};

/// Device file missing, unreadable or invalid
class ConfigError : public OltError {
public:
  using OltError::OltError;
};

} // namespace oltclient
