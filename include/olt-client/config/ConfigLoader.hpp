#pragma once
#include "olt-client/export.h"
#include "olt-client/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace oltclient {
namespace config {

struct ValidationError {
  std::string path;
  std::string message;
  int line{0};
  int column{0};
};

struct ValidationResult {
  bool valid{true};
  std::vector<ValidationError> errors;
  std::vector<std::string> warnings;
};

/// Everything a devices file describes
struct OLT_CLIENT_API ClientConfig {
  std::vector<DeviceConfig> devices;
  std::chrono::milliseconds session_idle_ttl{std::chrono::minutes(5)};
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds cache_ttl{std::chrono::minutes(5)};
  std::string log_file{"olt_client.log"};
  std::string log_level{"info"};

  /// Device by name (case-insensitive), nullptr if absent
  const DeviceConfig *find_device(const std::string &name) const;

  /// First enabled device whose interface pattern appears in the Mikrotik
  /// interface name
  const DeviceConfig *route_interface(const std::string &interface_name) const;
};

class OLT_CLIENT_API ConfigLoader {
public:
  /// Check a devices file and report every problem; never throws
  static ValidationResult validate_file(const std::string &path);
  static ValidationResult validate_string(const std::string &yaml);

  /// Validate then build the configuration. Throws ConfigError listing the
  /// validation errors.
  static ClientConfig load_file(const std::string &path);
  static ClientConfig load_string(const std::string &yaml);

  static std::string format_errors(const ValidationResult &result);
};

} // namespace config
} // namespace oltclient
