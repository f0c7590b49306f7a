#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace oltclient {

/// Placeholder for any field the device output did not provide
inline const std::string kNotAvailable = "N/A";

/// Per-step wait and settle times for one device session
struct SessionTimings {
  std::chrono::milliseconds poll_interval{100};

  // Login / privilege escalation
  std::chrono::milliseconds login_prompt{10000};
  std::chrono::milliseconds password_prompt{6000};
  std::chrono::milliseconds user_prompt{10000};
  std::chrono::milliseconds enable_password_prompt{6000};
  std::chrono::milliseconds privileged_prompt{10000};
  std::chrono::milliseconds paging_prompt{6000};

  // Context navigation
  std::chrono::milliseconds config_prompt{2000};
  std::chrono::milliseconds interface_prompt{2000};
  std::chrono::milliseconds exit_prompt{1000};

  // Queries (the status listing uses DeviceConfig::command_timeout)
  std::chrono::milliseconds description_query{2000};
  std::chrono::milliseconds detail_query{3000};

  // Delay before each line is written, giving the CLI time to settle
  std::chrono::milliseconds username_delay{400};
  std::chrono::milliseconds credential_delay{1000};
  std::chrono::milliseconds navigation_delay{300};
  std::chrono::milliseconds query_delay{200};
};

struct DeviceConfig {
  std::string name; // For logging and cache keys (e.g. "OLT1")
  std::string host;
  uint16_t port{23};
  std::string username{"admin"};
  std::string password;
  std::string enable_password;
  bool enabled{true};
  std::chrono::milliseconds connect_timeout{20000};
  std::chrono::milliseconds command_timeout{10000};

  // EPON ports searched in order
  std::vector<std::string> epon_ports{"0/1", "0/2", "0/3", "0/4"};

  // Substring identifying this OLT inside Mikrotik interface names
  std::string interface_pattern;

  // Fetch optical / link / capability blocks for a matched unit
  bool fetch_details{true};

  SessionTimings timings;
};

enum class UnitState { Online, Offline };

/// One row of `show onu status`
struct UnitStatusRecord {
  std::string unit_id; // e.g. "EPON0/1:3"
  UnitState state{UnitState::Offline};
  std::string mac_address;
  uint32_t distance_meters{0};
  uint32_t rtt{0}; // Round trip time in TQ
  std::string last_reg_time{kNotAvailable};
  std::string last_dereg_time{kNotAvailable};
  std::string last_dereg_reason{kNotAvailable};
  std::string alive_time{kNotAvailable};
};

/// `show onu <i> ctc opm_diag`
struct OpticalDiagnostics {
  std::string temperature{kNotAvailable};    // "37.00 °C"
  std::string supply_voltage{kNotAvailable}; // "3.30 V"
  std::string bias_current{kNotAvailable};   // "8.00 mA"
  std::string transmit_power{kNotAvailable}; // "1.67 mW (2.21 dBm)"
  std::string receive_power{kNotAvailable};  // "0.04 mW (-14.56 dBm)"
  std::optional<double> rx_power_dbm;
};

enum class LinkStatus { Up, Down };

/// `show onu <i> ctc eth 1 linkstate`
struct LinkState {
  LinkStatus status{LinkStatus::Down};
};

/// `show onu <i> ctc capability`
struct UnitCapability {
  std::string ge_ports{kNotAvailable};
  std::string fe_ports{kNotAvailable};
  std::string pots_ports{kNotAvailable};
  std::string pon_interfaces{kNotAvailable};
  std::string protection_type{kNotAvailable};
};

/// Composite record handed back to callers
struct UnitInfo {
  UnitStatusRecord status;
  std::string description;
  std::string epon_port; // "0/1"
  std::string device;    // DeviceConfig::name that answered
  std::optional<OpticalDiagnostics> optical;
  std::optional<LinkState> link;
  std::optional<UnitCapability> capability;
};

enum class QueryOutcome { Found, NotFound, DeviceUnreachable, Disabled };

struct QueryResult {
  QueryOutcome outcome{QueryOutcome::NotFound};
  std::optional<UnitInfo> unit;
  std::string error_message;
  bool from_cache{false};

  bool found() const { return outcome == QueryOutcome::Found; }
};

const char *to_string(UnitState state);
const char *to_string(LinkStatus status);
const char *to_string(QueryOutcome outcome);

} // namespace oltclient
