#pragma once
#include "olt-client/export.h"
#include "olt-client/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace oltclient {
namespace parser {

/// Rows of `show onu status`. Lines that do not carry the core columns
/// (id, state, MAC, distance, RTT) are skipped; any other column that cannot
/// be read is left as "N/A".
///
///   ONU-ID     Status  MAC Address        Distance(m) RTT(TQ) LastRegTime
///   EPON0/1:1  online  74:a0:63:7e:d6:a8  1436        972     1907/12/27 ...
OLT_CLIENT_API std::vector<UnitStatusRecord>
parse_unit_status_table(const std::string &output);

/// First token after "description :" in `show onu <i> description`
OLT_CLIENT_API std::optional<std::string>
parse_unit_description(const std::string &output);

/// `show onu <i> ctc opm_diag`. Empty when neither temperature nor RX power
/// is present.
OLT_CLIENT_API std::optional<OpticalDiagnostics>
parse_optical_diagnostics(const std::string &output);

/// `show onu <i> ctc eth 1 linkstate`
OLT_CLIENT_API std::optional<LinkState>
parse_link_state(const std::string &output);

/// `show onu <i> ctc capability`. Empty when none of the GE, FE or
/// protection labels are present.
OLT_CLIENT_API std::optional<UnitCapability>
parse_unit_capability(const std::string &output);

/// "EPON0/1:3" -> "3"
OLT_CLIENT_API std::optional<std::string>
unit_index_from_id(const std::string &unit_id);

/// "42 02:24:43" -> 3637483. Empty for "N/A" or anything unreadable.
OLT_CLIENT_API std::optional<uint64_t>
parse_alive_seconds(const std::string &alive_time);

/// Last "-" separated segment of a Mikrotik interface name that contains
/// `pattern` (case-insensitive), e.g.
/// "(VM-PPPoe4)-vlan2021-olt1-zone7-jamildib" + "OLT1" -> "jamildib".
OLT_CLIENT_API std::optional<std::string>
extract_unit_username(const std::string &interface_name,
                      const std::string &pattern);

/// ASCII lower-case copy
OLT_CLIENT_API std::string to_lower(const std::string &text);

} // namespace parser
} // namespace oltclient
