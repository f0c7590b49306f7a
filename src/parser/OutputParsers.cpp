#include "olt-client/parser/OutputParsers.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace oltclient {
namespace parser {

namespace {

constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase;

// Core columns of a status row: id, state, MAC, distance, RTT
const std::regex STATUS_CORE(
    R"(^\s*(EPON\d+/\d+:\d+)\s+(online|offline)\s+([0-9a-f:]+)\s+(\d+)\s+(\d+)(?:\s+|$))",
    ICASE);
const std::regex REG_TIME(
    R"(^(\d{4}/\d{2}/\d{2}\s+\d{2}:\d{2}:\d{2}|N/A))", ICASE);
const std::regex DEREG_TIME(
    R"(^\s+(\d{4}/\d{2}/\d{2}\s+\d{2}:\d{2}:\d{2}|N/A))", ICASE);
// Reason text has no terminator; it ends where the alive-time digits (or an
// N/A column, or the line) begin.
const std::regex DEREG_REASON(
    R"(^\s+([A-Za-z][A-Za-z\s/]*?)(?=\s+(?:\d|N/A\b)|\s*$))", ICASE);
const std::regex ALIVE_TIME(
    R"((\d+\s+\d{2}:\d{2}:\d{2}|\d{2}:\d{2}:\d{2})\s*(?:N/A)?\s*$)", ICASE);

const std::regex DESCRIPTION(R"(description\s*:\s*(\S+))", ICASE);

// Label spellings seen across firmware builds
const std::regex TEMPERATURE(
    R"(Temp(?:erature|rature|reature|erture|eratrue)\s*:\s*(-?[\d.]+)\s*(?:°|deg)?\s*C)",
    ICASE);
const std::regex SUPPLY_VOLTAGE(
    R"(Sup+l*y\s*Vol(?:tage|atge|gate)\s*:\s*([\d.]+)\s*V)", ICASE);
const std::regex BIAS_CURRENT(R"(TX\s*Bias\s*Cur+ent\s*:\s*([\d.]+)\s*mA)",
                              ICASE);
const std::regex TX_POWER(
    R"(TX\s*Pow(?:er|re)\s*:\s*([\d.]+)\s*mW\s*\(\s*([-\d.]+)\s*dBm\s*\))",
    ICASE);
const std::regex RX_POWER(
    R"(RX\s*Pow(?:er|re)\s*:\s*([\d.]+)\s*mW\s*\(\s*([-\d.]+)\s*dBm\s*\))",
    ICASE);

const std::regex LINK_STATE_LABELLED(
    R"((?:Ethernet\s*)?(?:link\s*)?state\s*:\s*(up|down))", ICASE);
const std::regex LINK_STATE_BARE(R"(\b(up|down)\b)", ICASE);

const std::regex GE_PORTS(R"(\bGE\s*Ports?(?:\s*Num(?:ber)?)?\s*:\s*(\d+))",
                          ICASE);
const std::regex FE_PORTS(R"(\bFE\s*Ports?(?:\s*Num(?:ber)?)?\s*:\s*(\d+))",
                          ICASE);
const std::regex POTS_PORTS(
    R"(\bPOTS\s*Ports?(?:\s*Num(?:ber)?)?\s*:\s*(\d+))", ICASE);
const std::regex PON_INTERFACES(
    R"((?:Number\s*of\s*)?PON\s*(?:Interfaces?|If)\s*:\s*(\d+))", ICASE);
// "Protection Type" is misspelled by several firmware releases
const std::regex PROTECTION_TYPE(
    R"(Prot(?:ection|ction|ecion|ect)\s*Type\s*:\s*([^\r\n]+))", ICASE);

const std::regex UNIT_INDEX(R"(:(\d+)$)");
const std::regex ALIVE_PARTS(R"(^\s*(?:(\d+)\s+)?(\d{1,2}):(\d{2}):(\d{2})\s*$)");

// regex_search that reports a failed match instead of throwing
bool search(const std::string &text, std::smatch &m, const std::regex &re) {
  try {
    return std::regex_search(text, m, re);
  } catch (const std::regex_error &) {
    return false;
  }
}

uint32_t to_u32(const std::string &digits) {
  uint32_t value = 0;
  auto res =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  return res.ec == std::errc() ? value : 0;
}

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

// Registration / deregistration columns that follow the RTT
void parse_history(const std::string &rest, UnitStatusRecord &rec,
                   std::string &remainder) {
  remainder = rest;
  std::smatch m;

  if (!search(rest, m, REG_TIME))
    return;
  rec.last_reg_time = m.str(1);
  std::string after_reg = m.suffix().str();
  remainder = after_reg;

  if (!search(after_reg, m, DEREG_TIME))
    return;
  rec.last_dereg_time = m.str(1);
  std::string after_dereg = m.suffix().str();
  remainder = after_dereg;

  if (!search(after_dereg, m, DEREG_REASON))
    return;
  std::string reason = trim(m.str(1));
  if (!reason.empty())
    rec.last_dereg_reason = reason;
  remainder = m.suffix().str();
}

} // namespace

std::string to_lower(const std::string &text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::vector<UnitStatusRecord>
parse_unit_status_table(const std::string &output) {
  std::vector<UnitStatusRecord> units;
  std::istringstream lines(output);
  std::string line;

  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    std::smatch core;
    if (!search(line, core, STATUS_CORE))
      continue;

    UnitStatusRecord rec;
    rec.unit_id = core.str(1);
    rec.state = to_lower(core.str(2)) == "online" ? UnitState::Online
                                                  : UnitState::Offline;
    rec.mac_address = core.str(3);
    rec.distance_meters = to_u32(core.str(4));
    rec.rtt = to_u32(core.str(5));

    std::string remainder;
    parse_history(core.suffix().str(), rec, remainder);

    // Alive time sits at the end, after whatever the history walk consumed
    std::smatch alive;
    if (search(remainder, alive, ALIVE_TIME)) {
      rec.alive_time = trim(alive.str(1));
    }

    units.push_back(std::move(rec));
  }

  return units;
}

std::optional<std::string> parse_unit_description(const std::string &output) {
  std::smatch m;
  if (!search(output, m, DESCRIPTION))
    return std::nullopt;
  return trim(m.str(1));
}

std::optional<OpticalDiagnostics>
parse_optical_diagnostics(const std::string &output) {
  std::smatch temp, voltage, current, tx, rx;
  bool has_temp = search(output, temp, TEMPERATURE);
  bool has_rx = search(output, rx, RX_POWER);

  if (!has_temp && !has_rx)
    return std::nullopt;

  OpticalDiagnostics diag;
  if (has_temp)
    diag.temperature = temp.str(1) + " °C";
  if (search(output, voltage, SUPPLY_VOLTAGE))
    diag.supply_voltage = voltage.str(1) + " V";
  if (search(output, current, BIAS_CURRENT))
    diag.bias_current = current.str(1) + " mA";
  if (search(output, tx, TX_POWER))
    diag.transmit_power = tx.str(1) + " mW (" + tx.str(2) + " dBm)";
  if (has_rx) {
    diag.receive_power = rx.str(1) + " mW (" + rx.str(2) + " dBm)";
    std::string dbm = rx.str(2);
    char *end = nullptr;
    double value = std::strtod(dbm.c_str(), &end);
    if (end != dbm.c_str())
      diag.rx_power_dbm = value;
  }
  return diag;
}

std::optional<LinkState> parse_link_state(const std::string &output) {
  std::smatch m;
  if (!search(output, m, LINK_STATE_LABELLED) &&
      !search(output, m, LINK_STATE_BARE)) {
    return std::nullopt;
  }

  LinkState state;
  state.status = to_lower(m.str(1)) == "up" ? LinkStatus::Up : LinkStatus::Down;
  return state;
}

std::optional<UnitCapability>
parse_unit_capability(const std::string &output) {
  std::smatch ge, fe, pots, pon, prot;
  bool has_ge = search(output, ge, GE_PORTS);
  bool has_fe = search(output, fe, FE_PORTS);
  bool has_prot = search(output, prot, PROTECTION_TYPE);

  if (!has_ge && !has_fe && !has_prot)
    return std::nullopt;

  UnitCapability cap;
  if (has_ge)
    cap.ge_ports = ge.str(1);
  if (has_fe)
    cap.fe_ports = fe.str(1);
  if (search(output, pots, POTS_PORTS))
    cap.pots_ports = pots.str(1);
  if (search(output, pon, PON_INTERFACES))
    cap.pon_interfaces = pon.str(1);
  if (has_prot) {
    std::string value = trim(prot.str(1));
    if (!value.empty())
      cap.protection_type = value;
  }
  return cap;
}

std::optional<std::string> unit_index_from_id(const std::string &unit_id) {
  std::smatch m;
  if (!search(unit_id, m, UNIT_INDEX))
    return std::nullopt;
  return m.str(1);
}

std::optional<uint64_t> parse_alive_seconds(const std::string &alive_time) {
  std::smatch m;
  if (!search(alive_time, m, ALIVE_PARTS))
    return std::nullopt;

  uint64_t days = m[1].matched ? to_u32(m.str(1)) : 0;
  uint64_t hours = to_u32(m.str(2));
  uint64_t minutes = to_u32(m.str(3));
  uint64_t seconds = to_u32(m.str(4));
  return ((days * 24 + hours) * 60 + minutes) * 60 + seconds;
}

std::optional<std::string>
extract_unit_username(const std::string &interface_name,
                      const std::string &pattern) {
  if (interface_name.empty() || pattern.empty())
    return std::nullopt;

  if (to_lower(interface_name).find(to_lower(pattern)) == std::string::npos)
    return std::nullopt;

  auto last_dash = interface_name.rfind('-');
  if (last_dash == std::string::npos)
    return std::nullopt;

  std::string last = trim(interface_name.substr(last_dash + 1));
  if (last.empty())
    return std::nullopt;
  return last;
}

} // namespace parser
} // namespace oltclient
