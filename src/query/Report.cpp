#include "olt-client/query/Report.hpp"

#include <fmt/format.h>

namespace oltclient {
namespace query {

std::string escape_html(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string format_unit_report(const UnitInfo &unit) {
  const auto &s = unit.status;
  bool online = s.state == UnitState::Online;

  std::string out = fmt::format("{} <b>ONU Status:</b> {}",
                                online ? "🟢" : "🔴", to_string(s.state));

  if (unit.link) {
    bool up = unit.link->status == LinkStatus::Up;
    out += fmt::format("\n{} <b>Link Status:</b> {}", up ? "🔗" : "⛓️‍💥",
                       to_string(unit.link->status));
  }

  out += fmt::format("\n  - <b>ONU ID:</b> <code>{}</code>",
                     escape_html(s.unit_id));
  out += fmt::format("\n  - <b>MAC:</b> <code>{}</code>",
                     escape_html(s.mac_address));
  out += fmt::format("\n  - <b>Distance:</b> {}m", s.distance_meters);
  out += fmt::format("\n  - <b>Uptime:</b> {}", escape_html(s.alive_time));

  if (s.last_reg_time != kNotAvailable) {
    out += fmt::format("\n  - <b>Last Registration:</b> {}",
                       escape_html(s.last_reg_time));
  }

  // Only units that have been offline at least once carry these columns
  if (s.last_dereg_time != kNotAvailable) {
    out += fmt::format("\n  - <b>Last Offline:</b> {}",
                       escape_html(s.last_dereg_time));
    if (s.last_dereg_reason != kNotAvailable) {
      out += fmt::format(" ({})", escape_html(s.last_dereg_reason));
    }
  }

  if (unit.optical) {
    const auto &o = *unit.optical;
    out += "\n\n<b>💡 Optical Info:</b>";
    out += fmt::format("\n  - <b>Temperature:</b> {}", o.temperature);
    out += fmt::format("\n  - <b>Voltage:</b> {}", o.supply_voltage);
    out += fmt::format("\n  - <b>Bias Current:</b> {}", o.bias_current);
    out += fmt::format("\n  - <b>TX Power:</b> {}", o.transmit_power);
    out += fmt::format("\n  - <b>RX Power:</b> {}", o.receive_power);
  }

  if (unit.capability) {
    const auto &c = *unit.capability;
    out += "\n\n<b>🧩 Capability:</b>";
    out += fmt::format("\n  - <b>GE Ports:</b> {}", c.ge_ports);
    out += fmt::format("\n  - <b>FE Ports:</b> {}", c.fe_ports);
    out += fmt::format("\n  - <b>POTS Ports:</b> {}", c.pots_ports);
    out += fmt::format("\n  - <b>PON Interfaces:</b> {}", c.pon_interfaces);
    out += fmt::format("\n  - <b>Protection:</b> {}",
                       escape_html(c.protection_type));
  }

  return out;
}

} // namespace query
} // namespace oltclient
