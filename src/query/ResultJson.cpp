#include "olt-client/query/ResultJson.hpp"
#include "olt-client/parser/OutputParsers.hpp"

namespace oltclient {

void to_json(nlohmann::json &j, const UnitStatusRecord &r) {
  j = nlohmann::json{{"unit_id", r.unit_id},
                     {"state", to_string(r.state)},
                     {"mac_address", r.mac_address},
                     {"distance_meters", r.distance_meters},
                     {"rtt", r.rtt},
                     {"last_reg_time", r.last_reg_time},
                     {"last_dereg_time", r.last_dereg_time},
                     {"last_dereg_reason", r.last_dereg_reason},
                     {"alive_time", r.alive_time}};

  if (auto seconds = parser::parse_alive_seconds(r.alive_time)) {
    j["alive_seconds"] = *seconds;
  } else {
    j["alive_seconds"] = nullptr;
  }
}

void to_json(nlohmann::json &j, const OpticalDiagnostics &o) {
  j = nlohmann::json{{"temperature", o.temperature},
                     {"supply_voltage", o.supply_voltage},
                     {"bias_current", o.bias_current},
                     {"transmit_power", o.transmit_power},
                     {"receive_power", o.receive_power}};
  if (o.rx_power_dbm) {
    j["rx_power_dbm"] = *o.rx_power_dbm;
  } else {
    j["rx_power_dbm"] = nullptr;
  }
}

void to_json(nlohmann::json &j, const UnitCapability &c) {
  j = nlohmann::json{{"ge_ports", c.ge_ports},
                     {"fe_ports", c.fe_ports},
                     {"pots_ports", c.pots_ports},
                     {"pon_interfaces", c.pon_interfaces},
                     {"protection_type", c.protection_type}};
}

void to_json(nlohmann::json &j, const UnitInfo &u) {
  j = nlohmann::json{{"device", u.device},
                     {"epon_port", u.epon_port},
                     {"description", u.description},
                     {"status", u.status}};

  j["optical"] = u.optical ? nlohmann::json(*u.optical) : nlohmann::json();
  j["link_status"] =
      u.link ? nlohmann::json(to_string(u.link->status)) : nlohmann::json();
  j["capability"] =
      u.capability ? nlohmann::json(*u.capability) : nlohmann::json();
}

void to_json(nlohmann::json &j, const QueryResult &r) {
  j = nlohmann::json{{"outcome", to_string(r.outcome)},
                     {"from_cache", r.from_cache}};
  if (!r.error_message.empty()) {
    j["error"] = r.error_message;
  }
  j["unit"] = r.unit ? nlohmann::json(*r.unit) : nlohmann::json();
}

} // namespace oltclient
