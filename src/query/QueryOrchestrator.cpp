#include "olt-client/query/QueryOrchestrator.hpp"
#include "olt-client/Logger.hpp"
#include "olt-client/errors.hpp"
#include "olt-client/parser/OutputParsers.hpp"

#include <regex>

namespace oltclient {
namespace query {

namespace {
const std::regex COMMAND_PROMPT("#");
} // namespace

QueryOrchestrator::QueryOrchestrator(DeviceConfig config,
                                     session::SessionPool &pool,
                                     ResultCache &cache)
    : config_(std::move(config)), pool_(pool), cache_(cache) {}

QueryResult QueryOrchestrator::get_unit_info(const std::string &description) {
  QueryResult result;

  if (!config_.enabled) {
    LOG_WARN(config_.name, "QUERY", "Device is disabled, skipping '{}'",
             description);
    result.outcome = QueryOutcome::Disabled;
    result.error_message = config_.name + " is disabled";
    return result;
  }

  if (auto cached = cache_.get(config_.name, description)) {
    LOG_DEBUG(config_.name, "QUERY", "Cache hit for '{}'", description);
    result.outcome = QueryOutcome::Found;
    result.unit = std::move(cached);
    result.from_cache = true;
    return result;
  }

  LOG_INFO(config_.name, "QUERY", "Searching for '{}'", description);
  std::string needle = parser::to_lower(description);

  try {
    session::SessionLease lease = pool_.acquire(config_);
    std::optional<UnitInfo> unit;
    try {
      unit = search(lease, needle);
      if (unit && config_.fetch_details) {
        fetch_details(lease, *unit);
      }
    } catch (const std::exception &) {
      lease.invalidate();
      throw;
    }

    if (!unit) {
      LOG_WARN(config_.name, "QUERY", "'{}' not found on any port",
               description);
      result.outcome = QueryOutcome::NotFound;
      return result;
    }

    LOG_INFO(config_.name, "QUERY", "Found '{}' at {} ({})", description,
             unit->status.unit_id, to_string(unit->status.state));
    cache_.put(config_.name, description, *unit);
    result.outcome = QueryOutcome::Found;
    result.unit = std::move(unit);
    return result;
  } catch (const std::exception &ex) {
    LOG_ERROR(config_.name, "QUERY", "Query for '{}' failed: {}", description,
              ex.what());
    result.outcome = QueryOutcome::DeviceUnreachable;
    result.error_message = ex.what();
    return result;
  }
}

std::future<QueryResult>
QueryOrchestrator::get_unit_info_async(const std::string &description) {
  return std::async(std::launch::async,
                    [this, description]() { return get_unit_info(description); });
}

std::optional<UnitInfo> QueryOrchestrator::search(session::SessionLease &lease,
                                                  const std::string &needle) {
  for (const auto &port : config_.epon_ports) {
    LOG_DEBUG(config_.name, "QUERY", "Searching epon {}", port);
    if (auto unit = search_port(lease, port, needle)) {
      return unit;
    }
  }
  return std::nullopt;
}

std::optional<UnitInfo>
QueryOrchestrator::search_port(session::SessionLease &lease,
                               const std::string &port,
                               const std::string &needle) {
  auto &sync = lease.sync();
  auto &navigator = lease.navigator();
  const auto &t = config_.timings;

  if (!navigator.enter(port)) {
    require_connected(lease, "entering epon " + port);
    return std::nullopt;
  }

  session::SyncResult listing = sync.exchange(
      "show onu status", COMMAND_PROMPT, t.query_delay, config_.command_timeout);
  if (!listing.matched) {
    require_connected(lease, "listing epon " + port);
    LOG_WARN(config_.name, "QUERY",
             "Status listing for epon {} incomplete after {} ms", port,
             config_.command_timeout.count());
  }

  auto records = parser::parse_unit_status_table(listing.output);
  LOG_DEBUG(config_.name, "QUERY", "{} units on epon {}", records.size(), port);

  std::optional<UnitInfo> found;
  for (const auto &record : records) {
    auto index = parser::unit_index_from_id(record.unit_id);
    if (!index)
      continue;

    session::SyncResult reply =
        sync.exchange("show onu " + *index + " description", COMMAND_PROMPT,
                      t.query_delay, t.description_query);
    auto description = parser::parse_unit_description(reply.output);
    if (!description)
      continue;

    if (parser::to_lower(*description) == needle) {
      UnitInfo unit;
      unit.status = record;
      unit.description = *description;
      unit.epon_port = port;
      unit.device = config_.name;
      found = std::move(unit);
      break;
    }
  }

  if (!navigator.exit()) {
    require_connected(lease, "leaving epon " + port);
  }
  return found;
}

void QueryOrchestrator::fetch_details(session::SessionLease &lease,
                                      UnitInfo &unit) {
  auto index = parser::unit_index_from_id(unit.status.unit_id);
  if (!index)
    return;

  auto &sync = lease.sync();
  auto &navigator = lease.navigator();
  const auto &t = config_.timings;

  if (!navigator.enter(unit.epon_port)) {
    require_connected(lease, "re-entering epon " + unit.epon_port);
    LOG_WARN(config_.name, "QUERY", "Skipping details for {}",
             unit.status.unit_id);
    return;
  }

  std::string prefix = "show onu " + *index + " ctc ";

  auto optical = sync.exchange(prefix + "opm_diag", COMMAND_PROMPT,
                               t.query_delay, t.detail_query);
  unit.optical = parser::parse_optical_diagnostics(optical.output);

  auto link = sync.exchange(prefix + "eth 1 linkstate", COMMAND_PROMPT,
                            t.query_delay, t.detail_query);
  unit.link = parser::parse_link_state(link.output);

  auto capability = sync.exchange(prefix + "capability", COMMAND_PROMPT,
                                  t.query_delay, t.detail_query);
  unit.capability = parser::parse_unit_capability(capability.output);

  LOG_DEBUG(config_.name, "QUERY", "Details for {}: optical={} link={} cap={}",
            unit.status.unit_id, unit.optical.has_value(),
            unit.link.has_value(), unit.capability.has_value());

  if (!navigator.exit()) {
    require_connected(lease, "leaving epon " + unit.epon_port);
  }
}

void QueryOrchestrator::require_connected(session::SessionLease &lease,
                                          const std::string &during) {
  if (!lease.session().transport().is_connected()) {
    throw ConnectionError(
        fmt::format("{}: connection lost while {}", config_.name, during));
  }
}

} // namespace query
} // namespace oltclient
