#pragma once
#include "olt-client/export.h"
#include "olt-client/query/ResultCache.hpp"
#include "olt-client/session/SessionPool.hpp"
#include "olt-client/types.hpp"

#include <future>
#include <optional>
#include <string>

namespace oltclient {
namespace query {

/// Finds a unit by description on one OLT.
///
/// Each configured EPON port is entered in order, its status table listed
/// and every unit's description compared case-insensitively against the
/// target. The first match wins; optional detail blocks (optical, link,
/// capability) are then fetched from the same port. Results are cached per
/// device. Connection and authentication failures invalidate the pooled
/// session and come back as DeviceUnreachable; get_unit_info never throws.
class OLT_CLIENT_API QueryOrchestrator {
public:
  QueryOrchestrator(DeviceConfig config, session::SessionPool &pool,
                    ResultCache &cache);

  QueryResult get_unit_info(const std::string &description);

  /// get_unit_info on a background thread. Calls for the same device still
  /// serialize on the pooled session. The task holds `this`, so the
  /// orchestrator, its pool and its cache must outlive the returned future.
  std::future<QueryResult> get_unit_info_async(const std::string &description);

  const DeviceConfig &config() const { return config_; }

private:
  std::optional<UnitInfo> search(session::SessionLease &lease,
                                 const std::string &needle);
  std::optional<UnitInfo> search_port(session::SessionLease &lease,
                                      const std::string &port,
                                      const std::string &needle);
  void fetch_details(session::SessionLease &lease, UnitInfo &unit);

  /// Throws ConnectionError when the transport went away underneath us
  void require_connected(session::SessionLease &lease,
                         const std::string &during);

  DeviceConfig config_;
  session::SessionPool &pool_;
  ResultCache &cache_;
};

} // namespace query
} // namespace oltclient
