#pragma once
#include "olt-client/export.h"
#include "olt-client/types.hpp"

#include <nlohmann/json.hpp>

// nlohmann::json conversions, found by ADL next to the record types
namespace oltclient {

OLT_CLIENT_API void to_json(nlohmann::json &j, const UnitStatusRecord &r);
OLT_CLIENT_API void to_json(nlohmann::json &j, const OpticalDiagnostics &o);
OLT_CLIENT_API void to_json(nlohmann::json &j, const UnitCapability &c);
OLT_CLIENT_API void to_json(nlohmann::json &j, const UnitInfo &u);
OLT_CLIENT_API void to_json(nlohmann::json &j, const QueryResult &r);

} // namespace oltclient
