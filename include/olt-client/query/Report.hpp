#pragma once
#include "olt-client/export.h"
#include "olt-client/types.hpp"

#include <string>

namespace oltclient {
namespace query {

/// Render a unit as Telegram-flavoured HTML (<b>, <code>, emoji markers)
OLT_CLIENT_API std::string format_unit_report(const UnitInfo &unit);

/// Escape &, < and > for HTML text nodes
OLT_CLIENT_API std::string escape_html(const std::string &text);

} // namespace query
} // namespace oltclient
