#pragma once
#include <optional>
#include <string>
#include <plog/Severity.h>

namespace InkWell {

// Accepts none, fatal, error, warning (or warn), info, debug, verbose;
// case-insensitive.
std::optional<plog::Severity> parseSeverity(const std::string &name);

// INKWELL_LOG_LEVEL wins over the configured name; unknown names fall back
// to info.
plog::Severity resolveSeverity(const std::string &configured);

// Console appender on stderr. Safe to call again to change the level.
void initLogging(plog::Severity severity);

} // namespace InkWell
