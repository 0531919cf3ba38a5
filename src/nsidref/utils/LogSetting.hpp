#pragma once
#include <set>
#include <string>
#include <string_view>

namespace NR {

/**
 * Logging configuration read from the NSIDREF_LOG environment variable.
 *   unset, "" or "0"  logging off
 *   "1"               every message
 *   "Tool,Input"      only messages carrying at least one of the listed tags
 */
struct LogSetting {
    bool                  enabled = false;
    std::set<std::string> tags;
};

auto parse_log_setting(char const* value) -> LogSetting;

// True when a message tagged with `tags` passes the `enabled` filter.
// An empty filter lets everything through.
auto log_tags_match(std::set<std::string> const& enabled, std::set<std::string> const& tags) -> bool;

} // namespace NR
