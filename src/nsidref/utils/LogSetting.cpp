#include "LogSetting.hpp"

namespace NR {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

} // namespace

auto parse_log_setting(char const* value) -> LogSetting {
    LogSetting setting;
    if (value == nullptr)
        return setting;

    std::string_view const text = trim(value);
    if (text.empty() || text == "0")
        return setting;

    setting.enabled = true;
    if (text == "1")
        return setting;

    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto comma = text.find(',', pos);
        auto end   = comma == std::string_view::npos ? text.size() : comma;
        auto tag   = trim(text.substr(pos, end - pos));
        if (!tag.empty())
            setting.tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        pos = comma + 1;
    }
    return setting;
}

auto log_tags_match(std::set<std::string> const& enabled, std::set<std::string> const& tags) -> bool {
    if (enabled.empty())
        return true;
    for (auto const& tag : tags)
        if (enabled.contains(tag))
            return true;
    return false;
}

} // namespace NR
