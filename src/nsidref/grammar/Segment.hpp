#pragma once
#include <cstddef>
#include <string_view>

namespace NR {

struct LengthRange {
    std::size_t min;
    std::size_t max;

    constexpr auto contains(std::size_t length) const -> bool {
        return length >= this->min && length <= this->max;
    }
};

// Inclusive bounds shared by every dot separated segment and by fragment names.
inline constexpr LengthRange kSegmentLengthRange{1, 63};

// Byte classes. Anything at or above 0x80 is never part of a segment.
constexpr auto is_ascii_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

constexpr auto is_ascii_alpha(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr auto is_ascii_alnum(char c) -> bool {
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

constexpr auto is_valid_domain_segment(std::string_view segment) -> bool {
    if (!kSegmentLengthRange.contains(segment.size()))
        return false;
    if (segment.front() == '-' || segment.back() == '-')
        return false;
    for (char c : segment) {
        if (!is_ascii_alnum(c) && c != '-')
            return false;
    }
    return true;
}

constexpr auto is_valid_tld(std::string_view segment) -> bool {
    return is_valid_domain_segment(segment) && !is_ascii_digit(segment.front());
}

constexpr auto is_valid_nsid_name(std::string_view segment) -> bool {
    if (!kSegmentLengthRange.contains(segment.size()))
        return false;
    if (!is_ascii_alpha(segment.front()))
        return false;
    for (char c : segment) {
        if (!is_ascii_alnum(c))
            return false;
    }
    return true;
}

// The part of a fragment after its leading '#'.
constexpr auto is_valid_fragment_name(std::string_view name) -> bool {
    if (!kSegmentLengthRange.contains(name.size()))
        return false;
    for (char c : name) {
        if (!is_ascii_alnum(c))
            return false;
    }
    return true;
}

} // namespace NR
