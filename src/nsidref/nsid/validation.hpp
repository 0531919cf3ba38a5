#pragma once
#include "grammar/Segment.hpp"

#include <cstddef>
#include <string_view>

namespace NR {

inline constexpr std::size_t kMaxNsidLength      = 317;
inline constexpr std::size_t kMaxAuthorityLength = 253;
inline constexpr std::size_t kMinNsidSegments    = 3;

struct ValidationError {
    enum class Code {
        None,
        TooLong,
        InvalidTld,
        InvalidDomainSegment,
        AuthorityTooLong,
        InvalidName,
        TooFewSegments,
        MissingHash,
        FragmentLength,
        FragmentCharacter
    };
    Code code;
};

constexpr ValidationError validate_nsid_impl(std::string_view str) {
    if (str.size() > kMaxNsidLength)
        return {ValidationError::Code::TooLong};

    auto segmentEnd = [&](std::size_t from) {
        auto dot = str.find('.', from);
        return dot == std::string_view::npos ? str.size() : dot;
    };

    // Splitting always yields at least one segment, so the empty string is
    // rejected here by the TLD predicate.
    std::size_t end = segmentEnd(0);
    if (!is_valid_tld(str.substr(0, end)))
        return {ValidationError::Code::InvalidTld};

    std::size_t length      = end;
    std::size_t numSegments = 1;
    while (end < str.size()) {
        std::size_t const start = end + 1;
        end                     = segmentEnd(start);
        auto const segment      = str.substr(start, end - start);
        bool const isLast       = end == str.size();

        if (!isLast) {
            if (!is_valid_domain_segment(segment))
                return {ValidationError::Code::InvalidDomainSegment};
        } else {
            if (length >= kMaxAuthorityLength)
                return {ValidationError::Code::AuthorityTooLong};
            if (!is_valid_nsid_name(segment))
                return {ValidationError::Code::InvalidName};
        }

        ++numSegments;
        length += 1 + segment.size();
    }

    if (numSegments < kMinNsidSegments)
        return {ValidationError::Code::TooFewSegments};

    return {ValidationError::Code::None};
}

constexpr ValidationError validate_fragment_impl(std::string_view str) {
    if (str.empty() || str.front() != '#')
        return {ValidationError::Code::MissingHash};

    auto const name = str.substr(1);
    if (!kSegmentLengthRange.contains(name.size()))
        return {ValidationError::Code::FragmentLength};
    if (!is_valid_fragment_name(name))
        return {ValidationError::Code::FragmentCharacter};

    return {ValidationError::Code::None};
}

constexpr const char* get_error_message(ValidationError::Code code) {
    switch (code) {
        case ValidationError::Code::TooLong:
            return "NSID exceeds 317 bytes";
        case ValidationError::Code::InvalidTld:
            return "Invalid top-level domain segment";
        case ValidationError::Code::InvalidDomainSegment:
            return "Invalid domain segment";
        case ValidationError::Code::AuthorityTooLong:
            return "NSID authority exceeds 252 bytes";
        case ValidationError::Code::InvalidName:
            return "Invalid name segment";
        case ValidationError::Code::TooFewSegments:
            return "NSID needs at least 3 segments";
        case ValidationError::Code::MissingHash:
            return "Fragment must start with '#'";
        case ValidationError::Code::FragmentLength:
            return "Fragment name length out of range";
        case ValidationError::Code::FragmentCharacter:
            return "Fragment name must be ASCII alphanumeric";
        case ValidationError::Code::None:
            return nullptr;
    }
    return "Unknown error";
}

static consteval bool error(const char*) {
    return false;
}

consteval bool validate_nsid(std::string_view str) {
    auto result = validate_nsid_impl(str);
    if (result.code != ValidationError::Code::None) {
        error(get_error_message(result.code));
        return false;
    }
    return true;
}

} // namespace NR
