#pragma once
#include "NsidSegmentIterator.hpp"
#include "core/Error.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace NR {

/**
 * A validated Namespaced Identifier such as "com.example.fooBar".
 * The text is stored exactly as given; there is no way to build an Nsid that
 * has not passed validate_nsid_impl.
 */
class Nsid {
public:
    static auto parse(std::string_view text) -> Expected<Nsid>;
    static auto fromBytes(std::span<std::uint8_t const> bytes) -> Expected<Nsid>;

    auto asStr() const -> std::string_view;
    auto segments() const -> NsidSegmentRange;
    auto authority() const -> std::string_view;
    auto name() const -> std::string_view;

    auto operator<=>(Nsid const& other) const -> std::strong_ordering;
    auto operator==(Nsid const& other) const -> bool;
    auto operator==(std::string_view other) const -> bool;

    friend class FullReference;

private:
    explicit Nsid(std::string text);

    std::string text;
};

auto operator<<(std::ostream& out, Nsid const& nsid) -> std::ostream&;

} // namespace NR

namespace std {

template <>
struct hash<NR::Nsid> {
    std::size_t operator()(const NR::Nsid& nsid) const noexcept {
        return std::hash<std::string_view>{}(nsid.asStr());
    }
};

} // namespace std
