#pragma once
#include "core/Error.hpp"

#include <compare>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace NR {

// A '#' prefixed definition name, e.g. "#main". Stored with its '#'.
class Fragment {
public:
    static auto parse(std::string_view text) -> Expected<Fragment>;

    auto asStr() const -> std::string_view;
    auto name() const -> std::string_view;

    auto operator<=>(Fragment const& other) const -> std::strong_ordering;
    auto operator==(Fragment const& other) const -> bool;
    auto operator==(std::string_view other) const -> bool;

    friend class FullReference;

private:
    explicit Fragment(std::string text);

    std::string text;
};

auto operator<<(std::ostream& out, Fragment const& fragment) -> std::ostream&;

} // namespace NR

namespace std {

template <>
struct hash<NR::Fragment> {
    std::size_t operator()(const NR::Fragment& fragment) const noexcept {
        return std::hash<std::string_view>{}(fragment.asStr());
    }
};

} // namespace std
