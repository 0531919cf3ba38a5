#pragma once
#include "Fragment.hpp"
#include "Nsid.hpp"
#include "core/Error.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace NR {

/**
 * An NSID optionally followed by a fragment, e.g. "com.example.foo#bar".
 *
 * The whole text is kept in one string. fragStart is the index of the '#',
 * or text.size() when there is no fragment; text[0, fragStart) is always a
 * valid Nsid and text[fragStart, end) a valid Fragment when non-empty.
 * The clone* accessors allocate fresh values, parsing never copies a part.
 */
class FullReference {
public:
    static auto parse(std::string_view text) -> Expected<FullReference>;

    FullReference(Nsid nsid);
    FullReference(Nsid nsid, Fragment const& fragment);

    auto asStr() const -> std::string_view;
    auto nsidView() const -> std::string_view;
    // Index of the '#' in asStr(), or asStr().size() without a fragment.
    auto fragmentStart() const -> std::size_t;

    auto cloneNsid() const -> Nsid;
    auto hasFragment() const -> bool;
    auto cloneFragment() const -> std::optional<Fragment>;
    auto fragmentName() const -> std::optional<std::string_view>;

    auto operator<=>(FullReference const& other) const -> std::strong_ordering;
    auto operator==(FullReference const& other) const -> bool;
    auto operator==(std::string_view other) const -> bool;

private:
    FullReference(std::string text, std::size_t fragStart);

    std::string text;
    std::size_t fragStart;
};

auto operator<<(std::ostream& out, FullReference const& reference) -> std::ostream&;

} // namespace NR

namespace std {

template <>
struct hash<NR::FullReference> {
    std::size_t operator()(const NR::FullReference& reference) const noexcept {
        return std::hash<std::string_view>{}(reference.asStr());
    }
};

} // namespace std
