#pragma once
#include "Fragment.hpp"
#include "FullReference.hpp"
#include "core/Error.hpp"

#include <functional>
#include <ostream>
#include <string_view>
#include <variant>

namespace NR {

/**
 * Either a fully qualified reference ("com.example.foo#bar") or a fragment
 * relative to the current document ("#bar"). The shape is picked once from
 * the first byte of the input.
 */
class Reference {
public:
    using Variant = std::variant<FullReference, Fragment>;

    static auto parse(std::string_view text) -> Expected<Reference>;

    Reference(FullReference full);
    Reference(Fragment relative);

    auto isFull() const -> bool;
    auto isRelative() const -> bool;
    auto full() const -> FullReference const*;
    auto relative() const -> Fragment const*;
    auto variant() const -> Variant const&;

    auto asStr() const -> std::string_view;

    auto operator==(Reference const& other) const -> bool;

private:
    Variant value;
};

auto operator<<(std::ostream& out, Reference const& reference) -> std::ostream&;

} // namespace NR

namespace std {

template <>
struct hash<NR::Reference> {
    std::size_t operator()(const NR::Reference& reference) const noexcept {
        return std::hash<NR::Reference::Variant>{}(reference.variant());
    }
};

} // namespace std
