#include "Reference.hpp"

#include <utility>

namespace NR {

Reference::Reference(FullReference full) : value(std::move(full)) {
}

Reference::Reference(Fragment relative) : value(std::move(relative)) {
}

auto Reference::parse(std::string_view text) -> Expected<Reference> {
    if (text.starts_with('#')) {
        auto fragment = Fragment::parse(text);
        if (!fragment)
            return std::unexpected(fragment.error());
        return Reference{std::move(*fragment)};
    }

    auto full = FullReference::parse(text);
    if (!full)
        return std::unexpected(full.error());
    return Reference{std::move(*full)};
}

auto Reference::isFull() const -> bool {
    return std::holds_alternative<FullReference>(this->value);
}

auto Reference::isRelative() const -> bool {
    return std::holds_alternative<Fragment>(this->value);
}

auto Reference::full() const -> FullReference const* {
    return std::get_if<FullReference>(&this->value);
}

auto Reference::relative() const -> Fragment const* {
    return std::get_if<Fragment>(&this->value);
}

auto Reference::variant() const -> Variant const& {
    return this->value;
}

auto Reference::asStr() const -> std::string_view {
    return std::visit([](auto const& shape) { return shape.asStr(); }, this->value);
}

auto Reference::operator==(Reference const& other) const -> bool {
    return this->value == other.value;
}

auto operator<<(std::ostream& out, Reference const& reference) -> std::ostream& {
    std::visit([&out](auto const& shape) { out << shape; }, reference.variant());
    return out;
}

} // namespace NR
