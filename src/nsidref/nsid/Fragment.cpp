#include "Fragment.hpp"
#include "validation.hpp"

#include <utility>

namespace NR {

Fragment::Fragment(std::string text) : text(std::move(text)) {
}

auto Fragment::parse(std::string_view text) -> Expected<Fragment> {
    auto result = validate_fragment_impl(text);
    if (result.code != ValidationError::Code::None) {
        return std::unexpected(Error{Error::Code::NsidFragmentFormat, get_error_message(result.code)});
    }
    return Fragment{std::string{text}};
}

auto Fragment::asStr() const -> std::string_view {
    return this->text;
}

auto Fragment::name() const -> std::string_view {
    return std::string_view{this->text}.substr(1);
}

auto Fragment::operator<=>(Fragment const& other) const -> std::strong_ordering {
    return this->text <=> other.text;
}

auto Fragment::operator==(Fragment const& other) const -> bool {
    return this->text == other.text;
}

auto Fragment::operator==(std::string_view other) const -> bool {
    return this->text == other;
}

auto operator<<(std::ostream& out, Fragment const& fragment) -> std::ostream& {
    return out << fragment.asStr();
}

} // namespace NR
