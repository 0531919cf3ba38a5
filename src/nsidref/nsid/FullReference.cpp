#include "FullReference.hpp"
#include "validation.hpp"

#include <utility>

namespace NR {

FullReference::FullReference(std::string text, std::size_t fragStart)
    : text(std::move(text)), fragStart(fragStart) {
}

FullReference::FullReference(Nsid nsid)
    : fragStart(nsid.text.size()) {
    this->text = std::move(nsid.text);
}

FullReference::FullReference(Nsid nsid, Fragment const& fragment)
    : fragStart(nsid.text.size()) {
    this->text = std::move(nsid.text);
    this->text.append(fragment.text);
}

auto FullReference::parse(std::string_view text) -> Expected<FullReference> {
    auto fragStart = text.find('#');
    if (fragStart == std::string_view::npos)
        fragStart = text.size();

    auto const nsidPart     = text.substr(0, fragStart);
    auto const fragmentPart = text.substr(fragStart);

    auto result = validate_nsid_impl(nsidPart);
    if (result.code != ValidationError::Code::None) {
        return std::unexpected(Error{Error::Code::NsidFormat, get_error_message(result.code)});
    }

    if (!fragmentPart.empty()) {
        result = validate_fragment_impl(fragmentPart);
        if (result.code != ValidationError::Code::None) {
            return std::unexpected(Error{Error::Code::NsidFragmentFormat, get_error_message(result.code)});
        }
    }

    return FullReference{std::string{text}, fragStart};
}

auto FullReference::asStr() const -> std::string_view {
    return this->text;
}

auto FullReference::nsidView() const -> std::string_view {
    return std::string_view{this->text}.substr(0, this->fragStart);
}

auto FullReference::fragmentStart() const -> std::size_t {
    return this->fragStart;
}

auto FullReference::cloneNsid() const -> Nsid {
    return Nsid{this->text.substr(0, this->fragStart)};
}

auto FullReference::hasFragment() const -> bool {
    return this->fragStart < this->text.size();
}

auto FullReference::cloneFragment() const -> std::optional<Fragment> {
    if (!this->hasFragment())
        return std::nullopt;
    return Fragment{this->text.substr(this->fragStart)};
}

auto FullReference::fragmentName() const -> std::optional<std::string_view> {
    if (!this->hasFragment())
        return std::nullopt;
    return std::string_view{this->text}.substr(this->fragStart + 1);
}

auto FullReference::operator<=>(FullReference const& other) const -> std::strong_ordering {
    if (auto order = this->text <=> other.text; order != 0)
        return order;
    return this->fragStart <=> other.fragStart;
}

auto FullReference::operator==(FullReference const& other) const -> bool {
    return this->text == other.text && this->fragStart == other.fragStart;
}

auto FullReference::operator==(std::string_view other) const -> bool {
    return this->text == other;
}

auto operator<<(std::ostream& out, FullReference const& reference) -> std::ostream& {
    return out << reference.asStr();
}

} // namespace NR
