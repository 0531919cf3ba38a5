#include "Nsid.hpp"
#include "validation.hpp"

#include <utility>

namespace {

using NR::Error;
using NR::ValidationError;

auto make_nsid_error(ValidationError::Code code) -> Error {
    return Error{Error::Code::NsidFormat, NR::get_error_message(code)};
}

} // namespace

namespace NR {

Nsid::Nsid(std::string text) : text(std::move(text)) {
}

auto Nsid::parse(std::string_view text) -> Expected<Nsid> {
    auto result = validate_nsid_impl(text);
    if (result.code != ValidationError::Code::None) {
        return std::unexpected(make_nsid_error(result.code));
    }
    return Nsid{std::string{text}};
}

auto Nsid::fromBytes(std::span<std::uint8_t const> bytes) -> Expected<Nsid> {
    // Validation only admits ASCII, so the bytes are valid text once it passes.
    std::string_view const text{reinterpret_cast<char const*>(bytes.data()), bytes.size()};
    return Nsid::parse(text);
}

auto Nsid::asStr() const -> std::string_view {
    return this->text;
}

auto Nsid::segments() const -> NsidSegmentRange {
    return NsidSegmentRange{this->text};
}

auto Nsid::authority() const -> std::string_view {
    return std::string_view{this->text}.substr(0, this->text.rfind('.'));
}

auto Nsid::name() const -> std::string_view {
    return std::string_view{this->text}.substr(this->text.rfind('.') + 1);
}

auto Nsid::operator<=>(Nsid const& other) const -> std::strong_ordering {
    return this->text <=> other.text;
}

auto Nsid::operator==(Nsid const& other) const -> bool {
    return this->text == other.text;
}

auto Nsid::operator==(std::string_view other) const -> bool {
    return this->text == other;
}

auto operator<<(std::ostream& out, Nsid const& nsid) -> std::ostream& {
    return out << nsid.asStr();
}

} // namespace NR
