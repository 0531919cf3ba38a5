#include <doctest/doctest.h>
#include <nsidref/nsid/validation.hpp>

#include <algorithm>
#include <cstring>
#include <string>

using namespace NR;

namespace {

// Builds a valid authority of exactly `length` bytes out of 63 byte segments.
auto authority_of_length(std::size_t length) -> std::string {
    std::string authority;
    char        fill = 'a';
    while (authority.size() < length) {
        if (!authority.empty())
            authority.push_back('.');
        auto const chunk = std::min<std::size_t>(63, length - authority.size());
        authority.append(chunk, fill++);
    }
    return authority;
}

auto code_of(std::string const& text) -> ValidationError::Code {
    return validate_nsid_impl(text).code;
}

} // namespace

TEST_SUITE("nsid.validation") {

TEST_CASE("Valid identifiers") {
    CHECK(code_of("com.example.fooBar") == ValidationError::Code::None);
    CHECK(code_of("net.users.bob.ping") == ValidationError::Code::None);
    CHECK(code_of("a-0.b-1.c") == ValidationError::Code::None);
    CHECK(code_of("a.b.c") == ValidationError::Code::None);
    CHECK(code_of("cn.8.lex.stuff") == ValidationError::Code::None);
}

TEST_CASE("Each rejection reason") {
    CHECK(code_of("") == ValidationError::Code::InvalidTld);
    CHECK(code_of("9com.example.foo") == ValidationError::Code::InvalidTld);
    CHECK(code_of("com..foo") == ValidationError::Code::InvalidDomainSegment);
    CHECK(code_of("com.exa\xF0\x9F\xA4\xAFple.thing") == ValidationError::Code::InvalidDomainSegment);
    CHECK(code_of("com.example.foo-bar") == ValidationError::Code::InvalidName);
    CHECK(code_of("com.example.") == ValidationError::Code::InvalidName);
    CHECK(code_of("com.example") == ValidationError::Code::TooFewSegments);
    CHECK(code_of("com") == ValidationError::Code::TooFewSegments);
}

TEST_CASE("Authority length boundary") {
    auto const at252 = authority_of_length(252);
    REQUIRE(at252.size() == 252);
    CHECK(code_of(at252 + ".name") == ValidationError::Code::None);

    auto const at253 = authority_of_length(253);
    REQUIRE(at253.size() == 253);
    CHECK(code_of(at253 + ".name") == ValidationError::Code::AuthorityTooLong);
}

TEST_CASE("Total length boundary") {
    // 252 byte authority, separator and a 63 byte name: the longest identifier
    // the segment grammar can produce.
    auto const longest = authority_of_length(252) + "." + std::string(63, 'n');
    CHECK(longest.size() == 316);
    CHECK(code_of(longest) == ValidationError::Code::None);

    // 317 bytes passes the total length bound and is then rejected by the
    // authority bound.
    auto const at317 = authority_of_length(253) + "." + std::string(63, 'n');
    REQUIRE(at317.size() == 317);
    CHECK(code_of(at317) == ValidationError::Code::AuthorityTooLong);

    auto const at318 = authority_of_length(254) + "." + std::string(63, 'n');
    REQUIRE(at318.size() == 318);
    CHECK(code_of(at318) == ValidationError::Code::TooLong);
}

TEST_CASE("Fragment validation") {
    CHECK(validate_fragment_impl("#fooBar1").code == ValidationError::Code::None);
    CHECK(validate_fragment_impl("fooBar1").code == ValidationError::Code::MissingHash);
    CHECK(validate_fragment_impl("").code == ValidationError::Code::MissingHash);
    CHECK(validate_fragment_impl("#").code == ValidationError::Code::FragmentLength);
    CHECK(validate_fragment_impl("#" + std::string(64, 'f')).code == ValidationError::Code::FragmentLength);
    CHECK(validate_fragment_impl("#foo-bar").code == ValidationError::Code::FragmentCharacter);
    CHECK(validate_fragment_impl("#foo_bar").code == ValidationError::Code::FragmentCharacter);
    CHECK(validate_fragment_impl("#foo bar").code == ValidationError::Code::FragmentCharacter);
}

TEST_CASE("Error messages") {
    bool const noMessage = get_error_message(ValidationError::Code::None) == nullptr;
    CHECK(noMessage);
    for (auto code : {ValidationError::Code::TooLong,
                      ValidationError::Code::InvalidTld,
                      ValidationError::Code::InvalidDomainSegment,
                      ValidationError::Code::AuthorityTooLong,
                      ValidationError::Code::InvalidName,
                      ValidationError::Code::TooFewSegments,
                      ValidationError::Code::MissingHash,
                      ValidationError::Code::FragmentLength,
                      ValidationError::Code::FragmentCharacter}) {
        auto const* message = get_error_message(code);
        REQUIRE(message != static_cast<char const*>(nullptr));
        CHECK(std::strlen(message) > 0);
    }
}

TEST_CASE("Compile time validation") {
    static_assert(validate_nsid("com.example.fooBar"));
    static_assert(validate_nsid_impl("com.example").code == ValidationError::Code::TooFewSegments);
    static_assert(validate_fragment_impl("#main").code == ValidationError::Code::None);
    CHECK(true);
}

} // TEST_SUITE
