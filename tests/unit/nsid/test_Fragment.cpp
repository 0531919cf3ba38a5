#include <doctest/doctest.h>
#include <nsidref/nsid/Fragment.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>

using namespace NR;

TEST_SUITE("nsid.fragment") {

TEST_CASE("Accepted fragments") {
    auto fragment = Fragment::parse("#fooBar1");
    REQUIRE(fragment.has_value());
    CHECK(fragment->asStr() == "#fooBar1");
    CHECK(fragment->name() == "fooBar1");

    std::ostringstream out;
    out << *fragment;
    CHECK(out.str() == "#fooBar1");

    CHECK(Fragment::parse("#" + std::string(63, 'z')).has_value());
    CHECK(Fragment::parse("#9").has_value());
}

TEST_CASE("Rejected fragments") {
    for (std::string_view text : {"fooBar1", "", "#", "#foo-bar", "#foo_bar", "#foo bar", "##foo", "#caf\xC3\xA9"}) {
        auto fragment = Fragment::parse(text);
        REQUIRE_FALSE(fragment.has_value());
        CHECK(fragment.error().code == Error::Code::NsidFragmentFormat);
    }
    CHECK_FALSE(Fragment::parse("#" + std::string(64, 'z')).has_value());
}

TEST_CASE("Missing hash is reported distinctly in the message") {
    auto fragment = Fragment::parse("main");
    REQUIRE_FALSE(fragment.has_value());
    CHECK(describeError(fragment.error()) == "nsid_fragment_format:Fragment must start with '#'");
}

TEST_CASE("Value semantics") {
    auto a = Fragment::parse("#alpha");
    auto b = Fragment::parse("#beta");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a < *b);
    CHECK(*a == "#alpha");

    Fragment copy = *a;
    std::unordered_set<Fragment> hashed{*a, *b, copy};
    CHECK(hashed.size() == 2);
}

} // TEST_SUITE
