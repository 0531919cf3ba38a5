#include <doctest/doctest.h>
#include <nsidref/nsid/Reference.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <variant>

using namespace NR;

namespace {

auto render(Reference const& reference) -> std::string {
    std::ostringstream out;
    out << reference;
    return out.str();
}

} // namespace

TEST_SUITE("nsid.reference") {

TEST_CASE("Leading hash selects a relative reference") {
    auto reference = Reference::parse("#abc");
    REQUIRE(reference.has_value());
    CHECK(reference->isRelative());
    CHECK_FALSE(reference->isFull());
    REQUIRE(reference->relative() != nullptr);
    CHECK(reference->relative()->name() == "abc");
    CHECK(reference->full() == nullptr);
    CHECK(render(*reference) == "#abc");
}

TEST_CASE("Anything else selects a full reference") {
    auto reference = Reference::parse("com.example.foo");
    REQUIRE(reference.has_value());
    CHECK(reference->isFull());
    auto const* full = reference->full();
    REQUIRE(full != nullptr);
    CHECK_FALSE(full->hasFragment());
    CHECK_FALSE(full->cloneFragment().has_value());
    CHECK(full->cloneNsid() == "com.example.foo");
}

TEST_CASE("Rendering matches the input") {
    for (std::string_view text : {"#abc", "com.example.foo", "com.example.foo#bar", "cn.8.lex.stuff#x1"}) {
        auto reference = Reference::parse(text);
        REQUIRE(reference.has_value());
        CHECK(reference->asStr() == text);
        CHECK(render(*reference) == text);
    }
}

TEST_CASE("Errors come from the selected shape") {
    auto badFragment = Reference::parse("#a-b");
    REQUIRE_FALSE(badFragment.has_value());
    CHECK(badFragment.error().code == Error::Code::NsidFragmentFormat);

    auto badNsid = Reference::parse("com.example");
    REQUIRE_FALSE(badNsid.has_value());
    CHECK(badNsid.error().code == Error::Code::NsidFormat);

    auto empty = Reference::parse("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == Error::Code::NsidFormat);

    auto badTail = Reference::parse("com.example.foo#");
    REQUIRE_FALSE(badTail.has_value());
    CHECK(badTail.error().code == Error::Code::NsidFragmentFormat);
}

TEST_CASE("Exhaustive visiting") {
    auto reference = Reference::parse("com.example.foo#bar");
    REQUIRE(reference.has_value());
    auto kind = std::visit(
        [](auto const& shape) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(shape)>, FullReference>)
                return "full";
            else
                return "relative";
        },
        reference->variant());
    CHECK(kind == "full");
}

TEST_CASE("Equality and hashing") {
    auto a = Reference::parse("#abc");
    auto b = Reference::parse("#abc");
    auto c = Reference::parse("com.example.abc");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());
    CHECK(*a == *b);
    CHECK_FALSE(*a == *c);

    std::unordered_set<Reference> hashed{*a, *b, *c};
    CHECK(hashed.size() == 2);
}

} // TEST_SUITE
