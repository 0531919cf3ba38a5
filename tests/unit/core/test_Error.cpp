#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace NR;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::UnknownError);
             i <= static_cast<int>(Error::Code::NsidFragmentFormat);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        CHECK(errorCodeToString(Error::Code::NsidFormat) == "nsid_format");
        CHECK(errorCodeToString(Error::Code::NsidFragmentFormat) == "nsid_fragment_format");

        Error withMsg{Error::Code::NsidFormat, "Invalid name segment"};
        CHECK(describeError(withMsg) == "nsid_format:Invalid name segment");

        // Out of range values fall back to the generic label.
        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either a value or an Error") {
        Expected<int> ok = 7;
        REQUIRE(ok.has_value());
        CHECK(*ok == 7);

        Expected<int> bad = std::unexpected(Error{Error::Code::NsidFragmentFormat, "x"});
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::NsidFragmentFormat);
        CHECK(bad.error().message == "x");
    }
}
