#include <paneltree/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace PT;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError); i <= static_cast<int>(Error::Code::OutOfRange); ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::MalformedInput, "bad"};
        CHECK(describeError(withMsg) == "malformed_input:bad");

        Error withoutMsg{Error::Code::IoFailure, {}};
        CHECK(describeError(withoutMsg) == "io_failure");

        CHECK(errorCodeToString(static_cast<Error::Code>(999)) == "unknown_error");
    }

    TEST_CASE("Expected carries either a value or an error") {
        Expected<int> ok = 3;
        REQUIRE(ok.has_value());
        CHECK(*ok == 3);

        Expected<int> failed = std::unexpected(Error{Error::Code::NotFound, "missing"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::NotFound);
        CHECK(failed.error().message == "missing");
    }
}
