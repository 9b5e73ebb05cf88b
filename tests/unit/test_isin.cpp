// Veritas ISIN Validator Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/validators/isin.hpp"

using namespace veritas::core;
using namespace veritas::validators;

TEST_CASE("ISIN accepts valid identifiers", "[validators][isin]") {
    auto result = validate_isin("US0378331005");
    REQUIRE(result.is_valid());
    REQUIRE(*result.normalized_as<std::string>() == "US0378331005");

    for (const char* isin : {"DE000BAY0017", "AU0000XVGZA3", "GB0002634946", "US5949181045"}) {
        INFO(isin);
        REQUIRE(validate_isin(isin).is_valid());
    }

    SECTION("whitespace and case are normalized") {
        REQUIRE(*validate_isin(" us 0378 3310 05 ").normalized_as<std::string>() ==
                "US0378331005");
    }
}

TEST_CASE("ISIN rejections", "[validators][isin]") {
    REQUIRE(validate_isin(InputValue{}).error_message() == "ISIN is required");

    SECTION("format") {
        const std::string expected =
            "Invalid ISIN format. Expected: 2-letter country code + 9 alphanumeric characters + 1 "
            "check digit";
        REQUIRE(validate_isin("US037833100").error_message() == expected);
        REQUIRE(validate_isin("1S0378331005").error_message() == expected);
        REQUIRE(validate_isin("US037833100X").error_message() == expected);
        REQUIRE(validate_isin("US0378331005-").error_message() == expected);
    }

    SECTION("check digit") {
        auto result = validate_isin("US0378331006");
        REQUIRE(result.error_message() == "Invalid ISIN check digit");
        REQUIRE(result.error_kind() == ErrorKind::checksum);
    }
}
