// Veritas Phone Validator Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/validators/phone.hpp"

using namespace veritas::core;
using namespace veritas::validators;

TEST_CASE("Phone separators are stripped", "[validators][phone]") {
    auto result = validate_phone("+33-1-23-45-67-89");
    REQUIRE(result.is_valid());
    REQUIRE(*result.normalized_as<std::string>() == "+33123456789");

    REQUIRE(*validate_phone("+1 (555) 123-4567").normalized_as<std::string>() == "+15551234567");
    REQUIRE(*validate_phone(" +44 20.7946.0958 ").normalized_as<std::string>() ==
            "+442079460958");
    REQUIRE(*validate_phone("+49 [30] 123456").normalized_as<std::string>() == "+4930123456");
}

TEST_CASE("Phone digit count boundaries", "[validators][phone]") {
    REQUIRE(validate_phone("+1234567").is_valid());
    REQUIRE(validate_phone("+123456789012345").is_valid());

    auto short_number = validate_phone("+123456");
    REQUIRE(short_number.error_message() == "Phone number too short (minimum 7 digits)");
    REQUIRE(short_number.error_kind() == ErrorKind::range);

    REQUIRE(validate_phone("+1234567890123456").error_message() ==
            "Invalid phone number format. Expected: + followed by 1-15 digits");
}

TEST_CASE("Phone format rules", "[validators][phone]") {
    REQUIRE(validate_phone(InputValue{}).error_message() == "Phone number is required");
    REQUIRE(validate_phone("33123456789").error_message() ==
            "Phone number must start with + for international format");
    REQUIRE(validate_phone("+0123456789").error_message() ==
            "Invalid phone number format. Expected: + followed by 1-15 digits");
    REQUIRE(validate_phone("+33 1 23 ab 67").error_message() ==
            "Invalid phone number format. Expected: + followed by 1-15 digits");
}
