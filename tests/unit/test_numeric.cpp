// Veritas Numeric Validator Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <limits>

#include "../../src/validators/numeric.hpp"

using namespace veritas::core;
using namespace veritas::validators;

TEST_CASE("Numeric accepts numbers and numeric strings", "[validators][numeric]") {
    SECTION("plain number") {
        auto result = validate_numeric(42);
        REQUIRE(result.is_valid());
        REQUIRE(*result.normalized_as<double>() == 42.0);
    }

    SECTION("string with thousands separators") {
        auto result = validate_numeric("1,234.56");
        REQUIRE(result.is_valid());
        REQUIRE(*result.normalized_as<double>() == 1234.56);
    }

    SECTION("negative string with surrounding whitespace") {
        auto result = validate_numeric("  -3.5 ");
        REQUIRE(result.is_valid());
        REQUIRE(*result.normalized_as<double>() == -3.5);
    }
}

TEST_CASE("Numeric rejects absent and non-numeric input", "[validators][numeric]") {
    SECTION("absent") {
        auto result = validate_numeric(InputValue{});
        REQUIRE_FALSE(result.is_valid());
        REQUIRE(result.error_message() == "Numeric value is required");
        REQUIRE(result.error_kind() == ErrorKind::required);
    }

    SECTION("empty string") {
        REQUIRE(validate_numeric("").error_message() == "Numeric value is required");
    }

    SECTION("text") {
        auto result = validate_numeric("abc");
        REQUIRE(result.error_message() == "Invalid numeric value");
        REQUIRE(result.error_kind() == ErrorKind::format);
    }

    SECTION("non-finite") {
        auto result = validate_numeric(std::numeric_limits<double>::infinity());
        REQUIRE(result.error_message() == "Value must be a finite number");
        REQUIRE(validate_numeric("1e400").error_message() == "Value must be a finite number");
    }
}

TEST_CASE("Numeric bounds are inclusive", "[validators][numeric]") {
    ValidationConfig config;
    config.min = 0;
    config.max = 10;

    REQUIRE(validate_numeric(0, config).is_valid());
    REQUIRE(validate_numeric(10, config).is_valid());

    auto below = validate_numeric(-0.0001, config);
    REQUIRE_FALSE(below.is_valid());
    REQUIRE(below.error_message() == "Value must be at least 0");
    REQUIRE(below.error_kind() == ErrorKind::range);

    auto above = validate_numeric(10.5, config);
    REQUIRE_FALSE(above.is_valid());
    REQUIRE(above.error_message() == "Value must be at most 10");

    SECTION("fractional bounds are echoed as given") {
        ValidationConfig fractional;
        fractional.min = 0.5;
        REQUIRE(validate_numeric(0.25, fractional).error_message() ==
                "Value must be at least 0.5");
    }
}

TEST_CASE("Numeric decimal places", "[validators][numeric]") {
    ValidationConfig config;
    config.decimals = DecimalConfig{std::nullopt, 1};

    REQUIRE(validate_numeric(1.2, config).is_valid());
    REQUIRE(validate_numeric(3, config).is_valid());

    auto too_precise = validate_numeric(1.23, config);
    REQUIRE_FALSE(too_precise.is_valid());
    REQUIRE(too_precise.error_message() == "Must have at most 1 decimal places");

    SECTION("minimum decimals") {
        ValidationConfig min_config;
        min_config.decimals = DecimalConfig{2, std::nullopt};
        REQUIRE(validate_numeric("1.25", min_config).is_valid());
        REQUIRE(validate_numeric("1.5", min_config).error_message() ==
                "Must have at least 2 decimal places");
    }

    SECTION("bounds are checked before decimals") {
        ValidationConfig both;
        both.max = 1;
        both.decimals = DecimalConfig{std::nullopt, 0};
        REQUIRE(validate_numeric(1.55, both).error_message() == "Value must be at most 1");
    }
}
