// Veritas Master Dispatch Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/validators/dispatch.hpp"
#include "../../src/validators/email.hpp"
#include "../../src/validators/file_name.hpp"
#include "../../src/validators/gs1.hpp"
#include "../../src/validators/iban.hpp"
#include "../../src/validators/isin.hpp"
#include "../../src/validators/phone.hpp"

using namespace veritas::core;
using namespace veritas::validators;

TEST_CASE("Input type names", "[validators][dispatch]") {
    REQUIRE(input_type_name(InputType::file_name) == "fileName");
    REQUIRE(parse_input_type("fileName") == InputType::file_name);
    REQUIRE(parse_input_type("iban") == InputType::iban);
    REQUIRE_FALSE(parse_input_type("file_name").has_value());
    REQUIRE_FALSE(parse_input_type("IBAN").has_value());

    REQUIRE(all_input_types().size() == 12);
    for (auto type : all_input_types()) {
        REQUIRE(parse_input_type(input_type_name(type)) == type);
    }
}

TEST_CASE("Dispatch forwards to the matching validator", "[validators][dispatch]") {
    SECTION("literal scenarios through the dispatcher") {
        auto iban = validate_input("GB82 WEST 1234 5698 7654 32", InputType::iban);
        REQUIRE(iban.is_valid());
        REQUIRE(*iban.normalized_as<std::string>() == "GB82WEST12345698765432");

        REQUIRE(validate_input("GB82WEST12345698765433", InputType::iban).error_message() ==
                "Invalid IBAN checksum");
        REQUIRE(*validate_input("US0378331005", InputType::isin).normalized_as<std::string>() ==
                "US0378331005");
        REQUIRE(*validate_input("5901234123457", InputType::gtin).normalized_as<std::string>() ==
                "5901234123457");
        REQUIRE(*validate_input("+33-1-23-45-67-89", InputType::phone)
                     .normalized_as<std::string>() == "+33123456789");
        REQUIRE(validate_input("CON.txt", InputType::file_name).error_message() ==
                "File name uses reserved Windows name: CON");
    }

    SECTION("results match direct validator calls") {
        ValidationConfig config;
        config.max_length = 8;
        for (const char* value : {"a@b.com", "not-an-email", "report.pdf", "averylongname.txt"}) {
            REQUIRE(validate_input(value, InputType::email, config) == validate_email(value, config));
            REQUIRE(validate_input(value, InputType::file_name, config) ==
                    validate_file_name(value, config));
        }
        REQUIRE(validate_input("4006381333931", InputType::gln) == validate_gln("4006381333931"));
    }

    SECTION("every type reports a required failure for an absent value") {
        for (auto type : all_input_types()) {
            INFO(input_type_name(type));
            auto result = validate_input(InputValue{}, type);
            REQUIRE_FALSE(result.is_valid());
            REQUIRE(result.error_kind() == ErrorKind::required);
        }
    }
}

TEST_CASE("Dispatch by type name", "[validators][dispatch]") {
    REQUIRE(validate_input("42", "numeric").is_valid());
    REQUIRE(validate_input("notes.txt", "fileName").is_valid());

    auto unknown = validate_input("x", "creditCard");
    REQUIRE_FALSE(unknown.is_valid());
    REQUIRE(unknown.error_message() == "Unknown input type: creditCard");
    REQUIRE(unknown.error_kind() == ErrorKind::lookup);

    SECTION("out-of-range enum value") {
        auto result = validate_input("x", static_cast<InputType>(200));
        REQUIRE(result.error_message() == "Unknown input type: 200");
        REQUIRE(result.error_kind() == ErrorKind::lookup);
    }
}

TEST_CASE("Custom error message replaces every failure message", "[validators][dispatch]") {
    ValidationConfig config;
    config.custom_error_message = "Custom failure";

    for (auto type : all_input_types()) {
        INFO(input_type_name(type));
        auto result = validate_input("###", type, config);
        if (!result.is_valid()) {
            REQUIRE(result.error_message() == "Custom failure");
        }
    }

    SECTION("never turns a failure into a success") {
        auto result = validate_input("GB82WEST12345698765433", InputType::iban, config);
        REQUIRE_FALSE(result.is_valid());
        REQUIRE(result.error_kind() == ErrorKind::checksum);
        REQUIRE(result.error_message() == "Custom failure");
    }

    SECTION("applies to unknown types") {
        REQUIRE(validate_input("x", "unknown", config).error_message() == "Custom failure");
    }

    SECTION("an empty override is ignored") {
        ValidationConfig empty_override;
        empty_override.custom_error_message = "";
        REQUIRE(validate_input("abc", InputType::numeric, empty_override).error_message() ==
                "Invalid numeric value");
    }
}

TEST_CASE("Results are deterministic", "[validators][dispatch]") {
    ValidationConfig config;
    config.min = 1;
    for (auto type : all_input_types()) {
        if (type == InputType::age) {
            continue;
        }
        REQUIRE(validate_input("2024-01-15", type, config) ==
                validate_input("2024-01-15", type, config));
    }
}
