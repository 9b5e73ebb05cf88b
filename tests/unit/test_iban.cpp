// Veritas IBAN Validator Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/validators/iban.hpp"

using namespace veritas::core;
using namespace veritas::validators;

namespace {

const char* const kValidIbans[] = {
    "GB82WEST12345698765432",      "DE89370400440532013000", "FR1420041010050500013M02606",
    "NL91ABNA0417164300",          "BE68539007547034",       "CH9300762011623852957",
    "NO9386011117947",
};

}  // namespace

TEST_CASE("IBAN accepts grouped input and normalizes it", "[validators][iban]") {
    auto result = validate_iban("GB82 WEST 1234 5698 7654 32");
    REQUIRE(result.is_valid());
    REQUIRE(*result.normalized_as<std::string>() == "GB82WEST12345698765432");

    SECTION("lowercase is uppercased") {
        auto lower = validate_iban("de89 3704 0044 0532 0130 00");
        REQUIRE(lower.is_valid());
        REQUIRE(*lower.normalized_as<std::string>() == "DE89370400440532013000");
    }

    SECTION("known valid IBANs across countries") {
        for (const char* iban : kValidIbans) {
            INFO(iban);
            REQUIRE(validate_iban(iban).is_valid());
        }
    }
}

TEST_CASE("IBAN checksum failure", "[validators][iban]") {
    auto result = validate_iban("GB82WEST12345698765433");
    REQUIRE_FALSE(result.is_valid());
    REQUIRE(result.error_message() == "Invalid IBAN checksum");
    REQUIRE(result.error_kind() == ErrorKind::checksum);
}

TEST_CASE("IBAN structural failures", "[validators][iban]") {
    REQUIRE(validate_iban(InputValue{}).error_message() == "IBAN is required");

    SECTION("format") {
        const std::string expected =
            "Invalid IBAN format. Expected: 2-letter country code + 2 check digits + BBAN";
        REQUIRE(validate_iban("1234").error_message() == expected);
        REQUIRE(validate_iban("GB8AWEST12345698765432").error_message() == expected);
        REQUIRE(validate_iban("GB82-WEST-1234").error_message() == expected);
    }

    SECTION("unknown country") {
        auto result = validate_iban("XX82WEST12345698765432");
        REQUIRE(result.error_message() == "Unknown IBAN country code: XX");
        REQUIRE(result.error_kind() == ErrorKind::lookup);
    }

    SECTION("country length") {
        REQUIRE(validate_iban("GB82WEST1234569876543").error_message() ==
                "Invalid IBAN length for GB. Expected 22 characters, got 21");
    }
}

TEST_CASE("IBAN single digit substitutions are detected", "[validators][iban][property]") {
    for (const char* iban : kValidIbans) {
        const std::string original = iban;
        for (size_t pos = 2; pos < original.size(); ++pos) {
            if (original[pos] < '0' || original[pos] > '9') {
                continue;
            }
            for (char digit = '0'; digit <= '9'; ++digit) {
                if (digit == original[pos]) {
                    continue;
                }
                std::string altered = original;
                altered[pos] = digit;
                INFO(altered);
                REQUIRE(validate_iban(altered).error_message() == "Invalid IBAN checksum");
            }
        }
    }
}

TEST_CASE("IBAN helpers", "[validators][iban]") {
    SECTION("mod 97 over arbitrarily long digit strings") {
        REQUIRE(iban_mod97("97") == 0);
        REQUIRE(iban_mod97("98") == 1);
        REQUIRE(iban_mod97("A") == 10);
        REQUIRE(iban_mod97("WEST12345698765432GB82") == 1);
        REQUIRE(iban_mod97(std::string(200, '9')) == iban_mod97(std::string(200, '9')));
    }

    SECTION("country length table") {
        REQUIRE(iban_length_for_country("GB") == 22u);
        REQUIRE(iban_length_for_country("NO") == 15u);
        REQUIRE(iban_length_for_country("LC") == 32u);
        REQUIRE_FALSE(iban_length_for_country("ZZ").has_value());
    }
}
