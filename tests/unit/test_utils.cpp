// Veritas Shared Utilities Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <cmath>

#include "../../src/core/utils.hpp"

using namespace veritas::core;

TEST_CASE("Emptiness check", "[core][utils]") {
    REQUIRE(is_empty(InputValue{}));
    REQUIRE(is_empty(InputValue{nullptr}));
    REQUIRE(is_empty(InputValue{""}));

    REQUIRE_FALSE(is_empty(InputValue{" "}));
    REQUIRE_FALSE(is_empty(InputValue{0}));
    REQUIRE_FALSE(is_empty(InputValue{"0"}));
}

TEST_CASE("Trim removes surrounding ASCII whitespace", "[core][utils]") {
    REQUIRE(trim("  abc \t\n") == "abc");
    REQUIRE(trim("a b") == "a b");
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("Alphanumeric sanitization", "[core][utils]") {
    SECTION("strips whitespace and uppercases") {
        REQUIRE(sanitize_alphanumeric(InputValue{"gb82 west\t1234"}) == "GB82WEST1234");
    }

    SECTION("numbers sanitize through their text form") {
        REQUIRE(sanitize_alphanumeric(InputValue{5901234123457LL}) == "5901234123457");
    }

    SECTION("absent value sanitizes to empty") {
        REQUIRE(sanitize_alphanumeric(InputValue{}).empty());
    }
}

TEST_CASE("Letter to number conversion", "[core][utils]") {
    REQUIRE(letter_to_number('A') == "10");
    REQUIRE(letter_to_number('z') == "35");
    REQUIRE(letter_to_number('7') == "7");
    REQUIRE(convert_letters_to_numbers("US03") == "302803");
    REQUIRE(convert_letters_to_numbers("12") == "12");
}

TEST_CASE("Digit filter", "[core][utils]") {
    REQUIRE(digits_only("590-1234 123457") == "5901234123457");
}

TEST_CASE("UTF-8 length counts code points", "[core][utils]") {
    REQUIRE(utf8_length("") == 0);
    REQUIRE(utf8_length("abc") == 3);
    REQUIRE(utf8_length("Jos\xC3\xA9") == 4);
    REQUIRE(utf8_length("\xD0\x9F\xD1\x80\xD0\xB8") == 3);
    REQUIRE(utf8_length("\xE2\x82\xAC") == 1);
    REQUIRE(utf8_length("\xF0\x9F\x98\x80x") == 2);
}

TEST_CASE("Number formatting", "[core][value]") {
    REQUIRE(format_number(1.0) == "1");
    REQUIRE(format_number(-0.0) == "0");
    REQUIRE(format_number(0.5) == "0.5");
    REQUIRE(format_number(-12.25) == "-12.25");
    REQUIRE(format_number(1e-5) == "0.00001");
    REQUIRE(format_number(0.000001) == "0.000001");
    REQUIRE(format_number(1e-7) == "1e-7");
    REQUIRE(format_number(1.5e-7) == "1.5e-7");
    REQUIRE(format_number(1e16) == "10000000000000000");
    REQUIRE(format_number(123456789012345680000.0) == "123456789012345680000");
    REQUIRE(format_number(1e21) == "1e+21");
    REQUIRE(format_number(-1.5e300) == "-1.5e+300");
    REQUIRE(format_number(std::nan("")) == "NaN");
    REQUIRE(format_number(-INFINITY) == "-Infinity");
}

TEST_CASE("Decimal place counting", "[core][utils]") {
    REQUIRE(count_decimal_places(1.0) == 0);
    REQUIRE(count_decimal_places(42) == 0);
    REQUIRE(count_decimal_places(1.2) == 1);
    REQUIRE(count_decimal_places(1.23) == 2);
    REQUIRE(count_decimal_places(-0.005) == 3);

    SECTION("exponent notation adjusts the mantissa count") {
        REQUIRE(count_decimal_places(1e-7) == 7);
        REQUIRE(count_decimal_places(1.5e-7) == 8);
        REQUIRE(count_decimal_places(1e21) == 0);
    }

    SECTION("non-finite values have no decimals") {
        REQUIRE(count_decimal_places(std::nan("")) == 0);
        REQUIRE(count_decimal_places(INFINITY) == 0);
    }
}

TEST_CASE("Numeric coercion", "[core][utils]") {
    REQUIRE(parse_to_number(InputValue{3.5}) == 3.5);
    REQUIRE(parse_to_number(InputValue{"42"}) == 42.0);
    REQUIRE(parse_to_number(InputValue{" -7.25 "}) == -7.25);
    REQUIRE(parse_to_number(InputValue{"+12"}) == 12.0);

    SECTION("thousands separators are removed") {
        REQUIRE(parse_to_number(InputValue{"1,234,567.5"}) == 1234567.5);
    }

    SECTION("longest numeric prefix is parsed") {
        REQUIRE(parse_to_number(InputValue{"12abc"}) == 12.0);
    }

    SECTION("non-numeric text yields NaN") {
        REQUIRE(std::isnan(parse_to_number(InputValue{"abc"})));
        REQUIRE(std::isnan(parse_to_number(InputValue{"+-1"})));
        REQUIRE(std::isnan(parse_to_number(InputValue{})));
    }

    SECTION("overflow yields infinity") {
        REQUIRE(std::isinf(parse_to_number(InputValue{"1e400"})));
        REQUIRE(parse_to_number(InputValue{"-1e400"}) < 0);
        REQUIRE(parse_to_number(InputValue{"1e-400"}) == 0.0);
    }
}

TEST_CASE("ISO 8601 parsing", "[core][utils][date]") {
    using namespace std::chrono;

    SECTION("date only is midnight UTC") {
        auto ts = parse_iso8601("2024-01-15");
        REQUIRE(ts.has_value());
        REQUIRE(format_timestamp(*ts) == "2024-01-15T00:00:00.000Z");
    }

    SECTION("date-time with fraction and Z") {
        auto ts = parse_iso8601("2024-01-15T10:30:45.123Z");
        REQUIRE(ts.has_value());
        REQUIRE(format_timestamp(*ts) == "2024-01-15T10:30:45.123Z");
    }

    SECTION("offsets are converted to UTC") {
        auto ts = parse_iso8601("2024-01-15T10:30:00+02:00");
        REQUIRE(ts.has_value());
        REQUIRE(format_timestamp(*ts) == "2024-01-15T08:30:00.000Z");

        auto compact = parse_iso8601("2024-01-15T10:30-0130");
        REQUIRE(compact.has_value());
        REQUIRE(format_timestamp(*compact) == "2024-01-15T12:00:00.000Z");
    }

    SECTION("year and year-month forms") {
        REQUIRE(format_date(*parse_iso8601("2024")) == "2024-01-01");
        REQUIRE(format_date(*parse_iso8601("2024-06")) == "2024-06-01");
    }

    SECTION("impossible calendar dates are rejected") {
        REQUIRE_FALSE(parse_iso8601("2024-02-30").has_value());
        REQUIRE_FALSE(parse_iso8601("2023-02-29").has_value());
        REQUIRE_FALSE(parse_iso8601("2024-13-01").has_value());
        REQUIRE(parse_iso8601("2024-02-29").has_value());
    }

    SECTION("malformed text is rejected") {
        REQUIRE_FALSE(parse_iso8601("15/01/2024").has_value());
        REQUIRE_FALSE(parse_iso8601("2024-01-15T25:00").has_value());
        REQUIRE_FALSE(parse_iso8601("2024-01-15Tfoo").has_value());
        REQUIRE_FALSE(parse_iso8601("2024-01-15Z").has_value());
        REQUIRE_FALSE(parse_iso8601("not a date").has_value());
    }
}

TEST_CASE("Date coercion", "[core][utils][date]") {
    using namespace std::chrono;

    SECTION("numbers are epoch milliseconds") {
        auto ts = parse_to_date(InputValue{0});
        REQUIRE(ts.has_value());
        REQUIRE(format_timestamp(*ts) == "1970-01-01T00:00:00.000Z");

        REQUIRE(format_date(*parse_to_date(InputValue{86'400'000})) == "1970-01-02");
    }

    SECTION("out-of-range numbers are rejected") {
        REQUIRE_FALSE(parse_to_date(InputValue{9e15}).has_value());
        REQUIRE_FALSE(parse_to_date(InputValue{std::nan("")}).has_value());
    }

    SECTION("timestamps pass through") {
        Timestamp ts{milliseconds{1'700'000'000'000}};
        REQUIRE(parse_to_date(InputValue{ts}) == ts);
    }

    SECTION("strings are trimmed before parsing") {
        REQUIRE(parse_to_date(InputValue{" 2024-01-15 "}).has_value());
    }

    SECTION("absent value has no date") {
        REQUIRE_FALSE(parse_to_date(InputValue{}).has_value());
    }
}

TEST_CASE("Age calculation", "[core][utils][date]") {
    auto at = [](const char* text) { return *parse_iso8601(text); };

    REQUIRE(calculate_age(at("1990-05-20"), at("2024-05-20")) == 34);
    REQUIRE(calculate_age(at("1990-05-20"), at("2024-05-19")) == 33);
    REQUIRE(calculate_age(at("1990-05-20"), at("2024-12-31")) == 34);
    REQUIRE(calculate_age(at("2000-02-29"), at("2023-02-28")) == 22);
    REQUIRE(calculate_age(at("2000-02-29"), at("2024-02-29")) == 24);
}
