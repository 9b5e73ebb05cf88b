// Veritas Regex Wrapper Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/core/regex.hpp"
#include "../../src/core/string_utils.hpp"

using namespace veritas::core;

TEST_CASE("Regex compilation", "[core][regex]") {
    SECTION("valid pattern") {
        auto regex = Regex::compile("^[A-Z]{2}[0-9]+$");
        REQUIRE(regex.has_value());
    }

    SECTION("invalid pattern reports an error") {
        std::string error;
        auto regex = Regex::compile("([unclosed", error);
        REQUIRE_FALSE(regex.has_value());
        REQUIRE_FALSE(error.empty());
        REQUIRE(error.find("([unclosed") != std::string::npos);
    }
}

TEST_CASE("Regex matching", "[core][regex]") {
    auto regex = Regex::compile("^[A-Z]{2}[0-9]+$");
    REQUIRE(regex.has_value());

    REQUIRE(regex->matches("GB82"));
    REQUIRE_FALSE(regex->matches("gb82"));
    REQUIRE_FALSE(regex->matches(""));

    SECTION("dollar does not match before a trailing newline") {
        REQUIRE_FALSE(regex->matches("GB82\n"));
    }

    SECTION("embedded NUL is part of the subject") {
        std::string subject("GB8", 3);
        subject.push_back('\0');
        REQUIRE_FALSE(regex->matches(subject));
    }

    SECTION("default-constructed view") {
        REQUIRE_FALSE(regex->matches(std::string_view{}));
    }
}

TEST_CASE("Pattern helper", "[core][regex]") {
    const auto valid = Regex::compile("^a+$");
    const std::optional<Regex> missing;

    REQUIRE(matches_pattern(valid, "aaa"));
    REQUIRE_FALSE(matches_pattern(valid, "ab"));
    REQUIRE_FALSE(matches_pattern(missing, "aaa"));
}

TEST_CASE("Regex move semantics", "[core][regex]") {
    auto first = Regex::compile("^x$");
    REQUIRE(first.has_value());

    Regex moved = std::move(*first);
    REQUIRE(moved.matches("x"));

    auto second = Regex::compile("^y$");
    REQUIRE(second.has_value());
    moved = std::move(*second);
    REQUIRE(moved.matches("y"));
    REQUIRE_FALSE(moved.matches("x"));
}

TEST_CASE("Levenshtein distance", "[core][string_utils]") {
    REQUIRE(levenshtein_distance("", "abc") == 3);
    REQUIRE(levenshtein_distance("abc", "") == 3);
    REQUIRE(levenshtein_distance("kitten", "sitting") == 3);
    REQUIRE(levenshtein_distance("maxLength", "maxLenght") == 2);
    REQUIRE(levenshtein_distance("same", "same") == 0);
}

TEST_CASE("Similar strings and join", "[core][string_utils]") {
    std::vector<std::string> candidates = {"email", "gln", "gtin", "isin", "iban"};

    auto similar = find_similar_strings("gtn", candidates, 1);
    REQUIRE(similar.size() == 2);
    REQUIRE(similar[0] == "gln");
    REQUIRE(similar[1] == "gtin");

    REQUIRE(find_similar_strings("email", candidates, 2).empty());
    REQUIRE(join({"a", "b", "c"}, ", ") == "a, b, c");
    REQUIRE(join({}, ", ").empty());
}
