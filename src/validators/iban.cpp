/*
 * Copyright 2025 Veritas Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// IBAN Validator - Implementation

#include "iban.hpp"

#include <fmt/format.h>

#include <string>

#include "../core/containers.hpp"
#include "../core/regex.hpp"
#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

const core::fast_map<std::string_view, std::size_t>& iban_lengths() {
    static const core::fast_map<std::string_view, std::size_t> lengths = {
        {"AD", 24}, {"AE", 23}, {"AL", 28}, {"AT", 20}, {"AZ", 28}, {"BA", 20}, {"BE", 16},
        {"BG", 22}, {"BH", 22}, {"BR", 29}, {"BY", 28}, {"CH", 21}, {"CR", 22}, {"CY", 28},
        {"CZ", 24}, {"DE", 22}, {"DK", 18}, {"DO", 28}, {"EE", 20}, {"EG", 29}, {"ES", 24},
        {"FI", 18}, {"FO", 18}, {"FR", 27}, {"GB", 22}, {"GE", 22}, {"GI", 23}, {"GL", 18},
        {"GR", 27}, {"GT", 28}, {"HR", 21}, {"HU", 28}, {"IE", 22}, {"IL", 23}, {"IQ", 23},
        {"IS", 26}, {"IT", 27}, {"JO", 30}, {"KW", 30}, {"KZ", 20}, {"LB", 28}, {"LC", 32},
        {"LI", 21}, {"LT", 20}, {"LU", 20}, {"LV", 21}, {"MC", 27}, {"MD", 24}, {"ME", 22},
        {"MK", 19}, {"MR", 27}, {"MT", 31}, {"MU", 30}, {"NL", 18}, {"NO", 15}, {"PK", 24},
        {"PL", 28}, {"PS", 29}, {"PT", 25}, {"QA", 29}, {"RO", 24}, {"RS", 22}, {"SA", 24},
        {"SC", 31}, {"SE", 24}, {"SI", 19}, {"SK", 24}, {"SM", 27}, {"ST", 25}, {"SV", 28},
        {"TL", 23}, {"TN", 24}, {"TR", 26}, {"UA", 29}, {"VA", 22}, {"VG", 24}, {"XK", 20},
    };
    return lengths;
}

const std::optional<core::Regex>& iban_format_regex() {
    static const auto regex = core::Regex::compile("^[A-Z]{2}[0-9]{2}[A-Z0-9]+$");
    return regex;
}

}  // namespace

std::optional<std::size_t> iban_length_for_country(std::string_view country_code) {
    const auto& lengths = iban_lengths();
    auto it = lengths.find(country_code);
    if (it == lengths.end()) {
        return std::nullopt;
    }
    return it->second;
}

int iban_mod97(std::string_view alphanumeric) {
    int remainder = 0;
    for (char c : core::convert_letters_to_numbers(alphanumeric)) {
        if (c < '0' || c > '9') {
            continue;
        }
        remainder = (remainder * 10 + (c - '0')) % 97;
    }
    return remainder;
}

core::ValidationResult validate_iban(const core::InputValue& value,
                                     const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "IBAN is required", config);
    }

    const std::string iban = core::sanitize_alphanumeric(value);

    if (!core::matches_pattern(iban_format_regex(), iban)) {
        return invalid_result(
            ErrorKind::format,
            "Invalid IBAN format. Expected: 2-letter country code + 2 check digits + BBAN", config);
    }

    const std::string_view country_code = std::string_view(iban).substr(0, 2);
    const auto expected_length = iban_length_for_country(country_code);
    if (!expected_length) {
        return invalid_result(ErrorKind::lookup,
                              fmt::format("Unknown IBAN country code: {}", country_code), config);
    }

    if (iban.size() != *expected_length) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Invalid IBAN length for {}. Expected {} characters, got {}", country_code,
                        *expected_length, iban.size()),
            config);
    }

    // Move country code and check digits to the end before reducing
    const std::string rearranged = iban.substr(4) + iban.substr(0, 4);
    if (iban_mod97(rearranged) != 1) {
        return invalid_result(ErrorKind::checksum, "Invalid IBAN checksum", config);
    }

    return core::ValidationResult::success(iban);
}

}  // namespace veritas::validators
