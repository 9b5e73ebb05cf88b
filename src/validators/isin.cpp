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

// ISIN Validator - Implementation

#include "isin.hpp"

#include <string>

#include "../core/regex.hpp"
#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

const std::optional<core::Regex>& isin_format_regex() {
    static const auto regex = core::Regex::compile("^[A-Z]{2}[A-Z0-9]{9}[0-9]$");
    return regex;
}

// Luhn sum with doubling at odd positions counted from the right (check digit at 0)
[[nodiscard]] int luhn_sum(std::string_view digits) {
    int sum = 0;
    const std::size_t length = digits.size();
    for (std::size_t i = 0; i < length; ++i) {
        int digit = digits[i] - '0';
        if ((length - 1 - i) % 2 == 1) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
    }
    return sum;
}

}  // namespace

core::ValidationResult validate_isin(const core::InputValue& value,
                                     const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "ISIN is required", config);
    }

    const std::string isin = core::sanitize_alphanumeric(value);

    if (!core::matches_pattern(isin_format_regex(), isin)) {
        return invalid_result(ErrorKind::format,
                              "Invalid ISIN format. Expected: 2-letter country code + 9 "
                              "alphanumeric characters + 1 check digit",
                              config);
    }

    if (luhn_sum(core::convert_letters_to_numbers(isin)) % 10 != 0) {
        return invalid_result(ErrorKind::checksum, "Invalid ISIN check digit", config);
    }

    return core::ValidationResult::success(isin);
}

}  // namespace veritas::validators
