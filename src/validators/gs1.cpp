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

// GS1 Validators - Implementation

#include "gs1.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <string>

#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

constexpr std::array<std::size_t, 5> kGs1Lengths = {8, 12, 13, 14, 18};
constexpr std::array<std::size_t, 4> kGtinLengths = {8, 12, 13, 14};

constexpr std::size_t GLN_LENGTH = 13;
constexpr std::size_t SSCC_LENGTH = 18;

template <std::size_t N>
[[nodiscard]] bool contains_length(const std::array<std::size_t, N>& lengths, std::size_t length) {
    return std::find(lengths.begin(), lengths.end(), length) != lengths.end();
}

[[nodiscard]] std::string sanitize_digits(const core::InputValue& value) {
    return core::digits_only(core::sanitize_alphanumeric(value));
}

}  // namespace

int gs1_check_digit(std::string_view data_digits) noexcept {
    int sum = 0;
    const std::size_t length = data_digits.size();
    for (std::size_t i = 0; i < length; ++i) {
        const int digit = data_digits[length - 1 - i] - '0';
        sum += digit * (i % 2 == 0 ? 3 : 1);
    }
    return (10 - (sum % 10)) % 10;
}

bool is_valid_gs1_code(std::string_view code, std::size_t expected_length) noexcept {
    if (code.empty() ||
        !std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    if (expected_length > 0 && code.size() != expected_length) {
        return false;
    }
    if (!contains_length(kGs1Lengths, code.size())) {
        return false;
    }
    return gs1_check_digit(code.substr(0, code.size() - 1)) == code.back() - '0';
}

core::ValidationResult validate_gln(const core::InputValue& value,
                                    const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "GLN is required", config);
    }

    const std::string gln = sanitize_digits(value);

    if (gln.size() != GLN_LENGTH) {
        return invalid_result(
            ErrorKind::format,
            fmt::format("Invalid GLN length. Expected 13 digits, got {}", gln.size()), config);
    }

    if (!is_valid_gs1_code(gln, GLN_LENGTH)) {
        return invalid_result(ErrorKind::checksum, "Invalid GLN check digit", config);
    }

    return core::ValidationResult::success(gln);
}

core::ValidationResult validate_gtin(const core::InputValue& value,
                                     const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "GTIN is required", config);
    }

    const std::string gtin = sanitize_digits(value);

    if (!contains_length(kGtinLengths, gtin.size())) {
        return invalid_result(
            ErrorKind::format,
            fmt::format("Invalid GTIN length. Expected 8, 12, 13, or 14 digits, got {}",
                        gtin.size()),
            config);
    }

    if (!is_valid_gs1_code(gtin)) {
        return invalid_result(ErrorKind::checksum, "Invalid GTIN check digit", config);
    }

    return core::ValidationResult::success(gtin);
}

core::ValidationResult validate_sscc(const core::InputValue& value,
                                     const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "SSCC is required", config);
    }

    const std::string sscc = sanitize_digits(value);

    if (sscc.size() != SSCC_LENGTH) {
        return invalid_result(
            ErrorKind::format,
            fmt::format("Invalid SSCC length. Expected 18 digits, got {}", sscc.size()), config);
    }

    if (!is_valid_gs1_code(sscc, SSCC_LENGTH)) {
        return invalid_result(ErrorKind::checksum, "Invalid SSCC check digit", config);
    }

    return core::ValidationResult::success(sscc);
}

}  // namespace veritas::validators
