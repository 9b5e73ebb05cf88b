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

// Shared Utilities - Sanitization, character conversion and coercion helpers

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "value.hpp"

namespace veritas::core {

/// True for null/absent values and the empty string
[[nodiscard]] bool is_empty(const InputValue& value) noexcept;

/// Remove leading and trailing ASCII whitespace
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

[[nodiscard]] std::string to_lower(std::string_view text);
[[nodiscard]] std::string to_upper(std::string_view text);

/// Strip all whitespace and uppercase. First step of every checksum-based validator.
/// An absent value sanitizes to the empty string.
[[nodiscard]] std::string sanitize_alphanumeric(const InputValue& value);

/// Keep only ASCII digits
[[nodiscard]] std::string digits_only(std::string_view text);

/// Number of UTF-8 code points in text. Continuation bytes (10xxxxxx) are not counted,
/// so malformed sequences still yield a length no greater than the byte count.
[[nodiscard]] std::size_t utf8_length(std::string_view text) noexcept;

/// ISO 7064 letter mapping: A=10 ... Z=35 (case-insensitive).
/// Any other character is returned unchanged.
[[nodiscard]] std::string letter_to_number(char c);

/// Apply letter_to_number() to every character
[[nodiscard]] std::string convert_letters_to_numbers(std::string_view text);

/// Number of fractional digits in the shortest representation of value.
/// Exponent notation adjusts the mantissa's count (1.5e-7 -> 8). Integers and
/// non-finite values yield 0.
[[nodiscard]] int count_decimal_places(double value) noexcept;

/// Coerce a string or number to a double. Thousands separators (',') are removed and the
/// longest numeric prefix is parsed. Returns NaN for anything non-numeric.
[[nodiscard]] double parse_to_number(const InputValue& value);

/// Coerce a timestamp, epoch-millisecond number or ISO 8601 string to an instant
[[nodiscard]] std::optional<Timestamp> parse_to_date(const InputValue& value);

/// Parse an ISO 8601 date or date-time (YYYY[-MM[-DD]][(T| )HH:MM[:SS[.fff]][Z|+HH:MM]])
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

/// Whole years between birth and reference, decremented when the reference
/// month/day falls before the birth month/day
[[nodiscard]] int calculate_age(Timestamp birth, Timestamp reference) noexcept;

}  // namespace veritas::core
