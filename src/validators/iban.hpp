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

// IBAN Validator - ISO 13616 account numbers with ISO 7064 mod 97-10 check

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "../core/types.hpp"

namespace veritas::validators {

/// Registered IBAN length for a two-letter country code; nullopt when unknown
[[nodiscard]] std::optional<std::size_t> iban_length_for_country(std::string_view country_code);

/// Remainder modulo 97 of an alphanumeric string read as a decimal number after
/// mapping letters to 10..35. Computed digit by digit so any length works.
[[nodiscard]] int iban_mod97(std::string_view alphanumeric);

/// Validate an IBAN: format, country, per-country length and mod 97 == 1.
/// Normalized value: the IBAN without whitespace, uppercased.
[[nodiscard]] core::ValidationResult validate_iban(const core::InputValue& value,
                                                   const core::ValidationConfig& config = {});

}  // namespace veritas::validators
