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

// GS1 Validators - GLN, GTIN and SSCC identifiers with the GS1 mod 10 check digit

#pragma once

#include <cstddef>
#include <string_view>

#include "../core/types.hpp"

namespace veritas::validators {

/// Check digit for a string of GS1 data digits (without the check digit).
/// Weights alternate 3, 1, 3, ... starting from the rightmost data digit.
[[nodiscard]] int gs1_check_digit(std::string_view data_digits) noexcept;

/// True for an all-digit code of a GS1 length (8, 12, 13, 14 or 18) whose last digit
/// matches gs1_check_digit() of the rest. A non-zero expected_length also pins the length.
[[nodiscard]] bool is_valid_gs1_code(std::string_view code,
                                     std::size_t expected_length = 0) noexcept;

/// Global Location Number, 13 digits. Non-digits are dropped before checking.
[[nodiscard]] core::ValidationResult validate_gln(const core::InputValue& value,
                                                  const core::ValidationConfig& config = {});

/// Global Trade Item Number: GTIN-8, GTIN-12 (UPC-A), GTIN-13 (EAN-13) or GTIN-14
[[nodiscard]] core::ValidationResult validate_gtin(const core::InputValue& value,
                                                   const core::ValidationConfig& config = {});

/// Serial Shipping Container Code, 18 digits
[[nodiscard]] core::ValidationResult validate_sscc(const core::InputValue& value,
                                                   const core::ValidationConfig& config = {});

}  // namespace veritas::validators
