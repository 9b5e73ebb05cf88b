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

// ISIN Validator - ISO 6166 securities identifiers

#pragma once

#include "../core/types.hpp"

namespace veritas::validators {

/// Validate an ISIN: 2 letters, 9 alphanumerics, 1 digit, with a Luhn check over the
/// letter-expanded digit string. Normalized value: the ISIN without whitespace, uppercased.
[[nodiscard]] core::ValidationResult validate_isin(const core::InputValue& value,
                                                   const core::ValidationConfig& config = {});

}  // namespace veritas::validators
