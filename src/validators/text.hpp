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

// Text Validators - Free text, alphabetic and alphanumeric input

#pragma once

#include "../core/types.hpp"

namespace veritas::validators {

/// Trimmed text checked against fixLength, minLength, maxLength (in that order).
/// allowSpecialChars == false restricts it to letters, digits and whitespace.
[[nodiscard]] core::ValidationResult validate_text(const core::InputValue& value,
                                                   const core::ValidationConfig& config = {});

/// Letters and whitespace only, then the text length rules
[[nodiscard]] core::ValidationResult validate_alpha(const core::InputValue& value,
                                                    const core::ValidationConfig& config = {});

/// validate_text with allowSpecialChars forced to false
[[nodiscard]] core::ValidationResult validate_alphanumeric(
    const core::InputValue& value, const core::ValidationConfig& config = {});

}  // namespace veritas::validators
