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

// Phone Validator - International (E.164-style) numbers

#pragma once

#include "../core/types.hpp"

namespace veritas::validators {

/// Validate an international phone number: a leading '+', then 7 to 15 digits, the first
/// non-zero. Spaces, dashes, dots, parentheses and brackets are accepted as separators.
/// Normalized value: '+' followed by the digits only.
[[nodiscard]] core::ValidationResult validate_phone(const core::InputValue& value,
                                                    const core::ValidationConfig& config = {});

}  // namespace veritas::validators
