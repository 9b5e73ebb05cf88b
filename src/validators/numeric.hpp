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

// Numeric Validator - Bounds and decimal precision

#pragma once

#include "../core/types.hpp"

namespace veritas::validators {

/// Validate a number or numeric string.
/// Thousands separators are accepted ("1,234.5"). min/max and decimals.min/max are
/// inclusive. The normalized value is the parsed double.
[[nodiscard]] core::ValidationResult validate_numeric(const core::InputValue& value,
                                                      const core::ValidationConfig& config = {});

}  // namespace veritas::validators
