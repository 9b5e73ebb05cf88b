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

// Date Validators - Calendar dates, birth dates and derived ages

#pragma once

#include "../core/types.hpp"

namespace veritas::validators {

/// Longest plausible human age in years
constexpr int MAX_AGE_YEARS = 130;

/// Validate a date (timestamp, epoch milliseconds or ISO 8601 string).
/// config.min / config.max are inclusive bounds in epoch milliseconds.
/// Normalized value: the parsed instant.
[[nodiscard]] core::ValidationResult validate_date(const core::InputValue& value,
                                                   const core::ValidationConfig& config = {});

/// Validate a birth date: a real date, not in the future and at most 130 years back.
/// config.reference_date replaces the current time when set.
[[nodiscard]] core::ValidationResult validate_birth_date(const core::InputValue& value,
                                                         const core::ValidationConfig& config = {});

/// Derive an age in whole years from a birth date and validate it.
/// The birth date comes from config.birth_date when set, otherwise from value.
/// config.min / config.max bound the age in years. Normalized value: the age (int).
[[nodiscard]] core::ValidationResult validate_age(const core::InputValue& value,
                                                  const core::ValidationConfig& config = {});

}  // namespace veritas::validators
