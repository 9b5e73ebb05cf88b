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

// Email Validator - Simplified RFC 5322 address check

#pragma once

#include <cstddef>

#include "../core/types.hpp"

namespace veritas::validators {

constexpr std::size_t MAX_EMAIL_LENGTH = 254;  // RFC 5321 path limit
constexpr std::size_t MAX_EMAIL_LOCAL_PART_LENGTH = 64;

/// Validate an email address. Normalized value: trimmed, lowercased address.
[[nodiscard]] core::ValidationResult validate_email(const core::InputValue& value,
                                                    const core::ValidationConfig& config = {});

}  // namespace veritas::validators
