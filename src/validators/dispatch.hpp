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

// Master Dispatch - Routes an input type to its validator

#pragma once

#include <string_view>

#include "../core/types.hpp"

namespace veritas::validators {

/// Validate value as the given input type. The value and config are forwarded unchanged
/// and the validator's result returned as is. An exception escaping a validator becomes
/// an internal failure; none propagates to the caller.
[[nodiscard]] core::ValidationResult validate_input(const core::InputValue& value,
                                                    core::InputType type,
                                                    const core::ValidationConfig& config = {});

/// Same, selecting the validator by wire name ("numeric", "fileName", ...).
/// An unregistered name fails with "Unknown input type: <name>".
[[nodiscard]] core::ValidationResult validate_input(const core::InputValue& value,
                                                    std::string_view type_name,
                                                    const core::ValidationConfig& config = {});

}  // namespace veritas::validators
