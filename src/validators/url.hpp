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

// URL Validator - Absolute URL parse plus strict host pattern

#pragma once

#include <cstddef>

#include "../core/types.hpp"

namespace veritas::validators {

constexpr std::size_t MAX_URL_LENGTH = 2048;

/// Validate a web URL. The scheme is optional (https:// is assumed for parsing), and
/// when present must be http, https or ftp. The host must be a dotted domain with a
/// TLD, localhost or a dotted-quad IPv4 address. A value must pass both the structural
/// parse and the host pattern. Normalized value: the trimmed URL as given.
[[nodiscard]] core::ValidationResult validate_url(const core::InputValue& value,
                                                  const core::ValidationConfig& config = {});

}  // namespace veritas::validators
