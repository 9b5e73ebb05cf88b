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

// File Name Validator - Cross-platform safe file names

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "../core/types.hpp"

namespace veritas::validators {

constexpr std::size_t DEFAULT_MAX_FILE_NAME_LENGTH = 255;

/// Validate a file name for use on Windows and POSIX file systems.
/// Rejects forbidden characters (< > : " / \ | ? *), ASCII control characters,
/// a trailing space or dot and the Windows device names (CON, COM1, LPT1, ...)
/// regardless of extension. config.max_length defaults to 255. When
/// config.accepted_file_extensions is non-empty the extension must be listed.
/// Normalized value: the trimmed name.
[[nodiscard]] core::ValidationResult validate_file_name(const core::InputValue& value,
                                                        const core::ValidationConfig& config = {});

/// Lowercased extension with its leading dot; ".txt" and "TXT" both give ".txt"
[[nodiscard]] std::string normalize_extension(std::string_view extension);

}  // namespace veritas::validators
