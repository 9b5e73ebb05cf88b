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

// Configuration Validator - Consistency & Typo Detection

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace veritas::control {

// Limits applied to configured file extensions
constexpr size_t MAX_EXTENSION_LENGTH = 32;
constexpr size_t MAX_ACCEPTED_EXTENSIONS = 256;

// Fuzzy matching limits for typo suggestions
constexpr size_t MAX_OPTION_NAME_LENGTH = 64;
constexpr size_t MAX_LEVENSHTEIN_DISTANCE = 2;
constexpr size_t MAX_FUZZY_MATCH_CANDIDATES = 3;

/// Semantic checks on a ValidationConfig beyond what JSON parsing enforces
class ConfigValidator {
public:
    /// Validate bounds consistency and accepted extensions
    [[nodiscard]] static ConfigDiagnostics validate(const core::ValidationConfig& config);

    /// Same checks, appended to existing diagnostics
    static void validate(const core::ValidationConfig& config, ConfigDiagnostics& result);

    /// Warn about keys of a JSON object that are not known option names
    static void validate_option_names(const nlohmann::json& object,
                                      const std::vector<std::string>& known,
                                      std::string_view context, ConfigDiagnostics& result);

    /// Suggest known names close to a typo (empty if none)
    [[nodiscard]] static std::string suggest_similar(const std::string& typo,
                                                     const std::vector<std::string>& known);

private:
    /// min/max, length and decimal bounds must describe a non-empty range
    static void validate_bounds(const core::ValidationConfig& config, ConfigDiagnostics& result);

    /// Extensions must be short, non-empty file-name-safe suffixes
    static void validate_extensions(const core::ValidationConfig& config,
                                    ConfigDiagnostics& result);
};

}  // namespace veritas::control
