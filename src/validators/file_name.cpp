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

// File Name Validator - Implementation

#include "file_name.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <vector>

#include "../core/containers.hpp"
#include "../core/string_utils.hpp"
#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

constexpr std::string_view kForbiddenChars = "<>:\"/\\|?*";

const core::fast_set<std::string_view>& reserved_names() {
    static const core::fast_set<std::string_view> names = {
        "CON",  "PRN",  "AUX",  "NUL",  "COM1", "COM2", "COM3", "COM4",
        "COM5", "COM6", "COM7", "COM8", "COM9", "LPT1", "LPT2", "LPT3",
        "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
    };
    return names;
}

[[nodiscard]] bool has_control_char(std::string_view name) {
    return std::any_of(name.begin(), name.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x20; });
}

}  // namespace

std::string normalize_extension(std::string_view extension) {
    std::string normalized = core::to_lower(extension);
    if (normalized.empty() || normalized.front() != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

core::ValidationResult validate_file_name(const core::InputValue& value,
                                          const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "File name is required", config);
    }

    const std::string file_name{core::trim(value.to_text().value_or(""))};

    if (file_name.empty()) {
        return invalid_result(ErrorKind::required, "File name cannot be empty or only whitespace",
                              config);
    }

    const std::size_t length = core::utf8_length(file_name);
    const std::size_t max_length = config.max_length.value_or(DEFAULT_MAX_FILE_NAME_LENGTH);
    if (length > max_length) {
        return invalid_result(ErrorKind::range,
                              fmt::format("File name too long (max {} characters)", max_length),
                              config);
    }

    if (config.min_length && length < *config.min_length) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("File name too short (min {} characters)", *config.min_length), config);
    }

    if (const auto pos = file_name.find_first_of(kForbiddenChars); pos != std::string::npos) {
        return invalid_result(
            ErrorKind::format,
            fmt::format("File name contains forbidden character: {}", file_name[pos]), config);
    }

    if (has_control_char(file_name)) {
        return invalid_result(ErrorKind::format, "File name contains control characters", config);
    }

    if (file_name.back() == ' ' || file_name.back() == '.') {
        return invalid_result(ErrorKind::format, "File name cannot end with a space or dot",
                              config);
    }

    const std::string_view base_name = std::string_view(file_name).substr(0, file_name.find('.'));
    if (reserved_names().contains(core::to_upper(base_name))) {
        return invalid_result(
            ErrorKind::format,
            fmt::format("File name uses reserved Windows name: {}", base_name), config);
    }

    if (!config.accepted_file_extensions.empty()) {
        const auto dot = file_name.rfind('.');
        const std::string extension =
            dot == std::string::npos ? std::string{} : core::to_lower(file_name.substr(dot));

        std::vector<std::string> accepted;
        accepted.reserve(config.accepted_file_extensions.size());
        for (const auto& ext : config.accepted_file_extensions) {
            accepted.push_back(normalize_extension(ext));
        }

        if (std::find(accepted.begin(), accepted.end(), extension) == accepted.end()) {
            return invalid_result(
                ErrorKind::format,
                fmt::format("File extension not allowed. Accepted: {}", core::join(accepted, ", ")),
                config);
        }
    }

    return core::ValidationResult::success(file_name);
}

}  // namespace veritas::validators
