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

// Text Validators - Implementation

#include "text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

[[nodiscard]] bool is_letters_digits_spaces(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isalnum(c) || std::isspace(c);
    });
}

[[nodiscard]] bool is_letters_spaces(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isalpha(c) || std::isspace(c);
    });
}

}  // namespace

core::ValidationResult validate_text(const core::InputValue& value,
                                     const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "Text is required", config);
    }

    const std::string text{core::trim(value.to_text().value_or(""))};
    const std::size_t length = core::utf8_length(text);

    if (config.fix_length && length != *config.fix_length) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Text must be exactly {} characters", *config.fix_length), config);
    }

    if (config.min_length && length < *config.min_length) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Text must be at least {} characters", *config.min_length), config);
    }

    if (config.max_length && length > *config.max_length) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Text must be at most {} characters", *config.max_length), config);
    }

    if (config.allow_special_chars == false && !is_letters_digits_spaces(text)) {
        return invalid_result(ErrorKind::format,
                              "Text can only contain letters, numbers, and spaces", config);
    }

    return core::ValidationResult::success(text);
}

core::ValidationResult validate_alpha(const core::InputValue& value,
                                      const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "Text is required", config);
    }

    const std::string text{core::trim(value.to_text().value_or(""))};

    if (!is_letters_spaces(text)) {
        return invalid_result(ErrorKind::format, "Text can only contain letters and spaces",
                              config);
    }

    return validate_text(text, config);
}

core::ValidationResult validate_alphanumeric(const core::InputValue& value,
                                             const core::ValidationConfig& config) {
    core::ValidationConfig restricted = config;
    restricted.allow_special_chars = false;
    return validate_text(value, restricted);
}

}  // namespace veritas::validators
