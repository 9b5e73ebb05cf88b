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

// Phone Validator - Implementation

#include "phone.hpp"

#include <cctype>
#include <cstddef>
#include <string>

#include "../core/regex.hpp"
#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

constexpr std::size_t MIN_PHONE_DIGITS = 7;

const std::optional<core::Regex>& phone_regex() {
    static const auto regex = core::Regex::compile(R"re(^\+[1-9][0-9]{0,14}$)re");
    return regex;
}

[[nodiscard]] bool is_separator(unsigned char c) {
    return std::isspace(c) || c == '-' || c == '.' || c == '(' || c == ')' || c == '[' ||
           c == ']';
}

}  // namespace

core::ValidationResult validate_phone(const core::InputValue& value,
                                      const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "Phone number is required", config);
    }

    const std::string raw{core::trim(value.to_text().value_or(""))};

    if (raw.empty() || raw.front() != '+') {
        return invalid_result(ErrorKind::format,
                              "Phone number must start with + for international format", config);
    }

    std::string normalized;
    normalized.reserve(raw.size());
    for (unsigned char c : raw) {
        if (!is_separator(c)) {
            normalized.push_back(static_cast<char>(c));
        }
    }

    if (!core::matches_pattern(phone_regex(), normalized)) {
        return invalid_result(ErrorKind::format,
                              "Invalid phone number format. Expected: + followed by 1-15 digits",
                              config);
    }

    if (normalized.size() - 1 < MIN_PHONE_DIGITS) {
        return invalid_result(ErrorKind::range, "Phone number too short (minimum 7 digits)",
                              config);
    }

    return core::ValidationResult::success(normalized);
}

}  // namespace veritas::validators
