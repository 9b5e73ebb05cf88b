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

// Email Validator - Implementation

#include "email.hpp"

#include "../core/regex.hpp"
#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

// Local part of printable specials, then dot-separated labels of at most 63 characters
constexpr std::string_view kEmailPattern =
    R"re(^[a-zA-Z0-9.!#$%&'*+/=?^_`{|}~-]+@[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?(?:\.[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*$)re";

const std::optional<core::Regex>& email_regex() {
    static const auto regex = core::Regex::compile(kEmailPattern);
    return regex;
}

}  // namespace

core::ValidationResult validate_email(const core::InputValue& value,
                                      const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "Email is required", config);
    }

    const std::string email = core::to_lower(core::trim(value.to_text().value_or("")));

    if (core::utf8_length(email) > MAX_EMAIL_LENGTH) {
        return invalid_result(ErrorKind::range, "Email address is too long (max 254 characters)",
                              config);
    }

    const size_t at = email.find('@');
    if (at == std::string::npos) {
        return invalid_result(ErrorKind::format, "Invalid email format: missing @ symbol", config);
    }

    if (!core::matches_pattern(email_regex(), email)) {
        return invalid_result(ErrorKind::format, "Invalid email format", config);
    }

    // The pattern admits exactly one '@'
    const std::string_view local_part = std::string_view(email).substr(0, at);
    const std::string_view domain = std::string_view(email).substr(at + 1);

    if (core::utf8_length(local_part) > MAX_EMAIL_LOCAL_PART_LENGTH) {
        return invalid_result(ErrorKind::range, "Email local part too long (max 64 characters)",
                              config);
    }

    if (domain.find('.') == std::string_view::npos) {
        return invalid_result(ErrorKind::format, "Invalid email domain: missing top-level domain",
                              config);
    }

    return core::ValidationResult::success(email);
}

}  // namespace veritas::validators
