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

// URL Validator - Implementation

#include "url.hpp"

#include <string>

#include "../core/regex.hpp"
#include "../core/url.hpp"
#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

constexpr std::string_view kUrlPattern =
    R"re(^(?:(?:https?|ftp):\/\/)?(?:(?:[a-zA-Z0-9](?:[a-zA-Z0-9-]*[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}|localhost|\d{1,3}(?:\.\d{1,3}){3})(?::\d+)?(?:\/[^\s]*)?$)re";

const std::optional<core::Regex>& url_regex() {
    static const auto regex = core::Regex::compile(kUrlPattern);
    return regex;
}

}  // namespace

core::ValidationResult validate_url(const core::InputValue& value,
                                    const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "URL is required", config);
    }

    const std::string url{core::trim(value.to_text().value_or(""))};

    if (core::utf8_length(url) > MAX_URL_LENGTH) {
        return invalid_result(ErrorKind::range, "URL is too long (max 2048 characters)", config);
    }

    const std::string with_scheme =
        url.find("://") != std::string::npos ? url : "https://" + url;
    if (!core::url::parse_absolute(with_scheme)) {
        return invalid_result(ErrorKind::format, "Invalid URL format", config);
    }

    if (!core::matches_pattern(url_regex(), url)) {
        return invalid_result(ErrorKind::format, "Invalid URL format", config);
    }

    return core::ValidationResult::success(url);
}

}  // namespace veritas::validators
