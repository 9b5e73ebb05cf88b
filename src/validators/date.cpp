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

// Date Validators - Implementation

#include "date.hpp"

#include <fmt/format.h>

#include <chrono>

#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

namespace {

[[nodiscard]] core::Timestamp reference_now(const core::ValidationConfig& config) {
    if (config.reference_date) {
        return *config.reference_date;
    }
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

// Bounds are epoch milliseconds; a bound outside the representable range is ignored
[[nodiscard]] std::optional<core::Timestamp> bound_to_timestamp(
    const std::optional<double>& bound) {
    if (!bound) {
        return std::nullopt;
    }
    return core::parse_to_date(core::InputValue{*bound});
}

}  // namespace

core::ValidationResult validate_date(const core::InputValue& value,
                                     const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "Date is required", config);
    }

    const auto date = core::parse_to_date(value);
    if (!date) {
        return invalid_result(ErrorKind::format, "Invalid date format", config);
    }

    if (const auto min_date = bound_to_timestamp(config.min); min_date && *date < *min_date) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Date must be on or after {}", core::format_date(*min_date)), config);
    }

    if (const auto max_date = bound_to_timestamp(config.max); max_date && *date > *max_date) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Date must be on or before {}", core::format_date(*max_date)), config);
    }

    return core::ValidationResult::success(*date);
}

core::ValidationResult validate_birth_date(const core::InputValue& value,
                                           const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "Birth date is required", config);
    }

    const auto date = core::parse_to_date(value);
    if (!date) {
        return invalid_result(ErrorKind::format, "Invalid date format", config);
    }

    const auto now = reference_now(config);
    if (*date > now) {
        return invalid_result(ErrorKind::range, "Birth date cannot be in the future", config);
    }

    if (core::calculate_age(*date, now) > MAX_AGE_YEARS) {
        return invalid_result(ErrorKind::range,
                              "Birth date is too far in the past (max 130 years)", config);
    }

    return core::ValidationResult::success(*date);
}

core::ValidationResult validate_age(const core::InputValue& value,
                                    const core::ValidationConfig& config) {
    const core::InputValue& birth_value = config.birth_date.is_absent() ? value : config.birth_date;

    if (core::is_empty(birth_value)) {
        return invalid_result(ErrorKind::required, "Birth date is required to calculate age",
                              config);
    }

    const auto birth_date = core::parse_to_date(birth_value);
    if (!birth_date) {
        return invalid_result(ErrorKind::format, "Invalid birth date format", config);
    }

    const auto now = reference_now(config);
    if (*birth_date > now) {
        return invalid_result(ErrorKind::range, "Birth date cannot be in the future", config);
    }

    const int age = core::calculate_age(*birth_date, now);

    if (age < 0) {
        return invalid_result(ErrorKind::range, "Invalid age (negative)", config);
    }

    if (age > MAX_AGE_YEARS) {
        return invalid_result(ErrorKind::range, "Invalid age (exceeds 130 years)", config);
    }

    if (config.min && age < *config.min) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Age must be at least {}", core::format_number(*config.min)), config);
    }

    if (config.max && age > *config.max) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Age must be at most {}", core::format_number(*config.max)), config);
    }

    return core::ValidationResult::success(age);
}

}  // namespace veritas::validators
