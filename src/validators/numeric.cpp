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

// Numeric Validator - Implementation

#include "numeric.hpp"

#include <fmt/format.h>

#include <cmath>

#include "../core/utils.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::invalid_result;

core::ValidationResult validate_numeric(const core::InputValue& value,
                                        const core::ValidationConfig& config) {
    if (core::is_empty(value)) {
        return invalid_result(ErrorKind::required, "Numeric value is required", config);
    }

    const double number = core::parse_to_number(value);

    if (std::isnan(number)) {
        return invalid_result(ErrorKind::format, "Invalid numeric value", config);
    }

    if (!std::isfinite(number)) {
        return invalid_result(ErrorKind::range, "Value must be a finite number", config);
    }

    if (config.min && number < *config.min) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Value must be at least {}", core::format_number(*config.min)), config);
    }

    if (config.max && number > *config.max) {
        return invalid_result(
            ErrorKind::range,
            fmt::format("Value must be at most {}", core::format_number(*config.max)), config);
    }

    if (config.decimals) {
        const int decimal_places = core::count_decimal_places(number);

        if (config.decimals->min && decimal_places < *config.decimals->min) {
            return invalid_result(
                ErrorKind::range,
                fmt::format("Must have at least {} decimal places", *config.decimals->min), config);
        }

        if (config.decimals->max && decimal_places > *config.decimals->max) {
            return invalid_result(
                ErrorKind::range,
                fmt::format("Must have at most {} decimal places", *config.decimals->max), config);
        }
    }

    return core::ValidationResult::success(number);
}

}  // namespace veritas::validators
