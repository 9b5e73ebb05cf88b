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

// Validation Types - Input type tags and per-call configuration

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"
#include "value.hpp"

namespace veritas::core {

/// Closed set of input types routed by the dispatcher
enum class InputType : uint8_t {
    numeric,
    text,
    email,
    url,
    phone,
    iban,
    isin,
    gln,
    gtin,
    date,
    age,
    file_name,
};

/// Wire name of an input type ("numeric", "fileName", ...)
[[nodiscard]] std::string_view input_type_name(InputType type) noexcept;

/// Reverse of input_type_name(); nullopt for an unregistered name
[[nodiscard]] std::optional<InputType> parse_input_type(std::string_view name) noexcept;

/// All registered input types, in declaration order
[[nodiscard]] const std::vector<InputType>& all_input_types();

/// Decimal precision bounds (inclusive)
struct DecimalConfig {
    std::optional<int> min;
    std::optional<int> max;

    bool operator==(const DecimalConfig&) const = default;
};

/// Options for a single validation call. Built fresh per call and never mutated.
struct ValidationConfig {
    // Numeric bounds; epoch milliseconds for dates, years for ages
    std::optional<double> min;
    std::optional<double> max;

    // Length bounds on the trimmed text
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::optional<std::size_t> fix_length;

    std::optional<DecimalConfig> decimals;

    // Text: false restricts to letters, digits and spaces
    std::optional<bool> allow_special_chars;

    // File name: accepted extensions, with or without the leading dot
    std::vector<std::string> accepted_file_extensions;

    // Replaces the generated message of any failure when non-empty
    std::optional<std::string> custom_error_message;

    // Age: birth date overriding the validated value
    InputValue birth_date;

    // Date/Age: instant used instead of the current time
    std::optional<Timestamp> reference_date;

    bool operator==(const ValidationConfig&) const = default;
};

/// Build a failure, honouring the config's custom message override
[[nodiscard]] inline ValidationResult invalid_result(ErrorKind kind, std::string message,
                                                     const ValidationConfig& config) {
    if (config.custom_error_message.has_value() && !config.custom_error_message->empty()) {
        return ValidationResult::failure(kind, *config.custom_error_message);
    }
    return ValidationResult::failure(kind, std::move(message));
}

}  // namespace veritas::core
