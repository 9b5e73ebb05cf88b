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

// Validation Result - Success/failure outcome shared by every validator

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "value.hpp"

namespace veritas::core {

/// Failure classification
enum class ErrorKind : uint8_t {
    required,  // value absent or empty
    format,    // structural or pattern mismatch
    range,     // numeric or length bounds
    checksum,  // structurally valid, failed a check digit / mod 97
    lookup,    // unknown classification (IBAN country, input type)
    internal,  // unexpected exception converted at the dispatch boundary
};

[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::required:
            return "required";
        case ErrorKind::format:
            return "format";
        case ErrorKind::range:
            return "range";
        case ErrorKind::checksum:
            return "checksum";
        case ErrorKind::lookup:
            return "lookup";
        case ErrorKind::internal:
            return "internal";
    }
    return "unknown";
}

/// Canonical form of a valid input. Numbers for numeric values, the integer age for
/// age checks, instants for dates, strings for everything else.
using NormalizedValue = std::variant<std::monostate, double, int, std::string, Timestamp>;

/// Outcome of a single validation call.
/// Either valid (optionally carrying a normalized value) or invalid with a non-empty message.
class ValidationResult {
public:
    [[nodiscard]] static ValidationResult success(NormalizedValue normalized = {}) {
        return ValidationResult(std::move(normalized));
    }

    /// An empty message is replaced with a generic one so a failure is never silent
    [[nodiscard]] static ValidationResult failure(ErrorKind kind, std::string message) {
        if (message.empty()) {
            message = "Invalid value";
        }
        return ValidationResult(kind, std::move(message));
    }

    [[nodiscard]] bool is_valid() const noexcept { return valid_; }
    [[nodiscard]] explicit operator bool() const noexcept { return valid_; }

    /// Empty for a valid result
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

    /// Meaningful only for an invalid result
    [[nodiscard]] ErrorKind error_kind() const noexcept { return kind_; }

    [[nodiscard]] const NormalizedValue& normalized_value() const noexcept { return normalized_; }

    [[nodiscard]] bool has_normalized_value() const noexcept {
        return !std::holds_alternative<std::monostate>(normalized_);
    }

    /// Typed view of the normalized value, nullptr if absent or of another type
    template <typename T>
    [[nodiscard]] const T* normalized_as() const noexcept {
        return std::get_if<T>(&normalized_);
    }

    bool operator==(const ValidationResult&) const = default;

private:
    explicit ValidationResult(NormalizedValue normalized)
        : valid_(true), normalized_(std::move(normalized)) {}

    ValidationResult(ErrorKind kind, std::string message)
        : valid_(false), kind_(kind), error_message_(std::move(message)) {}

    bool valid_ = false;
    ErrorKind kind_ = ErrorKind::internal;
    std::string error_message_;
    NormalizedValue normalized_;
};

}  // namespace veritas::core
