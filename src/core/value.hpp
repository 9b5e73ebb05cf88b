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

// Input Value - Tagged union over the primitive kinds a validator accepts

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace veritas::core {

/// Millisecond-precision UTC instant (the resolution of a calendar timestamp)
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// Value handed to a validator: absent, text, number or timestamp.
/// Each validator owns its coercion from these kinds.
class InputValue {
public:
    InputValue() = default;
    InputValue(std::nullptr_t) {}
    InputValue(const char* text) {
        if (text != nullptr) {
            storage_ = std::string(text);
        }
    }
    InputValue(std::string text) : storage_(std::move(text)) {}
    InputValue(std::string_view text) : storage_(std::string(text)) {}
    InputValue(Timestamp timestamp) : storage_(timestamp) {}

    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
    InputValue(T number) : storage_(static_cast<double>(number)) {}

    [[nodiscard]] bool is_absent() const noexcept {
        return std::holds_alternative<std::monostate>(storage_);
    }
    [[nodiscard]] bool is_string() const noexcept {
        return std::holds_alternative<std::string>(storage_);
    }
    [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<double>(storage_); }
    [[nodiscard]] bool is_timestamp() const noexcept {
        return std::holds_alternative<Timestamp>(storage_);
    }

    /// Typed accessors; nullptr when the value holds another kind
    [[nodiscard]] const std::string* as_string() const noexcept {
        return std::get_if<std::string>(&storage_);
    }
    [[nodiscard]] const double* as_number() const noexcept { return std::get_if<double>(&storage_); }
    [[nodiscard]] const Timestamp* as_timestamp() const noexcept {
        return std::get_if<Timestamp>(&storage_);
    }

    /// Textual form used by the string-based validators.
    /// Numbers use the shortest round-trip representation, timestamps ISO 8601.
    /// Returns nullopt for an absent value.
    [[nodiscard]] std::optional<std::string> to_text() const;

    bool operator==(const InputValue& other) const = default;

private:
    std::variant<std::monostate, std::string, double, Timestamp> storage_;
};

/// Format a timestamp as YYYY-MM-DDTHH:MM:SS.mmmZ
[[nodiscard]] std::string format_timestamp(Timestamp timestamp);

/// Format a timestamp's calendar date as YYYY-MM-DD
[[nodiscard]] std::string format_date(Timestamp timestamp);

/// Format a number the way it is echoed back in messages: shortest round-trip digits,
/// fixed notation from 1e-6 up to (not including) 1e21 (1, 0.5, 0.00001), exponent form
/// outside that range (1e-7, 1.5e+21). NaN and infinities are spelled out.
[[nodiscard]] std::string format_number(double number);

}  // namespace veritas::core
