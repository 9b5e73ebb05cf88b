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

// Veritas Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "../core/types.hpp"
#include "../core/utils.hpp"

namespace veritas::control {

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // json, text
    std::string output;           // Log directory (veritas.log appended); empty = console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Command-line front end configuration
struct ToolConfig {
    LogConfig logging;
    core::ValidationConfig validation;
};

/// Outcome of checking a configuration (distinct from a value's ValidationResult)
struct ConfigDiagnostics {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Option names recognized in a "validation" object
[[nodiscard]] const std::vector<std::string>& validation_option_names();

// All config types use custom from_json/to_json (no macros - avoids conflicts)

namespace detail {

/// Read a non-negative count; negative values are a configuration error
[[nodiscard]] inline std::size_t read_count(const nlohmann::json& j, const char* key) {
    auto value = j.at(key).get<int64_t>();
    if (value < 0) {
        throw std::invalid_argument(std::string(key) + " must be >= 0");
    }
    return static_cast<std::size_t>(value);
}

/// Read a non-negative count that must also fit in an int
[[nodiscard]] inline int read_int_count(const nlohmann::json& j, const char* key) {
    const std::size_t value = read_count(j, key);
    if (value > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string(key) + " must be <= " +
                                    std::to_string(std::numeric_limits<int>::max()));
    }
    return static_cast<int>(value);
}

/// Read a string or epoch-millisecond number as an input value
[[nodiscard]] inline core::InputValue read_date_value(const nlohmann::json& j) {
    if (j.is_string()) {
        return core::InputValue(j.get<std::string>());
    }
    if (j.is_number()) {
        return core::InputValue(j.get<double>());
    }
    if (j.is_null()) {
        return core::InputValue();
    }
    throw std::invalid_argument("date must be a string or a number");
}

}  // namespace detail

}  // namespace veritas::control

namespace veritas::core {

// Found by ADL on veritas::core types

inline void from_json(const nlohmann::json& j, DecimalConfig& d) {
    if (j.contains("min")) {
        d.min = control::detail::read_int_count(j, "min");
    }
    if (j.contains("max")) {
        d.max = control::detail::read_int_count(j, "max");
    }
}

inline void to_json(nlohmann::json& j, const DecimalConfig& d) {
    j = nlohmann::json::object();
    if (d.min) {
        j["min"] = *d.min;
    }
    if (d.max) {
        j["max"] = *d.max;
    }
}

inline void from_json(const nlohmann::json& j, ValidationConfig& c) {
    if (j.contains("min")) {
        c.min = j.at("min").get<double>();
    }
    if (j.contains("max")) {
        c.max = j.at("max").get<double>();
    }
    if (j.contains("minLength")) {
        c.min_length = control::detail::read_count(j, "minLength");
    }
    if (j.contains("maxLength")) {
        c.max_length = control::detail::read_count(j, "maxLength");
    }
    if (j.contains("fixLength")) {
        c.fix_length = control::detail::read_count(j, "fixLength");
    }
    if (j.contains("decimals")) {
        c.decimals = j.at("decimals").get<DecimalConfig>();
    }
    if (j.contains("allowSpecialChars")) {
        c.allow_special_chars = j.at("allowSpecialChars").get<bool>();
    }
    c.accepted_file_extensions =
        j.value("acceptedFileExtensions", std::vector<std::string>());
    if (j.contains("customErrorMessage")) {
        c.custom_error_message = j.at("customErrorMessage").get<std::string>();
    }
    if (j.contains("birthDate")) {
        c.birth_date = control::detail::read_date_value(j.at("birthDate"));
    }
    if (j.contains("referenceDate")) {
        auto reference = parse_to_date(control::detail::read_date_value(j.at("referenceDate")));
        if (!reference) {
            throw std::invalid_argument("referenceDate is not a valid date");
        }
        c.reference_date = *reference;
    }
}

inline void to_json(nlohmann::json& j, const ValidationConfig& c) {
    j = nlohmann::json::object();
    if (c.min) {
        j["min"] = *c.min;
    }
    if (c.max) {
        j["max"] = *c.max;
    }
    if (c.min_length) {
        j["minLength"] = *c.min_length;
    }
    if (c.max_length) {
        j["maxLength"] = *c.max_length;
    }
    if (c.fix_length) {
        j["fixLength"] = *c.fix_length;
    }
    if (c.decimals) {
        j["decimals"] = *c.decimals;
    }
    if (c.allow_special_chars) {
        j["allowSpecialChars"] = *c.allow_special_chars;
    }
    if (!c.accepted_file_extensions.empty()) {
        j["acceptedFileExtensions"] = c.accepted_file_extensions;
    }
    if (c.custom_error_message) {
        j["customErrorMessage"] = *c.custom_error_message;
    }
    if (const auto* number = c.birth_date.as_number()) {
        j["birthDate"] = *number;
    } else if (auto text = c.birth_date.to_text()) {
        j["birthDate"] = *text;
    }
    if (c.reference_date) {
        j["referenceDate"] = format_timestamp(*c.reference_date);
    }
}

/// Serialized form handed to callers: isValid plus normalizedValue or errorMessage/errorKind
inline void to_json(nlohmann::json& j, const ValidationResult& r) {
    j = nlohmann::json{{"isValid", r.is_valid()}};
    if (!r.is_valid()) {
        j["errorMessage"] = r.error_message();
        j["errorKind"] = std::string(error_kind_name(r.error_kind()));
        return;
    }
    std::visit(
        [&j](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Timestamp>) {
                j["normalizedValue"] = format_timestamp(value);
            } else if constexpr (!std::is_same_v<T, std::monostate>) {
                j["normalizedValue"] = value;
            }
        },
        r.normalized_value());
}

}  // namespace veritas::core

namespace veritas::control {

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, ToolConfig& c) {
    // Use contains() + get() instead of value() to avoid default-value round trips
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("validation")) {
        j.at("validation").get_to(c.validation);
    }
}

inline void to_json(nlohmann::json& j, const ToolConfig& c) {
    j = nlohmann::json{{"logging", c.logging}, {"validation", c.validation}};
}

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<ToolConfig> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<ToolConfig> load_from_json(std::string_view json);

    /// Same as load_from_json, reporting why loading failed
    [[nodiscard]] static std::optional<ToolConfig> load_from_json(std::string_view json,
                                                                  ConfigDiagnostics& diagnostics);

    /// Validate configuration
    [[nodiscard]] static ConfigDiagnostics validate(const ToolConfig& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const ToolConfig& config);
};

/// One compact JSON line describing a validation outcome for the given input and type.
/// Invalid UTF-8 in any string is replaced with U+FFFD rather than throwing.
[[nodiscard]] std::string result_to_json_line(const core::ValidationResult& result,
                                              std::string_view input,
                                              std::string_view type_name);

}  // namespace veritas::control
