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

// Config Validator - Implementation

#include "config_validator.hpp"

#include <cctype>
#include <sstream>

#include "../core/containers.hpp"
#include "../core/string_utils.hpp"
#include "../core/utils.hpp"

namespace veritas::control {

namespace {

/// Validate one accepted extension
/// Returns empty string if valid, error message if invalid
[[nodiscard]] std::string validate_extension_name(std::string_view extension) {
    std::string_view name = extension;
    if (!name.empty() && name.front() == '.') {
        name.remove_prefix(1);
    }

    if (name.empty()) {
        return "Extension cannot be empty";
    }
    if (extension.length() > MAX_EXTENSION_LENGTH) {
        std::ostringstream msg;
        msg << "Extension too long (" << extension.length() << " > " << MAX_EXTENSION_LENGTH
            << " chars)";
        return msg.str();
    }

    // Character whitelist: [a-zA-Z0-9_-] plus inner dots for compound extensions
    for (size_t i = 0; i < name.length(); ++i) {
        char c = name[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            std::ostringstream msg;
            msg << "Invalid character '" << c << "' at position " << i
                << " (only alphanumeric, underscore, hyphen and dot allowed)";
            return msg.str();
        }
    }

    if (name.back() == '.') {
        return "Extension cannot end with a dot";
    }

    return "";
}

}  // namespace

ConfigDiagnostics ConfigValidator::validate(const core::ValidationConfig& config) {
    ConfigDiagnostics result;
    validate(config, result);
    return result;
}

void ConfigValidator::validate(const core::ValidationConfig& config, ConfigDiagnostics& result) {
    validate_bounds(config, result);
    validate_extensions(config, result);

    if (config.custom_error_message.has_value() && config.custom_error_message->empty()) {
        result.add_warning("customErrorMessage is empty and will be ignored");
    }
}

void ConfigValidator::validate_bounds(const core::ValidationConfig& config,
                                      ConfigDiagnostics& result) {
    if (config.min && config.max && *config.min > *config.max) {
        std::ostringstream msg;
        msg << "min (" << core::format_number(*config.min) << ") is greater than max ("
            << core::format_number(*config.max) << ")";
        result.add_error(msg.str());
    }

    if (config.min_length && config.max_length && *config.min_length > *config.max_length) {
        std::ostringstream msg;
        msg << "minLength (" << *config.min_length << ") is greater than maxLength ("
            << *config.max_length << ")";
        result.add_error(msg.str());
    }

    if (config.fix_length) {
        const size_t fixed = *config.fix_length;
        if ((config.min_length && fixed < *config.min_length) ||
            (config.max_length && fixed > *config.max_length)) {
            result.add_error("fixLength (" + std::to_string(fixed) +
                             ") lies outside [minLength, maxLength]; no text can pass");
        } else if (config.min_length || config.max_length) {
            result.add_warning("fixLength makes minLength/maxLength redundant");
        }
    }

    if (config.decimals) {
        const auto& decimals = *config.decimals;
        if (decimals.min && decimals.max && *decimals.min > *decimals.max) {
            std::ostringstream msg;
            msg << "decimals.min (" << *decimals.min << ") is greater than decimals.max ("
                << *decimals.max << ")";
            result.add_error(msg.str());
        }
    }
}

void ConfigValidator::validate_extensions(const core::ValidationConfig& config,
                                          ConfigDiagnostics& result) {
    if (config.accepted_file_extensions.size() > MAX_ACCEPTED_EXTENSIONS) {
        std::ostringstream msg;
        msg << "Too many accepted extensions (" << config.accepted_file_extensions.size() << " > "
            << MAX_ACCEPTED_EXTENSIONS << ")";
        result.add_error(msg.str());
        return;
    }

    core::fast_set<std::string> seen;
    for (const auto& extension : config.accepted_file_extensions) {
        std::string error = validate_extension_name(extension);
        if (!error.empty()) {
            result.add_error("Invalid accepted extension '" + extension + "': " + error);
            continue;
        }

        std::string normalized = core::to_lower(extension);
        if (normalized.front() != '.') {
            normalized.insert(normalized.begin(), '.');
        }
        if (!seen.insert(normalized).second) {
            result.add_warning("Duplicate accepted extension '" + extension + "'");
        }
    }
}

void ConfigValidator::validate_option_names(const nlohmann::json& object,
                                            const std::vector<std::string>& known,
                                            std::string_view context, ConfigDiagnostics& result) {
    if (!object.is_object()) {
        return;
    }
    for (const auto& [key, _] : object.items()) {
        bool found = false;
        for (const auto& name : known) {
            if (name == key) {
                found = true;
                break;
            }
        }
        if (found) {
            continue;
        }

        std::ostringstream msg;
        msg << "Unknown " << context << " option '" << key << "'";
        std::string suggestion = suggest_similar(key, known);
        if (!suggestion.empty()) {
            msg << ". Did you mean: " << suggestion;
        }
        result.add_warning(msg.str());
    }
}

std::string ConfigValidator::suggest_similar(const std::string& typo,
                                             const std::vector<std::string>& known) {
    // Limit typo length to bound fuzzy matching cost
    if (typo.length() > MAX_OPTION_NAME_LENGTH) {
        return "";
    }

    std::vector<std::string> similar =
        core::find_similar_strings(typo, known, MAX_LEVENSHTEIN_DISTANCE);

    if (similar.size() > MAX_FUZZY_MATCH_CANDIDATES) {
        similar.resize(MAX_FUZZY_MATCH_CANDIDATES);
    }

    return core::join(similar, ", ");
}

}  // namespace veritas::control
