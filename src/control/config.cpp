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

// Veritas Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_validator.hpp"

namespace veritas::control {

namespace {

const std::vector<std::string>& top_level_names() {
    static const std::vector<std::string> names = {"logging", "validation"};
    return names;
}

const std::vector<std::string>& logging_names() {
    static const std::vector<std::string> names = {"level", "format", "output", "rotation"};
    return names;
}

}  // namespace

const std::vector<std::string>& validation_option_names() {
    static const std::vector<std::string> names = {
        "min",      "max",       "minLength",         "maxLength",
        "fixLength", "decimals", "allowSpecialChars", "acceptedFileExtensions",
        "customErrorMessage",    "birthDate",         "referenceDate"};
    return names;
}

// ConfigLoader implementation

std::optional<ToolConfig> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<ToolConfig> ConfigLoader::load_from_json(std::string_view json) {
    ConfigDiagnostics diagnostics;
    auto config = load_from_json(json, diagnostics);

    for (const auto& warning : diagnostics.warnings) {
        fprintf(stderr, "Configuration warning: %s\n", warning.c_str());
    }
    for (const auto& error : diagnostics.errors) {
        fprintf(stderr, "Configuration error: %s\n", error.c_str());
    }
    return config;
}

std::optional<ToolConfig> ConfigLoader::load_from_json(std::string_view json,
                                                       ConfigDiagnostics& diagnostics) {
    ToolConfig config;
    nlohmann::json j;

    try {
        j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            diagnostics.add_error("Configuration root must be a JSON object");
            return std::nullopt;
        }
        config = j.get<ToolConfig>();
    } catch (const nlohmann::json::exception& e) {
        diagnostics.add_error(std::string("JSON parsing error: ") + e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        diagnostics.add_error(e.what());
        return std::nullopt;
    }

    // Typos in option names silently disable a rule, so surface them
    ConfigValidator::validate_option_names(j, top_level_names(), "top-level", diagnostics);
    if (j.contains("logging")) {
        ConfigValidator::validate_option_names(j.at("logging"), logging_names(), "logging",
                                               diagnostics);
    }
    if (j.contains("validation")) {
        ConfigValidator::validate_option_names(j.at("validation"), validation_option_names(),
                                               "validation", diagnostics);
    }

    auto validation = validate(config);
    for (auto& warning : validation.warnings) {
        diagnostics.add_warning(std::move(warning));
    }
    for (auto& error : validation.errors) {
        diagnostics.add_error(std::move(error));
    }

    if (diagnostics.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ConfigDiagnostics ConfigLoader::validate(const ToolConfig& config) {
    ConfigDiagnostics result;

    // Validate logging level
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    // Validate logging format
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (!config.logging.output.empty()) {
        if (config.logging.rotation.max_size_mb == 0) {
            result.add_error("Logging rotation max_size_mb must be > 0");
        }
        if (config.logging.rotation.max_files == 0) {
            result.add_warning("Logging rotation max_files is 0 (rotated logs are discarded)");
        }
    }

    ConfigValidator::validate(config.validation, result);

    return result;
}

std::string ConfigLoader::to_json(const ToolConfig& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

std::string result_to_json_line(const core::ValidationResult& result,
                                std::string_view input,
                                std::string_view type_name) {
    nlohmann::json line = result;
    line["input"] = std::string(input);
    line["type"] = std::string(type_name);
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace veritas::control
