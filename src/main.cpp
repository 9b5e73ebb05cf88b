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

// Veritas - Command-line entry point
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "control/config.hpp"
#include "control/config_validator.hpp"
#include "core/logging.hpp"
#include "validators/dispatch.hpp"

namespace {

constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --type <inputType> [--config <config.json>] [--log-level <level>] "
            "<value>...\n",
            program);
}

std::vector<std::string> known_type_names() {
    std::vector<std::string> names;
    for (auto type : veritas::core::all_input_types()) {
        names.emplace_back(veritas::core::input_type_name(type));
    }
    return names;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string type_name;
    std::string config_path;
    std::optional<std::string> log_level;
    std::vector<std::string> values;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--type" || arg == "--config" || arg == "--log-level") && i + 1 >= argc) {
            fprintf(stderr, "Missing value for %s\n", arg.c_str());
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
        if (arg == "--type") {
            type_name = argv[++i];
        } else if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--log-level") {
            log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            values.push_back(std::move(arg));
        }
    }

    if (type_name.empty() || values.empty()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (!veritas::core::parse_input_type(type_name)) {
        fprintf(stderr, "Unknown input type: %s\n", type_name.c_str());
        auto suggestion =
            veritas::control::ConfigValidator::suggest_similar(type_name, known_type_names());
        if (!suggestion.empty()) {
            fprintf(stderr, "Did you mean: %s\n", suggestion.c_str());
        }
        return EXIT_USAGE;
    }

    veritas::control::ToolConfig config;
    if (!config_path.empty()) {
        auto loaded = veritas::control::ConfigLoader::load_from_file(config_path);
        if (!loaded) {
            fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());
            return EXIT_USAGE;
        }
        config = std::move(*loaded);
    }
    if (log_level) {
        config.logging.level = *log_level;
        auto validation = veritas::control::ConfigLoader::validate(config);
        if (validation.has_errors()) {
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
            return EXIT_USAGE;
        }
    }

    veritas::logging::init_logging_system();
    veritas::logging::init_logger(config.logging);

    int exit_code = EXIT_SUCCESS;
    for (const auto& value : values) {
        auto result = veritas::validators::validate_input(veritas::core::InputValue{value},
                                                          type_name, config.validation);
        printf("%s\n",
               veritas::control::result_to_json_line(result, value, type_name).c_str());
        if (!result.is_valid()) {
            exit_code = EXIT_INVALID;
        }
    }

    veritas::logging::shutdown_logging();
    return exit_code;
}
