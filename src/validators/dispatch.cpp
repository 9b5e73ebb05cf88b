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

// Master Dispatch - Implementation

#include "dispatch.hpp"

#include <fmt/format.h>

#include <exception>
#include <string>

#include "../core/logging.hpp"
#include "date.hpp"
#include "email.hpp"
#include "file_name.hpp"
#include "gs1.hpp"
#include "iban.hpp"
#include "isin.hpp"
#include "numeric.hpp"
#include "phone.hpp"
#include "text.hpp"
#include "url.hpp"

namespace veritas::validators {

using core::ErrorKind;
using core::InputType;
using core::invalid_result;

namespace {

core::ValidationResult route(const core::InputValue& value, InputType type,
                             const core::ValidationConfig& config) {
    switch (type) {
        case InputType::numeric:
            return validate_numeric(value, config);
        case InputType::text:
            return validate_text(value, config);
        case InputType::email:
            return validate_email(value, config);
        case InputType::url:
            return validate_url(value, config);
        case InputType::phone:
            return validate_phone(value, config);
        case InputType::iban:
            return validate_iban(value, config);
        case InputType::isin:
            return validate_isin(value, config);
        case InputType::gln:
            return validate_gln(value, config);
        case InputType::gtin:
            return validate_gtin(value, config);
        case InputType::date:
            return validate_date(value, config);
        case InputType::age:
            return validate_age(value, config);
        case InputType::file_name:
            return validate_file_name(value, config);
    }
    return invalid_result(ErrorKind::lookup,
                          fmt::format("Unknown input type: {}", static_cast<int>(type)), config);
}

}  // namespace

core::ValidationResult validate_input(const core::InputValue& value, InputType type,
                                      const core::ValidationConfig& config) {
    auto* logger = logging::get_current_logger();
    const std::string_view type_name = core::input_type_name(type);

    try {
        auto result = route(value, type, config);
        if (!result.is_valid() && logger) {
            LOG_VALIDATION_FAILURE(logger, type_name, core::error_kind_name(result.error_kind()),
                                   result.error_message());
        }
        return result;
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Validator for type '{}' threw: {}", type_name, e.what());
        }
        return invalid_result(ErrorKind::internal, "Validation failed due to an internal error",
                              config);
    }
}

core::ValidationResult validate_input(const core::InputValue& value, std::string_view type_name,
                                      const core::ValidationConfig& config) {
    const auto type = core::parse_input_type(type_name);
    if (!type) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "Unknown input type requested: {}", type_name);
        }
        return invalid_result(ErrorKind::lookup,
                              fmt::format("Unknown input type: {}", type_name), config);
    }
    return validate_input(value, *type, config);
}

}  // namespace veritas::validators
