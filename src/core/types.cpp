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

// Validation Types - Implementation

#include "types.hpp"

#include <array>
#include <utility>

namespace veritas::core {

namespace {

constexpr std::array<std::pair<InputType, std::string_view>, 12> kInputTypeNames = {{
    {InputType::numeric, "numeric"},
    {InputType::text, "text"},
    {InputType::email, "email"},
    {InputType::url, "url"},
    {InputType::phone, "phone"},
    {InputType::iban, "iban"},
    {InputType::isin, "isin"},
    {InputType::gln, "gln"},
    {InputType::gtin, "gtin"},
    {InputType::date, "date"},
    {InputType::age, "age"},
    {InputType::file_name, "fileName"},
}};

}  // namespace

std::string_view input_type_name(InputType type) noexcept {
    for (const auto& [candidate, name] : kInputTypeNames) {
        if (candidate == type) {
            return name;
        }
    }
    return "";
}

std::optional<InputType> parse_input_type(std::string_view name) noexcept {
    for (const auto& [type, candidate] : kInputTypeNames) {
        if (candidate == name) {
            return type;
        }
    }
    return std::nullopt;
}

const std::vector<InputType>& all_input_types() {
    static const std::vector<InputType> types = [] {
        std::vector<InputType> out;
        out.reserve(kInputTypeNames.size());
        for (const auto& [type, _] : kInputTypeNames) {
            out.push_back(type);
        }
        return out;
    }();
    return types;
}

}  // namespace veritas::core
