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

// Input Value - Implementation

#include "value.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace veritas::core {

std::optional<std::string> InputValue::to_text() const {
    if (const auto* text = as_string()) {
        return *text;
    }
    if (const auto* number = as_number()) {
        return format_number(*number);
    }
    if (const auto* timestamp = as_timestamp()) {
        return format_timestamp(*timestamp);
    }
    return std::nullopt;
}

std::string format_number(double number) {
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "Infinity" : "-Infinity";
    }
    if (number == 0) {
        return "0";
    }

    // Shortest round-trip digits in scientific form, e.g. "1.2345e-05"
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                   std::fabs(number), std::chars_format::scientific);
    if (ec != std::errc{}) {
        return fmt::format("{}", number);
    }
    const std::string_view repr(buffer.data(), static_cast<size_t>(end - buffer.data()));
    const size_t e_pos = repr.find('e');

    std::string digits;
    for (char c : repr.substr(0, e_pos)) {
        if (c != '.') {
            digits.push_back(c);
        }
    }
    std::string_view exp_text = repr.substr(e_pos + 1);
    if (exp_text.front() == '+') {
        exp_text.remove_prefix(1);
    }
    int exponent = 0;
    std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);

    // Fixed notation for 1e-6 <= |number| < 1e21, exponent form outside that range
    const int k = static_cast<int>(digits.size());
    const int n = exponent + 1;
    std::string out = number < 0 ? "-" : "";
    if (k <= n && n <= 21) {
        out += digits;
        out.append(static_cast<size_t>(n - k), '0');
    } else if (0 < n && n <= 21) {
        out += digits.substr(0, static_cast<size_t>(n));
        out += '.';
        out += digits.substr(static_cast<size_t>(n));
    } else if (-6 < n && n <= 0) {
        out += "0.";
        out.append(static_cast<size_t>(-n), '0');
        out += digits;
    } else {
        out += digits.front();
        if (k > 1) {
            out += '.';
            out += digits.substr(1);
        }
        out += fmt::format("e{}{}", exponent < 0 ? '-' : '+', std::abs(exponent));
    }
    return out;
}

std::string format_date(Timestamp timestamp) {
    const auto day = std::chrono::floor<std::chrono::days>(timestamp);
    const std::chrono::year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

std::string format_timestamp(Timestamp timestamp) {
    const auto day = std::chrono::floor<std::chrono::days>(timestamp);
    const std::chrono::hh_mm_ss<std::chrono::milliseconds> time{timestamp - day};
    return fmt::format("{}T{:02}:{:02}:{:02}.{:03}Z", format_date(timestamp), time.hours().count(),
                       time.minutes().count(), time.seconds().count(),
                       time.subseconds().count());
}

}  // namespace veritas::core
