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

// Shared Utilities - Implementation

#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>

namespace veritas::core {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

// Largest instant a calendar timestamp may hold (+/- 100,000,000 days)
constexpr double kMaxEpochMillis = 8.64e15;

[[nodiscard]] bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// Parse exactly `width` digits at `pos`, advancing pos
[[nodiscard]] std::optional<int> read_fixed(std::string_view text, size_t& pos, size_t width) {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = text[pos + i];
        if (!is_digit(c)) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    pos += width;
    return value;
}

}  // namespace

bool is_empty(const InputValue& value) noexcept {
    if (value.is_absent()) {
        return true;
    }
    const auto* text = value.as_string();
    return text != nullptr && text->empty();
}

std::string_view trim(std::string_view text) noexcept {
    size_t start = text.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(kWhitespace);
    return text.substr(start, end - start + 1);
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string sanitize_alphanumeric(const InputValue& value) {
    auto text = value.to_text();
    if (!text) {
        return "";
    }
    std::string out;
    out.reserve(text->size());
    for (unsigned char c : *text) {
        if (!std::isspace(c)) {
            out.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return out;
}

std::string digits_only(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (is_digit(c)) {
            out.push_back(c);
        }
    }
    return out;
}

std::size_t utf8_length(std::string_view text) noexcept {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U;
    }));
}

std::string letter_to_number(char c) {
    if (c >= 'A' && c <= 'Z') {
        return std::to_string(c - 'A' + 10);
    }
    if (c >= 'a' && c <= 'z') {
        return std::to_string(c - 'a' + 10);
    }
    return std::string(1, c);
}

std::string convert_letters_to_numbers(std::string_view text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        out += letter_to_number(c);
    }
    return out;
}

int count_decimal_places(double value) noexcept {
    if (!std::isfinite(value)) {
        return 0;
    }

    // Shortest round-trip representation, e.g. "1.25", "1e-07", "1.5e+20"
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return 0;
    }
    std::string_view repr(buffer.data(), static_cast<size_t>(end - buffer.data()));

    std::string_view mantissa = repr;
    int exponent = 0;
    size_t e_pos = repr.find_first_of("eE");
    if (e_pos != std::string_view::npos) {
        mantissa = repr.substr(0, e_pos);
        std::string_view exp_text = repr.substr(e_pos + 1);
        if (!exp_text.empty() && exp_text.front() == '+') {
            exp_text.remove_prefix(1);
        }
        auto result = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
        if (result.ec != std::errc{}) {
            return 0;
        }
    }

    size_t dot = mantissa.find('.');
    int mantissa_decimals = dot == std::string_view::npos
                                ? 0
                                : static_cast<int>(mantissa.size() - dot - 1);
    return std::max(0, mantissa_decimals - exponent);
}

double parse_to_number(const InputValue& value) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();

    if (const auto* number = value.as_number()) {
        return *number;
    }
    const auto* text = value.as_string();
    if (text == nullptr) {
        return nan;
    }

    std::string normalized;
    normalized.reserve(text->size());
    for (char c : trim(*text)) {
        if (c != ',') {
            normalized.push_back(c);
        }
    }

    std::string_view view = normalized;
    if (!view.empty() && view.front() == '+') {
        view.remove_prefix(1);
        // from_chars rejects a second sign
        if (!view.empty() && (view.front() == '-' || view.front() == '+')) {
            return nan;
        }
    }

    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), parsed);
    if (ec == std::errc::result_out_of_range) {
        // Overflow becomes infinity, underflow zero
        std::string_view matched(view.data(), static_cast<size_t>(ptr - view.data()));
        size_t e_pos = matched.find_first_of("eE");
        bool underflow = e_pos != std::string_view::npos && e_pos + 1 < matched.size() &&
                         matched[e_pos + 1] == '-';
        parsed = underflow ? 0.0 : std::numeric_limits<double>::infinity();
        if (!matched.empty() && matched.front() == '-') {
            parsed = -parsed;
        }
    } else if (ec != std::errc{}) {
        return nan;
    }
    return parsed;
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    size_t pos = 0;
    auto year = read_fixed(text, pos, 4);
    if (!year) {
        return std::nullopt;
    }
    int month_value = 1;
    int day_value = 1;

    if (pos < text.size() && text[pos] == '-') {
        ++pos;
        auto month = read_fixed(text, pos, 2);
        if (!month) {
            return std::nullopt;
        }
        month_value = *month;
        if (pos < text.size() && text[pos] == '-') {
            ++pos;
            auto day = read_fixed(text, pos, 2);
            if (!day) {
                return std::nullopt;
            }
            day_value = *day;
        }
    }

    year_month_day ymd{std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(month_value)},
                       std::chrono::day{static_cast<unsigned>(day_value)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    Timestamp result = time_point_cast<milliseconds>(sys_days{ymd});

    if (pos == text.size()) {
        return result;
    }

    // Time part
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
        return std::nullopt;
    }
    ++pos;

    auto hour = read_fixed(text, pos, 2);
    if (!hour || pos >= text.size() || text[pos] != ':') {
        return std::nullopt;
    }
    ++pos;
    auto minute = read_fixed(text, pos, 2);
    if (!minute) {
        return std::nullopt;
    }
    int second_value = 0;
    int millis_value = 0;
    if (pos < text.size() && text[pos] == ':') {
        ++pos;
        auto second = read_fixed(text, pos, 2);
        if (!second) {
            return std::nullopt;
        }
        second_value = *second;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t start = pos;
            int scale = 100;
            while (pos < text.size() && is_digit(text[pos])) {
                if (scale > 0) {
                    millis_value += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                ++pos;
            }
            if (pos == start) {
                return std::nullopt;
            }
        }
    }

    // 24:00 is not accepted; leap seconds are not representable
    if (*hour > 23 || *minute > 59 || second_value > 59) {
        return std::nullopt;
    }

    result += hours{*hour} + minutes{*minute} + seconds{second_value} + milliseconds{millis_value};

    if (pos == text.size()) {
        return result;
    }

    // Offset
    char designator = text[pos];
    if (designator == 'Z' || designator == 'z') {
        return pos + 1 == text.size() ? std::optional<Timestamp>(result) : std::nullopt;
    }
    if (designator != '+' && designator != '-') {
        return std::nullopt;
    }
    ++pos;
    auto offset_hours = read_fixed(text, pos, 2);
    if (!offset_hours) {
        return std::nullopt;
    }
    if (pos < text.size() && text[pos] == ':') {
        ++pos;
    }
    auto offset_minutes = read_fixed(text, pos, 2);
    if (!offset_minutes || pos != text.size() || *offset_hours > 23 || *offset_minutes > 59) {
        return std::nullopt;
    }
    auto offset = hours{*offset_hours} + minutes{*offset_minutes};
    // Local time = UTC + offset, so UTC = local - offset
    return designator == '+' ? result - offset : result + offset;
}

std::optional<Timestamp> parse_to_date(const InputValue& value) {
    if (const auto* timestamp = value.as_timestamp()) {
        return *timestamp;
    }
    if (const auto* number = value.as_number()) {
        if (!std::isfinite(*number) || std::fabs(*number) > kMaxEpochMillis) {
            return std::nullopt;
        }
        return Timestamp{std::chrono::milliseconds{static_cast<int64_t>(*number)}};
    }
    if (const auto* text = value.as_string()) {
        return parse_iso8601(trim(*text));
    }
    return std::nullopt;
}

int calculate_age(Timestamp birth, Timestamp reference) noexcept {
    using namespace std::chrono;
    const year_month_day birth_ymd{floor<days>(birth)};
    const year_month_day reference_ymd{floor<days>(reference)};

    int age = static_cast<int>(reference_ymd.year()) - static_cast<int>(birth_ymd.year());
    const auto reference_md = month_day{reference_ymd.month(), reference_ymd.day()};
    const auto birth_md = month_day{birth_ymd.month(), birth_ymd.day()};
    if (reference_md < birth_md) {
        --age;
    }
    return age;
}

}  // namespace veritas::core
