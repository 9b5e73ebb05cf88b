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

// URL Parsing - Implementation

#include "url.hpp"

#include <array>
#include <cctype>
#include <charconv>

#include "utils.hpp"

namespace veritas::core::url {

namespace {

constexpr std::array<std::string_view, 6> kSpecialSchemes = {"http", "https", "ftp",
                                                             "ws",   "wss",   "file"};

// Characters that may never appear in a host
[[nodiscard]] bool is_forbidden_host_char(unsigned char c) noexcept {
    switch (c) {
        case '\0':
        case '\t':
        case '\n':
        case '\r':
        case ' ':
        case '#':
        case '/':
        case ':':
        case '<':
        case '>':
        case '?':
        case '@':
        case '[':
        case '\\':
        case ']':
        case '^':
        case '|':
        case '%':
            return true;
        default:
            return c < 0x20 || c == 0x7F;
    }
}

[[nodiscard]] bool is_valid_scheme(std::string_view scheme) noexcept {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    for (unsigned char c : scheme) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

// A host whose last label is numeric is treated as IPv4
[[nodiscard]] bool ends_in_number(std::string_view host) noexcept {
    if (!host.empty() && host.back() == '.') {
        host.remove_suffix(1);
    }
    size_t dot = host.rfind('.');
    std::string_view last = dot == std::string_view::npos ? host : host.substr(dot + 1);
    if (last.empty()) {
        return false;
    }
    for (char c : last) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool is_valid_ipv6_literal(std::string_view host) noexcept {
    // [ ... ] with hex digits, ':' and an optional embedded dotted quad
    if (host.size() < 4 || host.front() != '[' || host.back() != ']') {
        return false;
    }
    std::string_view inner = host.substr(1, host.size() - 2);
    if (inner.find(':') == std::string_view::npos) {
        return false;
    }
    for (unsigned char c : inner) {
        if (!std::isxdigit(c) && c != ':' && c != '.') {
            return false;
        }
    }
    return true;
}

}  // namespace

bool is_special_scheme(std::string_view scheme) noexcept {
    for (auto special : kSpecialSchemes) {
        if (special == scheme) {
            return true;
        }
    }
    return false;
}

std::optional<uint32_t> parse_ipv4(std::string_view host) {
    if (!host.empty() && host.back() == '.') {
        host.remove_suffix(1);
    }
    if (host.empty()) {
        return std::nullopt;
    }

    std::array<uint64_t, 4> parts{};
    size_t count = 0;
    size_t start = 0;
    while (start <= host.size()) {
        size_t dot = host.find('.', start);
        std::string_view part =
            host.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (part.empty() || count == parts.size()) {
            return std::nullopt;
        }
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return std::nullopt;
        }
        parts[count++] = value;
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }

    // Every part but the last is one byte; the last fills the remaining bytes
    for (size_t i = 0; i + 1 < count; ++i) {
        if (parts[i] > 255) {
            return std::nullopt;
        }
    }
    const uint64_t last_limit = 1ULL << (8 * (5 - count));
    if (parts[count - 1] >= last_limit) {
        return std::nullopt;
    }

    uint64_t address = parts[count - 1];
    for (size_t i = 0; i + 1 < count; ++i) {
        address += parts[i] << (8 * (3 - i));
    }
    return static_cast<uint32_t>(address);
}

std::optional<UrlParts> parse_absolute(std::string_view input) {
    // Leading/trailing C0 controls and spaces are ignored, embedded tabs/newlines removed
    std::string cleaned;
    cleaned.reserve(input.size());
    for (char c : trim(input)) {
        if (c != '\t' && c != '\n' && c != '\r') {
            cleaned.push_back(c);
        }
    }
    std::string_view rest = cleaned;

    size_t colon = rest.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view scheme = rest.substr(0, colon);
    if (!is_valid_scheme(scheme)) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = to_lower(scheme);
    rest.remove_prefix(colon + 1);

    const bool special = is_special_scheme(parts.scheme);
    if (!special) {
        // Opaque or hierarchical non-special URL: anything after the scheme is accepted
        parts.path = std::string(rest);
        return parts;
    }

    // Special schemes treat '\' like '/'
    size_t slashes = 0;
    while (slashes < rest.size() && (rest[slashes] == '/' || rest[slashes] == '\\')) {
        ++slashes;
    }
    rest.remove_prefix(slashes);

    size_t authority_end = rest.find_first_of("/\\?#");
    std::string_view authority =
        authority_end == std::string_view::npos ? rest : rest.substr(0, authority_end);
    parts.path = authority_end == std::string_view::npos ? "" : std::string(rest.substr(authority_end));

    // Credentials end at the last '@'
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host = authority;
    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(0, close + 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            port_text = after.substr(1);
        }
        if (!is_valid_ipv6_literal(host)) {
            return std::nullopt;
        }
    } else {
        size_t port_colon = authority.rfind(':');
        if (port_colon != std::string_view::npos) {
            host = authority.substr(0, port_colon);
            port_text = authority.substr(port_colon + 1);
        }
        if (host.empty() && parts.scheme != "file") {
            return std::nullopt;
        }
        for (unsigned char c : host) {
            if (is_forbidden_host_char(c)) {
                return std::nullopt;
            }
        }
        if (ends_in_number(host) && !parse_ipv4(host)) {
            return std::nullopt;
        }
    }

    if (!port_text.empty()) {
        uint32_t port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port > 65535) {
            return std::nullopt;
        }
        parts.port = static_cast<uint16_t>(port);
    }

    parts.host = to_lower(host);
    return parts;
}

}  // namespace veritas::core::url
