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

// URL Parsing - Absolute URL structure check (scheme, authority, host, port)

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace veritas::core::url {

/// Components of a parsed absolute URL
struct UrlParts {
    std::string scheme;  // lowercased, without ':'
    std::string host;    // lowercased; IPv6 literals keep their brackets
    std::optional<uint16_t> port;
    std::string path;  // everything after the authority (path, query, fragment)
};

/// True for the schemes whose URLs must carry a host (http, https, ftp, ws, wss, file)
[[nodiscard]] bool is_special_scheme(std::string_view scheme) noexcept;

/// Parse an absolute URL the way a browser URL constructor would accept it.
/// Returns nullopt for: a missing or malformed scheme, a missing host on a special
/// scheme, forbidden host code points, an out-of-range IPv4 host, or a port that is not
/// a number in 0-65535.
[[nodiscard]] std::optional<UrlParts> parse_absolute(std::string_view input);

/// Parse a dotted IPv4 host (1 to 4 decimal parts, each part within its byte budget)
[[nodiscard]] std::optional<uint32_t> parse_ipv4(std::string_view host);

}  // namespace veritas::core::url
