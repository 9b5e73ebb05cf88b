#pragma once

#include <optional>
#include <string>
#include <string_view>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace veritas::core {

// Anchored PCRE2 pattern used by the format checks.
// `$` only matches at the very end of the subject, so "abc\n" never satisfies "^abc$".
// Matching is const and safe to share across threads once compiled.
class Regex {
public:
    // Returns nullopt if the pattern does not compile
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Same, describing the failure (message, offset, pattern) in error_message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    [[nodiscard]] bool matches(std::string_view subject) const;

private:
    explicit Regex(pcre2_real_code_8* code) noexcept : code_(code) {}

    pcre2_real_code_8* code_;  // owned
};

// Match against a pattern compiled once per process.
// A pattern that fails to compile never matches.
[[nodiscard]] bool matches_pattern(const std::optional<Regex>& pattern, std::string_view subject);

}  // namespace veritas::core
