#include "regex.hpp"

#include <cstdint>

#include <fmt/format.h>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace veritas::core {

namespace {

constexpr uint32_t kCompileOptions = PCRE2_DOLLAR_ENDONLY;

std::string describe_compile_error(int error_code, PCRE2_SIZE offset, std::string_view pattern) {
    PCRE2_UCHAR buffer[256];
    if (pcre2_get_error_message(error_code, buffer, sizeof(buffer)) < 0) {
        return fmt::format("PCRE2 error {} at offset {} in pattern: {}", error_code, offset,
                           pattern);
    }
    return fmt::format("{} at offset {} in pattern: {}", reinterpret_cast<const char*>(buffer),
                       offset, pattern);
}

}  // namespace

Regex::Regex(Regex&& other) noexcept : code_(other.code_) {
    other.code_ = nullptr;
}

Regex& Regex::operator=(Regex&& other) noexcept {
    if (this != &other) {
        pcre2_code_free(code_);
        code_ = other.code_;
        other.code_ = nullptr;
    }
    return *this;
}

Regex::~Regex() {
    pcre2_code_free(code_);
}

std::optional<Regex> Regex::compile(std::string_view pattern) {
    std::string ignored;
    return compile(pattern, ignored);
}

std::optional<Regex> Regex::compile(std::string_view pattern, std::string& error_message) {
    int error_code = 0;
    PCRE2_SIZE error_offset = 0;

    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(),
                               kCompileOptions, &error_code, &error_offset, nullptr);
    if (code == nullptr) {
        error_message = describe_compile_error(error_code, error_offset, pattern);
        return std::nullopt;
    }
    return Regex(code);
}

bool Regex::matches(std::string_view subject) const {
    if (code_ == nullptr) {
        return false;
    }
    pcre2_match_data* match_data = pcre2_match_data_create(1, nullptr);
    if (match_data == nullptr) {
        return false;
    }

    // PCRE2 rejects a null subject even with zero length
    const char* data = subject.data() != nullptr ? subject.data() : "";
    const int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(data), subject.size(), 0, 0,
                               match_data, nullptr);
    pcre2_match_data_free(match_data);
    return rc >= 0;
}

bool matches_pattern(const std::optional<Regex>& pattern, std::string_view subject) {
    return pattern.has_value() && pattern->matches(subject);
}

}  // namespace veritas::core
