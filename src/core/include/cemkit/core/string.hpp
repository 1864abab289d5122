#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>

namespace cemkit {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

[[nodiscard]] constexpr bool is_ascii_whitespace(CodePoint cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v';
}

[[nodiscard]] constexpr bool is_ascii_upper(CodePoint cp) {
    return cp >= 'A' && cp <= 'Z';
}

[[nodiscard]] constexpr CodePoint to_ascii_lower(CodePoint cp) {
    if (is_ascii_upper(cp)) {
        return cp + ('a' - 'A');
    }
    return cp;
}

// True for bytes 10xxxxxx, which never start a code point
[[nodiscard]] constexpr bool is_utf8_continuation(char byte) {
    return (static_cast<u8>(byte) & 0xC0) == 0x80;
}

// Largest prefix length <= max_bytes that does not split a code point
[[nodiscard]] usize utf8_safe_prefix_length(std::string_view text, usize max_bytes);

} // namespace unicode

// ============================================================================
// String - UTF-8 encoded string with utilities
// ============================================================================

class String {
public:
    using const_iterator = std::string::const_iterator;

    // Constructors
    String() = default;
    String(const char* str);
    String(const char* str, usize length);
    String(std::string str);
    String(std::string_view sv);
    String(usize count, char c);

    // Access
    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }

    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(m_data);
    }

    [[nodiscard]] const std::string& std_string() const noexcept {
        return m_data;
    }

    // Iterators
    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }

    // Substring
    [[nodiscard]] String substring(usize start, usize length = std::string::npos) const;

    // Search
    [[nodiscard]] std::optional<usize> find(char c, usize start = 0) const;
    [[nodiscard]] bool contains(const String& needle) const;
    [[nodiscard]] bool contains(char c) const;
    [[nodiscard]] bool starts_with(const String& prefix) const;
    [[nodiscard]] bool ends_with(const String& suffix) const;

    // Transformations
    [[nodiscard]] String to_lowercase() const;
    [[nodiscard]] String trim() const;
    [[nodiscard]] String trim_matches(std::string_view chars) const;

    // Runs of ASCII whitespace become a single space; leading/trailing runs are dropped
    [[nodiscard]] String collapse_whitespace() const;

    // Split
    [[nodiscard]] std::vector<String> split(char delimiter) const;

    // Comparison
    [[nodiscard]] bool operator==(const String& other) const {
        return m_data == other.m_data;
    }

    [[nodiscard]] bool operator!=(const String& other) const {
        return m_data != other.m_data;
    }

    [[nodiscard]] bool operator<(const String& other) const {
        return m_data < other.m_data;
    }

    [[nodiscard]] bool operator>(const String& other) const {
        return m_data > other.m_data;
    }

    // Concatenation
    String operator+(const String& other) const;

private:
    std::string m_data;
};

// String literal operator
inline String operator""_s(const char* str, std::size_t len) {
    return String(str, len);
}

// Joins parts with a separator
[[nodiscard]] String join(const std::vector<String>& parts, std::string_view separator);

// ============================================================================
// StringBuilder - Efficient string building
// ============================================================================

class StringBuilder {
public:
    StringBuilder() = default;
    explicit StringBuilder(usize initial_capacity);

    StringBuilder& append(const char* str);
    StringBuilder& append(char c);

    [[nodiscard]] String build() const { return String(m_buffer); }

private:
    std::string m_buffer;
};

} // namespace cemkit

template<>
struct std::hash<cemkit::String> {
    std::size_t operator()(const cemkit::String& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};
