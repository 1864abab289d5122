#include "cemkit/core/string.hpp"
#include <algorithm>

namespace cemkit {

// ============================================================================
// UTF-8 helpers
// ============================================================================

namespace unicode {

usize utf8_safe_prefix_length(std::string_view text, usize max_bytes) {
    if (text.size() <= max_bytes) {
        return text.size();
    }

    usize end = max_bytes;
    while (end > 0 && is_utf8_continuation(text[end])) {
        --end;
    }
    return end;
}

} // namespace unicode

// ============================================================================
// String implementation
// ============================================================================

String::String(const char* str) : m_data(str ? str : "") {}

String::String(const char* str, usize length) : m_data(str, length) {}

String::String(std::string str) : m_data(std::move(str)) {}

String::String(std::string_view sv) : m_data(sv) {}

String::String(usize count, char c) : m_data(count, c) {}

String String::substring(usize start, usize length) const {
    if (start >= m_data.size()) {
        return String();
    }
    return String(m_data.substr(start, length));
}

std::optional<usize> String::find(char c, usize start) const {
    auto pos = m_data.find(c, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

bool String::contains(const String& needle) const {
    return m_data.find(needle.m_data) != std::string::npos;
}

bool String::contains(char c) const {
    return m_data.find(c) != std::string::npos;
}

bool String::starts_with(const String& prefix) const {
    return m_data.starts_with(prefix.m_data);
}

bool String::ends_with(const String& suffix) const {
    return m_data.ends_with(suffix.m_data);
}

String String::to_lowercase() const {
    // Non-ASCII UTF-8 bytes are >= 0x80 and pass through unchanged
    std::string result(m_data);
    for (auto& c : result) {
        c = static_cast<char>(unicode::to_ascii_lower(static_cast<u8>(c)));
    }
    return String(std::move(result));
}

String String::trim() const {
    auto start = m_data.begin();
    auto end = m_data.end();
    while (start != end && unicode::is_ascii_whitespace(static_cast<u8>(*start))) {
        ++start;
    }
    while (end != start && unicode::is_ascii_whitespace(static_cast<u8>(*(end - 1)))) {
        --end;
    }
    return String(std::string(start, end));
}

String String::trim_matches(std::string_view chars) const {
    auto first = m_data.find_first_not_of(chars);
    if (first == std::string::npos) {
        return String();
    }
    auto last = m_data.find_last_not_of(chars);
    return String(m_data.substr(first, last - first + 1));
}

String String::collapse_whitespace() const {
    std::string result;
    result.reserve(m_data.size());

    bool pending_space = false;
    for (char c : m_data) {
        if (unicode::is_ascii_whitespace(static_cast<u8>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return String(std::move(result));
}

std::vector<String> String::split(char delimiter) const {
    std::vector<String> result;
    usize start = 0;
    usize end = m_data.find(delimiter);

    while (end != std::string::npos) {
        result.emplace_back(m_data.substr(start, end - start));
        start = end + 1;
        end = m_data.find(delimiter, start);
    }

    result.emplace_back(m_data.substr(start));
    return result;
}

String String::operator+(const String& other) const {
    return String(m_data + other.m_data);
}

String join(const std::vector<String>& parts, std::string_view separator) {
    std::string result;
    for (usize i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i].std_string();
    }
    return String(std::move(result));
}

// ============================================================================
// StringBuilder implementation
// ============================================================================

StringBuilder::StringBuilder(usize initial_capacity) {
    m_buffer.reserve(initial_capacity);
}

StringBuilder& StringBuilder::append(const char* str) {
    m_buffer += str;
    return *this;
}

StringBuilder& StringBuilder::append(char c) {
    m_buffer += c;
    return *this;
}

} // namespace cemkit
