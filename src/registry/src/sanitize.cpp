#include "cemkit/registry/sanitize.hpp"

namespace cemkit::registry {

namespace {

String strip_html_comments(const String& text) {
    const auto& data = text.std_string();
    std::string result;
    result.reserve(data.size());

    usize pos = 0;
    while (pos < data.size()) {
        auto open = data.find("<!--", pos);
        if (open == std::string::npos) {
            result.append(data, pos, std::string::npos);
            break;
        }
        result.append(data, pos, open - pos);
        auto close = data.find("-->", open + 4);
        if (close == std::string::npos) {
            break;
        }
        pos = close + 3;
    }
    return String(std::move(result));
}

} // namespace

bool contains_template_syntax(const String& text) {
    if (!text.contains('{') || !text.contains('}')) {
        return false;
    }

    // Whitespace between the braces does not defeat detection
    std::string compact;
    for (char c : strip_html_comments(text)) {
        if (!unicode::is_ascii_whitespace(static_cast<u8>(c))) {
            compact += c;
        }
    }

    auto open = compact.find("{{");
    if (open == std::string::npos) {
        return false;
    }
    return compact.find("}}", open + 2) != std::string::npos;
}

String escape_html(const String& text) {
    StringBuilder builder(text.size());
    for (char c : text) {
        switch (c) {
            case '<':  builder.append("&lt;"); break;
            case '>':  builder.append("&gt;"); break;
            case '&':  builder.append("&amp;"); break;
            case '\'': builder.append("&#39;"); break;
            case '"':  builder.append("&#34;"); break;
            default:   builder.append(c); break;
        }
    }
    return builder.build();
}

String sanitize_description(const String& description, usize max_length) {
    if (description.empty()) {
        return String();
    }

    String text = description;
    if (text.size() > max_length) {
        auto keep = unicode::utf8_safe_prefix_length(text.view(), max_length);
        text = text.substring(0, keep) + "...";
    }

    if (contains_template_syntax(text)) {
        return String(TEMPLATE_SYNTAX_PLACEHOLDER);
    }

    return escape_html(text).collapse_whitespace();
}

} // namespace cemkit::registry
