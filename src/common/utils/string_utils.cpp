// common/utils/string_utils.cpp
#include "common/utils/string_utils.h"
#include <algorithm>

namespace agenttrace {

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte offset of the code point that starts after `count` code points.
std::size_t byte_offset_for(std::string_view s, std::size_t count) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation_byte(static_cast<unsigned char>(s[i]))) {
            if (seen == count) return i;
            ++seen;
        }
    }
    return s.size();
}

} // namespace

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split(std::string_view s, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.append(separator);
        out.append(parts[i]);
    }
    return out;
}

std::size_t display_width(std::string_view s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return !is_continuation_byte(static_cast<unsigned char>(c));
    }));
}

std::string truncate_utf8(std::string_view s, std::size_t max_width) {
    if (display_width(s) <= max_width) return std::string(s);
    if (max_width <= 3) return std::string(s.substr(0, byte_offset_for(s, max_width)));
    return std::string(s.substr(0, byte_offset_for(s, max_width - 3))) + "...";
}

std::string pad_right(std::string_view s, std::size_t width) {
    std::size_t w = display_width(s);
    if (w > width) return std::string(s.substr(0, byte_offset_for(s, width)));
    std::string out(s);
    out.append(width - w, ' ');
    return out;
}

std::string repeat(std::string_view s, std::size_t count) {
    std::string out;
    out.reserve(s.size() * count);
    for (std::size_t i = 0; i < count; ++i) out.append(s);
    return out;
}

std::string format_number(int64_t value) {
    bool negative = value < 0;
    std::string digits = std::to_string(negative ? -value : value);
    std::string out;
    int n = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (n > 0 && n % 3 == 0) out.push_back(',');
        out.push_back(*it);
        ++n;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<std::string> wrap_text(std::string_view text, std::size_t width) {
    std::vector<std::string> lines;
    if (width == 0) width = 1;
    for (const auto& raw : split(text, '\n')) {
        std::string_view rest = raw;
        if (rest.empty()) {
            lines.emplace_back();
            continue;
        }
        while (!rest.empty()) {
            std::size_t cut = byte_offset_for(rest, width);
            lines.emplace_back(rest.substr(0, cut));
            rest.remove_prefix(cut);
        }
    }
    return lines;
}

} // namespace agenttrace
