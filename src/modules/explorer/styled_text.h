// modules/explorer/styled_text.h
#ifndef AGENTTRACE_MODULES_EXPLORER_STYLED_TEXT_H
#define AGENTTRACE_MODULES_EXPLORER_STYLED_TEXT_H

#include "common/utils/string_utils.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agenttrace {

// Semantic text styles; the terminal maps each to colors and weight.
enum class Style : uint8_t {
    NORMAL,
    TITLE,
    HEADER,
    SECTION,
    MUTED,
    SELECTED,
    CURSOR,
    SUCCESS,
    ERROR,
    WARNING,
    DURATION,
    ATTR_KEY,
    ATTR_VALUE,
    BORDER,
    FOCUS_BORDER,
    SPAN_WORKFLOW,
    SPAN_AGENT,
    SPAN_LLM,
    SPAN_TOOL
};

inline constexpr int kStyleCount = static_cast<int>(Style::SPAN_TOOL) + 1;

struct Segment {
    std::string text;
    Style style = Style::NORMAL;
};

struct StyledLine {
    std::vector<Segment> segments;

    StyledLine() = default;
    StyledLine(std::string text, Style style = Style::NORMAL) {
        segments.push_back({std::move(text), style});
    }

    StyledLine& add(std::string text, Style style = Style::NORMAL) {
        if (!text.empty()) segments.push_back({std::move(text), style});
        return *this;
    }

    StyledLine& append(const StyledLine& other) {
        segments.insert(segments.end(), other.segments.begin(), other.segments.end());
        return *this;
    }

    std::string text() const {
        std::string out;
        for (const auto& seg : segments) out += seg.text;
        return out;
    }

    std::size_t width() const {
        std::size_t w = 0;
        for (const auto& seg : segments) w += display_width(seg.text);
        return w;
    }

    // Cut to `max_width` columns and pad with spaces up to it.
    StyledLine fitted(std::size_t max_width) const {
        StyledLine out;
        std::size_t used = 0;
        for (const auto& seg : segments) {
            if (used >= max_width) break;
            std::size_t w = display_width(seg.text);
            if (used + w <= max_width) {
                out.segments.push_back(seg);
                used += w;
            } else {
                out.segments.push_back({pad_right(seg.text, max_width - used), seg.style});
                used = max_width;
            }
        }
        if (used < max_width) out.segments.push_back({std::string(max_width - used, ' '), Style::NORMAL});
        return out;
    }
};

using StyledLines = std::vector<StyledLine>;

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_EXPLORER_STYLED_TEXT_H
