#include "layout.h"

#include <algorithm>
#include <cmath>

namespace shellframe {

auto split_lines(const RuneStream &content) -> std::vector<std::u32string> {
    auto text = content.symbols();
    if (text.ends_with(U'\n')) {
        text.pop_back();
    }

    auto lines = std::vector<std::u32string> {};
    auto begin = std::size_t {0};
    while (true) {
        const auto end = text.find(U'\n', begin);
        if (end == std::u32string::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }

    return lines;
}

auto measure_content(const RuneStream &content, const GlyphFace &regular,
                     const LayoutPolicy &policy) -> ContentExtent {
    const auto lines = split_lines(content);

    auto width = 0.0;
    if (policy.columns == 0) {
        for (const auto &line : lines) {
            width = std::max(width, std::floor(regular.advance(line)));
        }
    } else {
        const auto filler =
            std::u32string(static_cast<std::size_t>(std::max(policy.columns, 0)), U'a');
        width = std::floor(regular.advance(filler));
    }

    const auto line_count = static_cast<double>(lines.size());
    const auto height =
        regular.line_height() * ((line_count - 1.0) * policy.line_spacing + 1.0);

    return ContentExtent {.width = width, .height = height};
}

}  // namespace shellframe
