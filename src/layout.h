#ifndef SHELLFRAME_LAYOUT_H
#define SHELLFRAME_LAYOUT_H

#include "glyph_face.h"
#include "styled_rune.h"

#include <string>
#include <vector>

namespace shellframe {

struct ContentExtent {
    double width {};
    double height {};
};

struct LayoutPolicy {
    // fixed column count, 0 measures the longest line
    int columns {0};
    double line_spacing {1.0};
};

// Splits on '\n', a single terminating newline does not open a new line.
[[nodiscard]] auto split_lines(const RuneStream &content) -> std::vector<std::u32string>;

// Pixel size needed to render the content with the regular face.
//
// With fixed columns the width is the advance of `columns`
// filler glyphs, regardless of the actual line lengths. The height is
// `line_height * ((lines - 1) * line_spacing + 1)`, at least one line.
[[nodiscard]] auto measure_content(const RuneStream &content, const GlyphFace &regular,
                                   const LayoutPolicy &policy) -> ContentExtent;

}  // namespace shellframe

#endif
