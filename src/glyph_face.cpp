#include "glyph_face.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace shellframe {

FontGlyphFace::FontGlyphFace(Font font) : font_ {std::move(font)} {
    const auto metrics = font_.bl_font.metrics();

    ascent_ = std::floor(metrics.ascent);
    line_height_ = std::floor(metrics.ascent + metrics.descent);
}

auto FontGlyphFace::advance(std::u32string_view text) const -> double {
    if (text.empty()) {
        return 0.0;
    }

    return HbShapedText {text, font_.hb_font, font_.size}.advance().x;
}

auto FontGlyphFace::ascent() const -> double {
    return ascent_;
}

auto FontGlyphFace::line_height() const -> double {
    return line_height_;
}

auto FontGlyphFace::draw(BLContext &ctx, BLPoint origin, char32_t symbol,
                         BLRgba32 color) const -> void {
    const auto text = std::u32string_view {&symbol, 1};
    const auto shaped = HbShapedText {text, font_.hb_font, font_.size};

    if (shaped.empty()) {
        return;
    }

    ctx.fillGlyphRun(origin, font_.bl_font, shaped.glyph_run(), color);
}

auto face_for(const FontFaceSet &faces, StyleClass style_class) -> const GlyphFace & {
    const auto *face = faces.regular.get();

    switch (style_class) {
        case StyleClass::bold:
            face = faces.bold.get();
            break;
        case StyleClass::italic:
            face = faces.italic.get();
            break;
        case StyleClass::bold_italic:
            face = faces.bold_italic.get();
            break;
        default:
            break;
    }

    if (face == nullptr) {
        face = faces.regular.get();
    }
    if (face == nullptr) {
        throw std::logic_error("font face set without regular face");
    }

    return *face;
}

auto font_pixel_size(double point_size, double dpi) -> float {
    return static_cast<float>(point_size * dpi / 72.0);
}

}  // namespace shellframe
