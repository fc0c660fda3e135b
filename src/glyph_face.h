#ifndef SHELLFRAME_GLYPH_FACE_H
#define SHELLFRAME_GLYPH_FACE_H

#include "font_shaping.h"
#include "styled_rune.h"

#include <blend2d.h>

#include <memory>
#include <string_view>

namespace shellframe {

// A sized font face as seen by layout and drawing, metrics in pixels.
class GlyphFace {
   public:
    GlyphFace() = default;
    virtual ~GlyphFace() = default;

    GlyphFace(const GlyphFace &) = delete;
    auto operator=(const GlyphFace &) -> GlyphFace & = delete;

    // horizontal pen advance of the text
    [[nodiscard]] virtual auto advance(std::u32string_view text) const -> double = 0;
    [[nodiscard]] virtual auto ascent() const -> double = 0;
    // ascent plus descent
    [[nodiscard]] virtual auto line_height() const -> double = 0;

    // draws a single symbol with its baseline origin at the given point
    virtual auto draw(BLContext &ctx, BLPoint origin, char32_t symbol,
                      BLRgba32 color) const -> void = 0;
};

// GlyphFace backed by a Blend2D font, shaped with HarfBuzz.
//
// Blend2D reports metrics in floating point pixels. They are floored to
// whole pixels here, which matches truncating 26.6 fixed point values.
class FontGlyphFace final : public GlyphFace {
   public:
    explicit FontGlyphFace(Font font);

    [[nodiscard]] auto advance(std::u32string_view text) const -> double override;
    [[nodiscard]] auto ascent() const -> double override;
    [[nodiscard]] auto line_height() const -> double override;

    auto draw(BLContext &ctx, BLPoint origin, char32_t symbol,
              BLRgba32 color) const -> void override;

   private:
    Font font_;
    double ascent_ {};
    double line_height_ {};
};

struct FontFaceSet {
    std::shared_ptr<const GlyphFace> regular {};
    std::shared_ptr<const GlyphFace> bold {};
    std::shared_ptr<const GlyphFace> italic {};
    std::shared_ptr<const GlyphFace> bold_italic {};
};

// Underline and the out-of-range classes use the regular face.
[[nodiscard]] auto face_for(const FontFaceSet &faces, StyleClass style_class)
    -> const GlyphFace &;

// pixel size of a face configured with a point size at a device resolution
[[nodiscard]] auto font_pixel_size(double point_size, double dpi) -> float;

}  // namespace shellframe

#endif
