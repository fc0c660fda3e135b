#ifndef SHELLFRAME_FONT_SHAPING_H
#define SHELLFRAME_FONT_SHAPING_H

#include <blend2d.h>

#include <concepts>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct hb_face_t;
struct hb_font_t;

namespace shellframe {

class HbFontFace final {
   public:
    explicit HbFontFace();
    explicit HbFontFace(std::span<const uint8_t> font_data, unsigned int font_index = 0);

    [[nodiscard]] auto hb_face() const noexcept -> hb_face_t *;

   private:
    // immutable, shared read-only between sessions
    std::shared_ptr<hb_face_t> face_;
};

static_assert(std::semiregular<HbFontFace>);

class HbFont final {
   public:
    explicit HbFont();
    explicit HbFont(const HbFontFace &face);

    [[nodiscard]] auto hb_font() const noexcept -> hb_font_t *;

   private:
    std::shared_ptr<hb_font_t> font_;
};

static_assert(std::semiregular<HbFont>);

class HbShapedText {
   public:
    explicit HbShapedText() = default;
    explicit HbShapedText(std::u32string_view text, const HbFont &font,
                          float font_size);

    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto operator==(const HbShapedText &other) const -> bool = default;

    // glyph run of the shaped text
    [[nodiscard]] auto glyph_run() const noexcept -> BLGlyphRun;
    // total pen advance in pixels
    [[nodiscard]] auto advance() const noexcept -> BLPoint;

   private:
    std::vector<uint32_t> codepoints_ {};
    std::vector<BLGlyphPlacement> placements_ {};
    BLPoint advance_ {};
};

static_assert(std::regular<HbShapedText>);

struct FontFace {
    BLFontFace bl_face {};
    HbFontFace hb_face {};
};

struct Font {
    BLFont bl_font {};
    HbFont hb_font {};
    float size {};
};

// Reads and parses a TrueType file.
//
// Throws FontDirectoryReadError if the file cannot be read and
// FontParseError on malformed outline data.
[[nodiscard]] auto create_face_from_file(const std::string &filename,
                                         uint32_t face_index = 0) -> FontFace;

// font_size is given in pixels
[[nodiscard]] auto create_font(const FontFace &face, float font_size) -> Font;

}  // namespace shellframe

#endif
