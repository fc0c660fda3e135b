#include "font_shaping.h"

#include "errors.h"

#include <hb.h>

#include <algorithm>
#include <concepts>
#include <exception>
#include <iterator>
#include <string>
#include <utility>

namespace shellframe {

namespace {

/**
 * @brief Helpers taken from GSL (Guidelines Support Library):
 *
 *   https://github.com/microsoft/GSL
 *
 */

template <std::integral T, std::integral V>
auto narrow(const V val) -> T {
    if (std::in_range<T>(val)) {
        return static_cast<T>(val);
    }
    std::terminate();
}

constexpr auto expects(auto condition) -> void {
    if (!!condition) {
        return;
    }
    std::terminate();
}

constexpr auto ensures(auto condition) -> void {
    if (!!condition) {
        return;
    }
    std::terminate();
}

//
// Harfbuzz RAII Wrapper
//

struct HbBlobDeleter {
    auto operator()(hb_blob_t *hb_blob) -> void;
};

struct HbFaceDeleter {
    auto operator()(hb_face_t *hb_face) -> void;
};

struct HbFontDeleter {
    auto operator()(hb_font_t *hb_font) -> void;
};

struct HbBufferDeleter {
    auto operator()(hb_buffer_t *hb_buffer) -> void;
};

using HbBlobPointer = std::unique_ptr<hb_blob_t, HbBlobDeleter>;
using HbFacePointer = std::unique_ptr<hb_face_t, HbFaceDeleter>;
using HbFontPointer = std::unique_ptr<hb_font_t, HbFontDeleter>;
using HbBufferPointer = std::unique_ptr<hb_buffer_t, HbBufferDeleter>;

auto HbBlobDeleter::operator()(hb_blob_t *hb_blob) -> void {
    hb_blob_destroy(hb_blob);
}

auto HbFaceDeleter::operator()(hb_face_t *hb_face) -> void {
    hb_face_destroy(hb_face);
}

auto HbFontDeleter::operator()(hb_font_t *hb_font) -> void {
    hb_font_destroy(hb_font);
}

auto HbBufferDeleter::operator()(hb_buffer_t *hb_buffer) -> void {
    hb_buffer_destroy(hb_buffer);
}

[[nodiscard]] auto create_hb_blob(std::span<const uint8_t> font_data) -> HbBlobPointer {
    const auto *data = reinterpret_cast<const char *>(font_data.data());
    const auto length = narrow<unsigned int>(font_data.size());
    const auto mode = hb_memory_mode_t::HB_MEMORY_MODE_DUPLICATE;

    void *user_data = nullptr;
    hb_destroy_func_t destroy = nullptr;

    auto blob = HbBlobPointer {
        hb_blob_create(data, length, mode, user_data, destroy),
    };

    expects(blob != nullptr);
    expects(hb_blob_get_length(blob.get()) == length);

    return blob;
}

[[nodiscard]] auto create_immutable_face() -> HbFacePointer {
    auto face = HbFacePointer {hb_face_reference(hb_face_get_empty())};
    hb_face_make_immutable(face.get());
    return face;
}

[[nodiscard]] auto create_immutable_face(std::span<const uint8_t> font_data,
                                         unsigned int font_index) -> HbFacePointer {
    const auto blob = create_hb_blob(font_data);

    auto face = HbFacePointer {hb_face_create(blob.get(), font_index)};
    hb_face_make_immutable(face.get());

    return face;
}

[[nodiscard]] auto create_immutable_font() -> HbFontPointer {
    auto font = HbFontPointer {hb_font_reference(hb_font_get_empty())};
    hb_font_make_immutable(font.get());
    return font;
}

[[nodiscard]] auto create_immutable_font(hb_face_t *hb_face) -> HbFontPointer {
    expects(hb_face);

    auto font = HbFontPointer {hb_font_create(hb_face)};
    hb_font_make_immutable(font.get());

    return font;
}

[[nodiscard]] auto create_buffer(std::u32string_view text) -> HbBufferPointer {
    auto buffer = HbBufferPointer {hb_buffer_create()};
    expects(buffer != nullptr);

    const auto text_length = narrow<int>(text.size());
    const auto item_offset = 0U;
    const auto item_length = text_length;
    hb_buffer_add_utf32(buffer.get(), reinterpret_cast<const uint32_t *>(text.data()),
                        text_length, item_offset, item_length);

    return buffer;
}

auto shape_buffer(hb_buffer_t *hb_buffer, hb_font_t *hb_font) -> void {
    expects(hb_buffer != nullptr);
    expects(hb_font != nullptr);

    // set text properties
    hb_buffer_set_direction(hb_buffer, HB_DIRECTION_LTR);
    hb_buffer_set_script(hb_buffer, HB_SCRIPT_LATIN);
    hb_buffer_set_language(hb_buffer, hb_language_from_string("en", -1));
    hb_buffer_guess_segment_properties(hb_buffer);

    // shape text
    const hb_feature_t *features = nullptr;
    const auto num_features = 0U;
    hb_shape(hb_font, hb_buffer, features, num_features);
}

[[nodiscard]] auto get_glyph_infos(hb_buffer_t *hb_buffer) -> std::span<hb_glyph_info_t> {
    expects(hb_buffer != nullptr);

    const auto glyph_count = hb_buffer_get_length(hb_buffer);
    return std::span<hb_glyph_info_t>(hb_buffer_get_glyph_infos(hb_buffer, nullptr),
                                      glyph_count);
}

[[nodiscard]] auto get_hb_glyph_positions(hb_buffer_t *hb_buffer)
    -> std::span<hb_glyph_position_t> {
    expects(hb_buffer != nullptr);

    const auto glyph_count = hb_buffer_get_length(hb_buffer);
    return std::span<hb_glyph_position_t>(
        hb_buffer_get_glyph_positions(hb_buffer, nullptr), glyph_count);
}

[[nodiscard]] auto get_uint32_codepoints(hb_buffer_t *hb_buffer)
    -> std::vector<uint32_t> {
    expects(hb_buffer != nullptr);
    const auto glyph_infos = get_glyph_infos(hb_buffer);

    auto result = std::vector<uint32_t> {};
    result.reserve(glyph_infos.size());

    std::ranges::transform(
        glyph_infos, std::back_inserter(result),
        [](const hb_glyph_info_t &glyph_info) { return glyph_info.codepoint; });

    return result;
}

[[nodiscard]] auto get_bl_placements(hb_buffer_t *hb_buffer)
    -> std::vector<BLGlyphPlacement> {
    expects(hb_buffer != nullptr);
    const auto glyph_positions = get_hb_glyph_positions(hb_buffer);

    auto result = std::vector<BLGlyphPlacement> {};
    result.reserve(glyph_positions.size());

    std::ranges::transform(
        glyph_positions, std::back_inserter(result),
        [](const hb_glyph_position_t &position) {
            return BLGlyphPlacement {
                .placement = BLPointI {position.x_offset, position.y_offset},
                .advance = BLPointI {position.x_advance, position.y_advance},
            };
        });

    return result;
}

// Positions are reported in font units, the scale of a default hb_font_t.
[[nodiscard]] auto calculate_advance(hb_buffer_t *hb_buffer, hb_font_t *hb_font,
                                     float font_size) -> BLPoint {
    expects(hb_buffer != nullptr);
    expects(hb_font != nullptr);

    auto scale = BLPointI {};
    hb_font_get_scale(hb_font, &scale.x, &scale.y);

    if (scale.x == 0 || scale.y == 0) {
        return BLPoint {};
    }

    auto total = BLPoint {};
    for (const auto &pos : get_hb_glyph_positions(hb_buffer)) {
        total.x += pos.x_advance;
        total.y += pos.y_advance;
    }

    return BLPoint {
        total.x / scale.x * font_size,
        total.y / scale.y * font_size,
    };
}

}  // namespace

//
// Font Face
//

HbFontFace::HbFontFace() : face_ {create_immutable_face()} {
    expects(face_ != nullptr);
    ensures(hb_face_is_immutable(face_.get()));
}

HbFontFace::HbFontFace(std::span<const uint8_t> font_data, unsigned int font_index)
    : face_ {create_immutable_face(font_data, font_index)} {
    ensures(face_ != nullptr);
    ensures(hb_face_is_immutable(face_.get()));
}

auto HbFontFace::hb_face() const noexcept -> hb_face_t * {
    expects(face_ != nullptr);
    ensures(hb_face_is_immutable(face_.get()));

    return face_.get();
}

//
// Font
//

HbFont::HbFont() : font_ {create_immutable_font()} {
    ensures(font_ != nullptr);
    ensures(hb_font_is_immutable(font_.get()));
}

HbFont::HbFont(const HbFontFace &face) : font_ {create_immutable_font(face.hb_face())} {
    ensures(font_ != nullptr);
    ensures(hb_font_is_immutable(font_.get()));
}

auto HbFont::hb_font() const noexcept -> hb_font_t * {
    expects(font_ != nullptr);
    ensures(hb_font_is_immutable(font_.get()));

    return font_.get();
}

//
// Shaped Text
//

HbShapedText::HbShapedText(std::u32string_view text, const HbFont &font,
                           float font_size) {
    const auto buffer = create_buffer(text);
    shape_buffer(buffer.get(), font.hb_font());

    codepoints_ = get_uint32_codepoints(buffer.get());
    placements_ = get_bl_placements(buffer.get());
    advance_ = calculate_advance(buffer.get(), font.hb_font(), font_size);

    ensures(codepoints_.size() == placements_.size());
}

auto HbShapedText::empty() const -> bool {
    expects(codepoints_.size() == placements_.size());

    return codepoints_.empty();
}

auto HbShapedText::glyph_run() const noexcept -> BLGlyphRun {
    expects(codepoints_.size() == placements_.size());

    auto result = BLGlyphRun {};

    result.size = codepoints_.size();
    result.setGlyphData(codepoints_.data());
    result.setPlacementData(placements_.data());
    result.placementType = BL_GLYPH_PLACEMENT_TYPE_ADVANCE_OFFSET;

    return result;
}

auto HbShapedText::advance() const noexcept -> BLPoint {
    return advance_;
}

//
// From File
//

namespace {

[[nodiscard]] auto parse_face(const BLArray<uint8_t> &buffer, uint32_t face_index,
                              const std::string &origin) -> FontFace {
    BLFontData data;
    if (const auto result = data.createFromData(buffer); result != BL_SUCCESS) {
        throw FontParseError("Unable to create font data from " + origin);
    }

    BLFontFace face;
    if (const auto result = face.createFromData(data, face_index); result != BL_SUCCESS) {
        throw FontParseError("Unable to parse TrueType outlines of " + origin);
    }

    return FontFace {
        .bl_face = std::move(face),
        .hb_face = HbFontFace {std::span<const uint8_t> {buffer.data(), buffer.size()},
                               face_index},
    };
}

}  // namespace

auto create_face_from_file(const std::string &filename, uint32_t face_index)
    -> FontFace {
    BLArray<uint8_t> buffer;
    if (const auto result = BLFileSystem::readFile(filename.c_str(), buffer);
        result != BL_SUCCESS) {
        throw FontDirectoryReadError("Unable to read font file " + filename);
    }

    return parse_face(buffer, face_index, filename);
}

auto create_font(const FontFace &face, float font_size) -> Font {
    BLFont font;

    if (const auto result = font.createFromFace(face.bl_face, font_size);
        result != BL_SUCCESS) {
        throw FontParseError("Unable to create font of size " +
                             std::to_string(font_size));
    }

    return Font {
        .bl_font = std::move(font),
        .hb_font = HbFont {face.hb_face},
        .size = font_size,
    };
}

}  // namespace shellframe
