#ifndef SHELLFRAME_RENDERER_H
#define SHELLFRAME_RENDERER_H

#include "glyph_face.h"
#include "layout.h"
#include "styled_rune.h"

#include <blend2d.h>

#include <array>
#include <cstdint>

namespace shellframe {

// red, yellow and green window buttons
inline constexpr auto decoration_colors = std::array<uint32_t, 3> {
    0xFFED655A,
    0xFFE1C04C,
    0xFF71BD47,
};

// lightgray
inline constexpr uint32_t default_foreground_color = 0xFFD3D3D3;

// Window chrome settings, all lengths already multiplied by factor.
struct WindowStyle {
    double factor {1.0};
    double margin {};
    double padding {};

    bool draw_decorations {false};
    bool draw_shadow {false};

    BLRgba32 shadow_color {};
    uint32_t shadow_radius {};
    double shadow_offset_x {};
    double shadow_offset_y {};

    BLRgba32 background {};
    BLRgba32 outline {};
};

struct WindowGeometry {
    // canvas size before truncation to whole pixels
    double width {};
    double height {};

    // top left corner of the window body
    double x_offset {};
    double y_offset {};

    double title_offset {};
    double corner {};
    double button_radius {};
    double button_distance {};

    [[nodiscard]] auto canvas_width() const -> int;
    [[nodiscard]] auto canvas_height() const -> int;
    [[nodiscard]] auto body_width(const WindowStyle &style) const -> double;
    [[nodiscard]] auto body_height(const WindowStyle &style) const -> double;
    // top left corner of the text area
    [[nodiscard]] auto text_origin(const WindowStyle &style) const -> BLPoint;
};

// Sizes the canvas to fit the content, always leaving room for the three
// window buttons. With a shadow the body moves up and left by half the
// shadow offset.
[[nodiscard]] auto window_geometry(const WindowStyle &style, ContentExtent content)
    -> WindowGeometry;

// Background canvas with optional blurred shadow, window body, outline and
// optional buttons.
[[nodiscard]] auto render_window(const WindowStyle &style, const WindowGeometry &geometry)
    -> BLImage;

struct TextStyle {
    double factor {1.0};
    double line_spacing {1.0};
    int tab_spaces {0};
    BLRgba32 default_foreground {default_foreground_color};
};

// Replaces symbols the bundled fonts lack with a similar looking one.
[[nodiscard]] auto substitute_glyph(char32_t symbol) -> char32_t;

// Draws the runes starting at the top left `origin` of the text area.
// Never fails for individual runes, unset style bits render defaults.
auto render_glyphs(BLContext &ctx, const RuneStream &content, const FontFaceSet &faces,
                   BLPoint origin, const TextStyle &style) -> void;

}  // namespace shellframe

#endif
