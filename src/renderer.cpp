#include "renderer.h"

#include "errors.h"
#include "stack_blur.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <string_view>

namespace shellframe {

namespace {

[[nodiscard]] auto to_rgba(Rgb color) -> BLRgba32 {
    return BLRgba32 {color.r, color.g, color.b, 0xFF};
}

[[nodiscard]] auto create_canvas(int width, int height) -> BLImage {
    BLImage image;
    if (const auto result = image.create(width, height, BL_FORMAT_PRGB32);
        result != BL_SUCCESS) {
        throw EncodingError("Unable to create canvas of " + std::to_string(width) + "x" +
                            std::to_string(height) + " pixels");
    }
    return image;
}

[[nodiscard]] auto render_shadow(const WindowStyle &style, const WindowGeometry &geometry)
    -> BLImage {
    BLImage layer;
    if (const auto result =
            layer.create(geometry.canvas_width(), geometry.canvas_height(), BL_FORMAT_PRGB32);
        result != BL_SUCCESS) {
        throw BlurProcessingError("Unable to create shadow layer");
    }

    BLContext ctx(layer);
    ctx.clearAll();
    ctx.fillRoundRect(BLRoundRect(geometry.x_offset + style.shadow_offset_x,
                                  geometry.y_offset + style.shadow_offset_y,
                                  geometry.body_width(style), geometry.body_height(style),
                                  geometry.corner),
                      style.shadow_color);
    ctx.end();

    stack_blur(layer, style.shadow_radius);
    return layer;
}

}  // namespace

//
// Window
//

auto WindowGeometry::canvas_width() const -> int {
    return std::max(1, static_cast<int>(width));
}

auto WindowGeometry::canvas_height() const -> int {
    return std::max(1, static_cast<int>(height));
}

auto WindowGeometry::body_width(const WindowStyle &style) const -> double {
    return width - 2 * style.margin;
}

auto WindowGeometry::body_height(const WindowStyle &style) const -> double {
    return height - 2 * style.margin;
}

auto WindowGeometry::text_origin(const WindowStyle &style) const -> BLPoint {
    return BLPoint {x_offset + style.padding, y_offset + style.padding + title_offset};
}

auto window_geometry(const WindowStyle &style, ContentExtent content) -> WindowGeometry {
    const auto f = [&style](double value) { return style.factor * value; };

    auto geometry = WindowGeometry {};
    geometry.corner = f(6);
    geometry.button_radius = f(9);
    geometry.button_distance = f(25);

    const auto content_width =
        std::max(content.width, 3 * geometry.button_distance + 3 * geometry.button_radius);

    if (style.draw_decorations) {
        geometry.title_offset = f(40);
    }

    geometry.width = content_width + 2 * style.margin + 2 * style.padding;
    geometry.height =
        content.height + 2 * style.margin + 2 * style.padding + geometry.title_offset;

    geometry.x_offset = style.margin;
    geometry.y_offset = style.margin;
    if (style.draw_shadow) {
        geometry.x_offset -= style.shadow_offset_x / 2;
        geometry.y_offset -= style.shadow_offset_y / 2;
    }

    return geometry;
}

auto render_window(const WindowStyle &style, const WindowGeometry &geometry) -> BLImage {
    auto image = create_canvas(geometry.canvas_width(), geometry.canvas_height());

    // the blurred layer is released once it has been composited
    auto shadow = style.draw_shadow ? render_shadow(style, geometry) : BLImage {};

    BLContext ctx(image);
    ctx.clearAll();

    if (style.draw_shadow) {
        ctx.blitImage(BLPointI(0, 0), shadow);
        shadow.reset();
    }

    const auto body = BLRoundRect(geometry.x_offset, geometry.y_offset,
                                  geometry.body_width(style), geometry.body_height(style),
                                  geometry.corner);

    ctx.fillRoundRect(body, style.background);

    ctx.setStrokeWidth(style.factor);
    ctx.strokeRoundRect(body, style.outline);

    if (style.draw_decorations) {
        for (std::size_t i = 0; i < decoration_colors.size(); ++i) {
            const auto center = BLPoint {
                geometry.x_offset + style.padding +
                    static_cast<double>(i) * geometry.button_distance + style.factor * 4,
                geometry.y_offset + style.padding + style.factor * 4,
            };

            ctx.fillCircle(BLCircle(center.x, center.y, geometry.button_radius),
                           BLRgba32(decoration_colors[i]));
        }
    }

    ctx.end();
    return image;
}

//
// Glyphs
//

auto substitute_glyph(char32_t symbol) -> char32_t {
    switch (symbol) {
        case U'✗':  // ballot x
        case U'ˣ':  // modifier letter small x
            return U'×';
        default:
            return symbol;
    }
}

auto render_glyphs(BLContext &ctx, const RuneStream &content, const FontFaceSet &faces,
                   BLPoint origin, const TextStyle &style) -> void {
    const auto &regular = face_for(faces, StyleClass::regular);

    auto x = origin.x;
    auto y = origin.y + regular.ascent();

    for (const auto &rune : content) {
        const auto &face = face_for(faces, rune.style.style_class);

        const auto symbol = rune.symbol;
        const auto width = face.advance(std::u32string_view {&symbol, 1});
        const auto height = face.line_height();

        if (rune.style.has_background) {
            ctx.fillRect(BLRect(x, y - face.ascent(), width, height),
                         to_rgba(rune.style.background));
        }

        const auto color =
            rune.style.has_foreground ? to_rgba(rune.style.foreground) : style.default_foreground;

        if (symbol == U'\n') {
            x = origin.x;
            y += height * style.line_spacing;
            continue;
        }

        if (symbol == U'\t') {
            x += face.advance(U" ") * style.tab_spaces;
            continue;
        }

        const auto glyph = substitute_glyph(symbol);
        if (glyph != symbol) {
            spdlog::debug("GlyphRenderer: substituted U+{:04X} with U+{:04X}",
                          static_cast<uint32_t>(symbol), static_cast<uint32_t>(glyph));
        }

        face.draw(ctx, BLPoint {x, y}, glyph, color);

        if (rune.style.style_class == StyleClass::underline) {
            const auto underline_y = y + style.factor * 4;

            ctx.setStrokeWidth(style.factor);
            ctx.strokeLine(BLPoint {x, underline_y}, BLPoint {x + width, underline_y}, color);
        }

        x += width;
    }
}

}  // namespace shellframe
