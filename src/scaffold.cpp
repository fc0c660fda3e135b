#include "scaffold.h"

#include "ansi_tokenizer.h"
#include "canvas_clipper.h"
#include "content_ingestor.h"
#include "errors.h"
#include "font_resolver.h"
#include "terminal.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace shellframe {

namespace {

[[nodiscard]] auto true_color_sequence(BLRgba32 color) -> std::string {
    return "\x1b[38;2;" + std::to_string(color.r()) + ";" + std::to_string(color.g()) +
           ";" + std::to_string(color.b()) + "m";
}

auto require_face(const std::shared_ptr<const GlyphFace> &face) -> void {
    if (face == nullptr) {
        throw std::invalid_argument("font face must not be null");
    }
}

}  // namespace

Scaffold::Scaffold(const Config &config)
    : Scaffold {config,
                load_font_faces(config.font_dir,
                                font_pixel_size(config.factor * config.font_size,
                                                config.font_dpi))} {}

Scaffold::Scaffold(const Config &config, FontFaceSet faces)
    : faces_ {std::move(faces)},
      font_options_ {.size = config.factor * config.font_size, .dpi = config.font_dpi},
      prompt_ {config.prompt},
      prompt_color_ {parse_hex_color(config.prompt_color)},
      command_color_ {parse_hex_color(config.command_color)} {
    require_face(faces_.regular);
    require_face(faces_.bold);
    require_face(faces_.italic);
    require_face(faces_.bold_italic);

    const auto f = config.factor;

    window_ = WindowStyle {
        .factor = f,
        .margin = f * config.margin,
        .padding = f * config.padding,
        .draw_decorations = config.draw_decorations,
        .draw_shadow = config.draw_shadow,
        .shadow_color = parse_hex_color(config.shadow_base_color),
        .shadow_radius = static_cast<uint32_t>(
            std::clamp(f * config.shadow_radius, 0.0, static_cast<double>(255))),
        .shadow_offset_x = f * config.shadow_offset_x,
        .shadow_offset_y = f * config.shadow_offset_y,
        .background = parse_hex_color(config.background_color),
        .outline = parse_hex_color(config.outline_color),
    };

    text_ = TextStyle {
        .factor = f,
        .line_spacing = config.line_spacing,
        .tab_spaces = config.tab_spaces,
        .default_foreground = BLRgba32(default_foreground_color),
    };
}

auto Scaffold::set_font_face_regular(std::shared_ptr<const GlyphFace> face) -> void {
    require_face(face);
    faces_.regular = std::move(face);
}

auto Scaffold::set_font_face_bold(std::shared_ptr<const GlyphFace> face) -> void {
    require_face(face);
    faces_.bold = std::move(face);
}

auto Scaffold::set_font_face_italic(std::shared_ptr<const GlyphFace> face) -> void {
    require_face(face);
    faces_.italic = std::move(face);
}

auto Scaffold::set_font_face_bold_italic(std::shared_ptr<const GlyphFace> face) -> void {
    require_face(face);
    faces_.bold_italic = std::move(face);
}

auto Scaffold::set_columns(int columns) -> void {
    columns_ = std::max(columns, 0);
}

auto Scaffold::draw_decorations(bool value) -> void {
    window_.draw_decorations = value;
}

auto Scaffold::draw_shadow(bool value) -> void {
    window_.draw_shadow = value;
}

auto Scaffold::clip_canvas(bool value) -> void {
    clip_canvas_ = value;
}

auto Scaffold::fixed_columns() const -> int {
    if (columns_ != 0) {
        return columns_;
    }

    return terminal_columns();
}

auto Scaffold::font_options() const -> FontOptions {
    return font_options_;
}

//
// Content
//

auto Scaffold::add_content(std::istream &in) -> void {
    const auto runes = tokenize_ansi(in);
    add_runes(runes);
}

auto Scaffold::add_runes(std::span<const StyledRune> runes) -> void {
    const auto wrapped = wrap_runes(runes, fixed_columns());
    content_.append(wrapped);
}

auto Scaffold::add_command(std::span<const std::string> args) -> void {
    auto command = std::string {};
    for (const auto &arg : args) {
        if (!command.empty()) {
            command += ' ';
        }
        command += arg;
    }

    const auto reset = std::string {"\x1b[0m"};
    auto in = std::istringstream {true_color_sequence(prompt_color_) + prompt_ + reset +
                                  " " + true_color_sequence(command_color_) + command +
                                  reset + "\n"};
    add_content(in);
}

auto Scaffold::content() const noexcept -> const RuneStream & {
    return content_;
}

auto Scaffold::measure_content() const -> ContentExtent {
    const auto policy = LayoutPolicy {
        .columns = columns_,
        .line_spacing = text_.line_spacing,
    };

    return shellframe::measure_content(content_, *faces_.regular, policy);
}

//
// Output
//

auto Scaffold::image() const -> BLImage {
    const auto extent = measure_content();
    const auto geometry = window_geometry(window_, extent);

    spdlog::debug("Scaffold: content {}x{}, canvas {}x{}", extent.width, extent.height,
                  geometry.canvas_width(), geometry.canvas_height());

    auto image = render_window(window_, geometry);

    BLContext ctx(image);
    render_glyphs(ctx, content_, faces_, geometry.text_origin(window_), text_);
    ctx.end();

    return image;
}

auto Scaffold::render() const -> BLImage {
    auto result = image();

    if (clip_canvas_) {
        result = shellframe::clip_canvas(result);
    }

    return result;
}

auto Scaffold::write_png(std::ostream &out) const -> void {
    const auto result = render();

    BLImageCodec codec;
    if (codec.findByName("PNG") != BL_SUCCESS) {
        throw EncodingError("PNG codec is not available");
    }

    BLArray<uint8_t> buffer;
    if (result.writeToData(buffer, codec) != BL_SUCCESS) {
        throw EncodingError("Unable to encode image as PNG");
    }

    out.write(reinterpret_cast<const char *>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    if (!out) {
        throw EncodingError("Unable to write PNG data");
    }
}

auto Scaffold::write_png(const std::filesystem::path &path) const -> void {
    auto out = std::ofstream {path, std::ios::binary};
    if (!out) {
        throw EncodingError("Unable to open PNG file " + path.string());
    }

    write_png(out);
}

auto Scaffold::write_raw(std::ostream &out) const -> void {
    const auto text = content_.utf8();

    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        throw EncodingError("Unable to write raw content");
    }
}

}  // namespace shellframe
