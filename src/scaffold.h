#ifndef SHELLFRAME_SCAFFOLD_H
#define SHELLFRAME_SCAFFOLD_H

#include "config.h"
#include "glyph_face.h"
#include "layout.h"
#include "renderer.h"
#include "styled_rune.h"

#include <blend2d.h>

#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <span>
#include <string>

namespace shellframe {

struct FontOptions {
    // point size already multiplied by factor
    double size {};
    double dpi {};
};

// One rendering session: the content, the scaled geometry and the fonts.
//
// A Scaffold is not safe for concurrent use. Font faces are immutable and
// may be shared between sessions.
class Scaffold {
   public:
    // loads the faces from config.font_dir
    explicit Scaffold(const Config &config);
    explicit Scaffold(const Config &config, FontFaceSet faces);

    auto set_font_face_regular(std::shared_ptr<const GlyphFace> face) -> void;
    auto set_font_face_bold(std::shared_ptr<const GlyphFace> face) -> void;
    auto set_font_face_italic(std::shared_ptr<const GlyphFace> face) -> void;
    auto set_font_face_bold_italic(std::shared_ptr<const GlyphFace> face) -> void;

    // 0 wraps at the terminal width and sizes the window to the longest line
    auto set_columns(int columns) -> void;
    auto draw_decorations(bool value) -> void;
    auto draw_shadow(bool value) -> void;
    auto clip_canvas(bool value) -> void;

    // the fixed column count, else the detected terminal width
    [[nodiscard]] auto fixed_columns() const -> int;
    [[nodiscard]] auto font_options() const -> FontOptions;

    // Tokenizes ANSI text from the stream and appends it with line wrapping.
    // Throws InputStreamError if the stream is unreadable or malformed.
    auto add_content(std::istream &in) -> void;
    auto add_runes(std::span<const StyledRune> runes) -> void;
    // appends a prompt line `<prompt> <args...>`
    auto add_command(std::span<const std::string> args) -> void;

    [[nodiscard]] auto content() const noexcept -> const RuneStream &;
    [[nodiscard]] auto measure_content() const -> ContentExtent;

    // composed window with text, without clipping
    [[nodiscard]] auto image() const -> BLImage;
    // image() clipped when enabled
    [[nodiscard]] auto render() const -> BLImage;

    auto write_png(std::ostream &out) const -> void;
    auto write_png(const std::filesystem::path &path) const -> void;
    // literal UTF-8 characters of the content
    auto write_raw(std::ostream &out) const -> void;

   private:
    RuneStream content_ {};

    FontFaceSet faces_ {};
    FontOptions font_options_ {};

    WindowStyle window_ {};
    TextStyle text_ {};

    int columns_ {0};
    bool clip_canvas_ {false};

    std::string prompt_ {};
    BLRgba32 prompt_color_ {};
    BLRgba32 command_color_ {};
};

}  // namespace shellframe

#endif
