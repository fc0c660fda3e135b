#ifndef SHELLFRAME_FONT_RESOLVER_H
#define SHELLFRAME_FONT_RESOLVER_H

#include "glyph_face.h"

#include <array>
#include <filesystem>
#include <string_view>

namespace shellframe {

inline constexpr auto font_styles = std::array<std::string_view, 4> {
    "Regular",
    "Bold",
    "Italic",
    "BoldItalic",
};

// matched file per entry of font_styles
using FontFiles = std::array<std::filesystem::path, font_styles.size()>;

// Finds one `*-<Style>.ttf` file per style in the directory.
//
// Throws FontDirectoryReadError if the directory cannot be listed,
// DuplicateFontError if two files match a style and MissingFontError
// if a style has no match. Other files are ignored.
[[nodiscard]] auto resolve_font_files(const std::filesystem::path &directory)
    -> FontFiles;

// Resolves and loads the four faces, all with the same pixel size.
[[nodiscard]] auto load_font_faces(const std::filesystem::path &directory,
                                   float pixel_size) -> FontFaceSet;

}  // namespace shellframe

#endif
