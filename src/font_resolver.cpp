#include "font_resolver.h"

#include "errors.h"
#include "font_shaping.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace shellframe {

namespace {

[[nodiscard]] auto list_font_candidates(const std::filesystem::path &directory)
    -> std::vector<std::string> {
    auto names = std::vector<std::string> {};

    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator {directory, ec};
    if (ec) {
        throw FontDirectoryReadError("Unable to read font directory " +
                                     directory.string() + ": " + ec.message());
    }

    for (; it != std::filesystem::directory_iterator {}; it.increment(ec)) {
        if (ec) {
            throw FontDirectoryReadError("Unable to list font directory " +
                                         directory.string() + ": " + ec.message());
        }

        if (it->is_directory(ec) || it->path().extension() != ".ttf") {
            continue;
        }
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        throw FontDirectoryReadError("Unable to list font directory " +
                                     directory.string() + ": " + ec.message());
    }

    // directory order is unspecified
    std::ranges::sort(names);
    return names;
}

}  // namespace

auto resolve_font_files(const std::filesystem::path &directory) -> FontFiles {
    auto found = FontFiles {};

    for (const auto &name : list_font_candidates(directory)) {
        for (std::size_t i = 0; i < font_styles.size(); ++i) {
            const auto suffix = "-" + std::string {font_styles[i]} + ".ttf";

            if (!name.ends_with(suffix)) {
                continue;
            }

            if (!found[i].empty()) {
                throw DuplicateFontError(
                    "Multiple files found for " + std::string {font_styles[i]} +
                        " style in " + directory.string() + ": " +
                        found[i].filename().string() + " and " + name,
                    std::string {font_styles[i]});
            }
            found[i] = directory / name;
        }
    }

    for (std::size_t i = 0; i < font_styles.size(); ++i) {
        if (found[i].empty()) {
            throw MissingFontError("Missing required font file: no file matching *-" +
                                       std::string {font_styles[i]} + ".ttf found in " +
                                       directory.string(),
                                   std::string {font_styles[i]});
        }
    }

    return found;
}

auto load_font_faces(const std::filesystem::path &directory, float pixel_size)
    -> FontFaceSet {
    const auto files = resolve_font_files(directory);

    auto faces = std::array<std::shared_ptr<const GlyphFace>, font_styles.size()> {};

    for (std::size_t i = 0; i < font_styles.size(); ++i) {
        try {
            const auto face = create_face_from_file(files[i].string());
            faces[i] = std::make_shared<const FontGlyphFace>(create_font(face, pixel_size));
        } catch (const FontDirectoryReadError &exc) {
            throw FontDirectoryReadError("Failed to load " + std::string {font_styles[i]} +
                                         " font: " + exc.what());
        } catch (const FontParseError &exc) {
            throw FontParseError("Failed to load " + std::string {font_styles[i]} +
                                 " font: " + exc.what());
        }

        spdlog::info("FontResolver: {} style loaded from {} at {}px", font_styles[i],
                     files[i].string(), pixel_size);
    }

    return FontFaceSet {
        .regular = faces[0],
        .bold = faces[1],
        .italic = faces[2],
        .bold_italic = faces[3],
    };
}

}  // namespace shellframe
