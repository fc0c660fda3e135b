#ifndef SHELLFRAME_CONFIG_H
#define SHELLFRAME_CONFIG_H

#include <blend2d.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace shellframe {

// Rendering settings in unscaled units. Geometry is multiplied with
// `factor` when a Scaffold is created from it.
struct Config {
    double factor {2.0};

    double font_size {12.0};
    double font_dpi {144.0};
    std::string font_dir {"fonts"};

    double margin {48.0};
    double padding {24.0};

    bool draw_decorations {true};
    bool draw_shadow {true};
    std::string shadow_base_color {"#10101066"};
    double shadow_radius {20.0};
    double shadow_offset_x {16.0};
    double shadow_offset_y {16.0};

    double line_spacing {1.2};
    int tab_spaces {2};

    std::string prompt {"➜"};
    std::string prompt_color {"#2ECC71"};
    std::string command_color {"#E0E0E0"};
    std::string outline_color {"#5A5A5A"};
    std::string background_color {"#151515"};
};

// Reads a JSON document, missing keys keep their default value.
// Throws ConfigError for unreadable files, bad JSON and wrong types.
[[nodiscard]] auto load_config(const std::filesystem::path &path) -> Config;
[[nodiscard]] auto config_from_json(std::string_view text) -> Config;

// Accepts #RGB, #RRGGBB and #RRGGBBAA, throws ConfigError otherwise.
[[nodiscard]] auto parse_hex_color(std::string_view hex) -> BLRgba32;

}  // namespace shellframe

#endif
