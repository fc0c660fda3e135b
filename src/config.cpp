#include "config.h"

#include "errors.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace shellframe {

namespace {

template <typename T>
auto read_value(const json &j, const char *key, T &target) -> void {
    if (auto it = j.find(key); it != j.end()) {
        target = it->get<T>();
    }
}

[[nodiscard]] auto from_json_document(const json &j) -> Config {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    auto config = Config {};

    try {
        read_value(j, "factor", config.factor);
        read_value(j, "font_size", config.font_size);
        read_value(j, "font_dpi", config.font_dpi);
        read_value(j, "font_dir", config.font_dir);
        read_value(j, "margin", config.margin);
        read_value(j, "padding", config.padding);
        read_value(j, "draw_decorations", config.draw_decorations);
        read_value(j, "draw_shadow", config.draw_shadow);
        read_value(j, "shadow_base_color", config.shadow_base_color);
        read_value(j, "shadow_radius", config.shadow_radius);
        read_value(j, "shadow_offset_x", config.shadow_offset_x);
        read_value(j, "shadow_offset_y", config.shadow_offset_y);
        read_value(j, "line_spacing", config.line_spacing);
        read_value(j, "tab_spaces", config.tab_spaces);
        read_value(j, "prompt", config.prompt);
        read_value(j, "prompt_color", config.prompt_color);
        read_value(j, "command_color", config.command_color);
        read_value(j, "outline_color", config.outline_color);
        read_value(j, "background_color", config.background_color);
    } catch (const json::exception &e) {
        throw ConfigError(std::string {"Invalid configuration value: "} + e.what());
    }

    if (config.factor <= 0.0) {
        throw ConfigError("Configuration value factor must be positive");
    }
    if (config.tab_spaces < 0) {
        throw ConfigError("Configuration value tab_spaces must not be negative");
    }

    return config;
}

[[nodiscard]] auto hex_digit(char ch) -> int {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

}  // namespace

auto config_from_json(std::string_view text) -> Config {
    auto j = json {};
    try {
        j = json::parse(text);
    } catch (const json::exception &e) {
        throw ConfigError(std::string {"Unable to parse configuration: "} + e.what());
    }

    return from_json_document(j);
}

auto load_config(const std::filesystem::path &path) -> Config {
    auto in = std::ifstream {path, std::ios::binary};
    if (!in) {
        throw ConfigError("Unable to open configuration file " + path.string());
    }

    auto buffer = std::stringstream {};
    buffer << in.rdbuf();

    try {
        return config_from_json(buffer.str());
    } catch (const ConfigError &e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

auto parse_hex_color(std::string_view hex) -> BLRgba32 {
    if (hex.starts_with('#')) {
        hex.remove_prefix(1);
    }

    auto digits = std::string {};
    switch (hex.size()) {
        case 3:
            for (const auto ch : hex) {
                digits.append(2, ch);
            }
            digits += "ff";
            break;
        case 6:
            digits = std::string {hex} + "ff";
            break;
        case 8:
            digits = std::string {hex};
            break;
        default:
            throw ConfigError("Invalid hex color '" + std::string {hex} + "'");
    }

    uint32_t channels[4] {};
    for (std::size_t i = 0; i < 4; ++i) {
        const auto hi = hex_digit(digits[2 * i]);
        const auto lo = hex_digit(digits[2 * i + 1]);

        if (hi < 0 || lo < 0) {
            throw ConfigError("Invalid hex color '" + std::string {hex} + "'");
        }
        channels[i] = static_cast<uint32_t>(hi * 16 + lo);
    }

    return BLRgba32 {channels[0], channels[1], channels[2], channels[3]};
}

}  // namespace shellframe
