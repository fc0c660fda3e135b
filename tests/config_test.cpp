#include "config.h"

#include "errors.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace shellframe {
namespace {

TEST(Config, EmptyDocumentKeepsDefaults) {
    const auto config = config_from_json("{}");

    EXPECT_DOUBLE_EQ(config.factor, 2.0);
    EXPECT_DOUBLE_EQ(config.font_size, 12.0);
    EXPECT_EQ(config.font_dir, "fonts");
    EXPECT_TRUE(config.draw_decorations);
    EXPECT_TRUE(config.draw_shadow);
    EXPECT_EQ(config.shadow_base_color, "#10101066");
    EXPECT_EQ(config.tab_spaces, 2);
}

TEST(Config, OverridesGivenKeys) {
    const auto config = config_from_json(R"({
        "factor": 1.5,
        "font_dir": "/usr/share/fonts/mono",
        "draw_shadow": false,
        "line_spacing": 1.0,
        "tab_spaces": 4,
        "prompt": "$"
    })");

    EXPECT_DOUBLE_EQ(config.factor, 1.5);
    EXPECT_EQ(config.font_dir, "/usr/share/fonts/mono");
    EXPECT_FALSE(config.draw_shadow);
    EXPECT_DOUBLE_EQ(config.line_spacing, 1.0);
    EXPECT_EQ(config.tab_spaces, 4);
    EXPECT_EQ(config.prompt, "$");
    EXPECT_TRUE(config.draw_decorations);
}

TEST(Config, RejectsWrongTypes) {
    EXPECT_THROW(static_cast<void>(config_from_json(R"({"margin": "wide"})")), ConfigError);
    EXPECT_THROW(static_cast<void>(config_from_json(R"({"draw_shadow": 3})")), ConfigError);
}

TEST(Config, RejectsMalformedDocuments) {
    EXPECT_THROW(static_cast<void>(config_from_json("{ factor: ")), ConfigError);
    EXPECT_THROW(static_cast<void>(config_from_json("[1, 2]")), ConfigError);
}

TEST(Config, RejectsNonPositiveFactor) {
    EXPECT_THROW(static_cast<void>(config_from_json(R"({"factor": 0})")), ConfigError);
}

TEST(Config, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "shellframe_config_test.json";
    {
        auto out = std::ofstream {path};
        out << R"({"padding": 10, "background_color": "#000000"})";
    }

    const auto config = load_config(path);
    std::filesystem::remove(path);

    EXPECT_DOUBLE_EQ(config.padding, 10.0);
    EXPECT_EQ(config.background_color, "#000000");
}

TEST(Config, MissingFileIsConfigError) {
    EXPECT_THROW(static_cast<void>(load_config("/nonexistent/shellframe.json")), ConfigError);
}

TEST(HexColor, ParsesAllForms) {
    EXPECT_EQ(parse_hex_color("#ED655A").value, 0xFFED655AU);
    EXPECT_EQ(parse_hex_color("71bd47").value, 0xFF71BD47U);
    EXPECT_EQ(parse_hex_color("#abc").value, 0xFFAABBCCU);
    EXPECT_EQ(parse_hex_color("#10101066").value, 0x66101010U);
}

TEST(HexColor, RejectsInvalidInput) {
    EXPECT_THROW(static_cast<void>(parse_hex_color("")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_hex_color("#12345")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_hex_color("#GG0000")), ConfigError);
}

}  // namespace
}  // namespace shellframe
