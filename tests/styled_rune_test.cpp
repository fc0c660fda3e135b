#include "styled_rune.h"

#include <gtest/gtest.h>

namespace shellframe {
namespace {

TEST(StyleWord, DecodesDocumentedBitLayout) {
    const auto word = style_foreground_bit | style_background_bit | (StyleWord {2} << 2) |
                      (StyleWord {0x332211} << 8) | (StyleWord {0x665544} << 32);

    const auto style = decode_style(word);

    EXPECT_TRUE(style.has_foreground);
    EXPECT_EQ(style.foreground, (Rgb {0x11, 0x22, 0x33}));
    EXPECT_TRUE(style.has_background);
    EXPECT_EQ(style.background, (Rgb {0x44, 0x55, 0x66}));
    EXPECT_EQ(style.style_class, StyleClass::italic);
}

TEST(StyleWord, IgnoresColorFieldsWithoutFlags) {
    const auto word = (StyleWord {0xFFFFFF} << 8) | (StyleWord {0xFFFFFF} << 32);

    const auto style = decode_style(word);

    EXPECT_FALSE(style.has_foreground);
    EXPECT_FALSE(style.has_background);
    EXPECT_EQ(style.foreground, Rgb {});
    EXPECT_EQ(style.background, Rgb {});
}

TEST(StyleWord, StyleClassDoesNotImplyColor) {
    const auto style = decode_style(style_bold_bit);

    EXPECT_EQ(style.style_class, StyleClass::bold);
    EXPECT_FALSE(style.has_foreground);
    EXPECT_FALSE(style.has_background);
}

TEST(StyleWord, ColorDecodingInvertsEncoding) {
    for (const auto color : {Rgb {0, 0, 0}, Rgb {255, 255, 255}, Rgb {1, 128, 254},
                             Rgb {237, 101, 90}}) {
        EXPECT_EQ(decode_color(encode_color(color, style_foreground_shift),
                               style_foreground_shift),
                  color);
        EXPECT_EQ(decode_color(encode_color(color, style_background_shift),
                               style_background_shift),
                  color);
    }
}

TEST(StyleWord, OutOfRangeStyleClassSurvivesEncoding) {
    const auto word = StyleWord {5} << style_class_shift;

    const auto style = decode_style(word);

    EXPECT_EQ(static_cast<int>(style.style_class), 5);
    EXPECT_EQ(encode_style(style), word);
}

TEST(StyleWord, EncodeMatchesDecode) {
    const auto style = Style {
        .has_foreground = true,
        .foreground = Rgb {10, 20, 30},
        .has_background = false,
        .background = {},
        .style_class = StyleClass::underline,
    };

    EXPECT_EQ(decode_style(encode_style(style)), style);
    EXPECT_EQ(encode_style(style) & style_class_mask, style_underline_bit);
}

TEST(RuneStream, AppendsInOrder) {
    auto stream = RuneStream {};
    stream.append(StyledRune {.symbol = U'a'});

    const auto more = std::vector<StyledRune> {{.symbol = U'b'}, {.symbol = U'\n'}};
    stream.append(more);

    ASSERT_EQ(stream.size(), 3U);
    EXPECT_EQ(stream.symbols(), U"ab\n");
    EXPECT_EQ(stream[1].symbol, U'b');
}

TEST(RuneStream, WritesUtf8) {
    auto stream = RuneStream {};
    for (const auto symbol : std::u32string {U"x×✗😀"}) {
        stream.append(StyledRune {.symbol = symbol});
    }

    EXPECT_EQ(stream.utf8(), "x×✗😀");
}

TEST(Utf8, ReplacesSurrogates) {
    auto out = std::string {};
    append_utf8(out, 0xD800);

    EXPECT_EQ(out, "\xEF\xBF\xBD");
}

TEST(StyledRune, ControlSymbols) {
    EXPECT_TRUE(is_control_symbol(U'\n'));
    EXPECT_TRUE(is_control_symbol(U'\t'));
    EXPECT_FALSE(is_control_symbol(U' '));
}

}  // namespace
}  // namespace shellframe
