#include "ansi_tokenizer.h"

#include "errors.h"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

namespace shellframe {
namespace {

[[nodiscard]] auto symbols_of(const std::vector<StyledRune> &runes) -> std::u32string {
    auto result = std::u32string {};
    for (const auto &rune : runes) {
        result.push_back(rune.symbol);
    }
    return result;
}

TEST(AnsiTokenizer, PlainTextHasDefaultStyle) {
    const auto runes = tokenize_ansi("hi\tthere\n");

    EXPECT_EQ(symbols_of(runes), U"hi\tthere\n");
    for (const auto &rune : runes) {
        EXPECT_EQ(rune.style, Style {});
    }
}

TEST(AnsiTokenizer, PaletteColors) {
    const auto runes = tokenize_ansi("\x1b[31;42mx\x1b[39my\x1b[0mz");

    ASSERT_EQ(runes.size(), 3U);
    EXPECT_TRUE(runes[0].style.has_foreground);
    EXPECT_EQ(runes[0].style.foreground, xterm_color(1));
    EXPECT_TRUE(runes[0].style.has_background);
    EXPECT_EQ(runes[0].style.background, xterm_color(2));

    EXPECT_FALSE(runes[1].style.has_foreground);
    EXPECT_TRUE(runes[1].style.has_background);

    EXPECT_EQ(runes[2].style, Style {});
}

TEST(AnsiTokenizer, BrightColors) {
    const auto runes = tokenize_ansi("\x1b[91;104mx");

    ASSERT_EQ(runes.size(), 1U);
    EXPECT_EQ(runes[0].style.foreground, xterm_color(9));
    EXPECT_EQ(runes[0].style.background, xterm_color(12));
}

TEST(AnsiTokenizer, ExtendedColors) {
    const auto runes = tokenize_ansi("\x1b[38;2;1;2;3;48;5;196mx");

    ASSERT_EQ(runes.size(), 1U);
    EXPECT_EQ(runes[0].style.foreground, (Rgb {1, 2, 3}));
    EXPECT_EQ(runes[0].style.background, (Rgb {255, 0, 0}));
}

TEST(AnsiTokenizer, AttributesAddUpToStyleClass) {
    const auto runes = tokenize_ansi(
        "\x1b[1ma\x1b[3mb\x1b[22mc\x1b[23;4md\x1b[1me\x1b[0mf");

    ASSERT_EQ(runes.size(), 6U);
    EXPECT_EQ(runes[0].style.style_class, StyleClass::bold);
    EXPECT_EQ(runes[1].style.style_class, StyleClass::bold_italic);
    EXPECT_EQ(runes[2].style.style_class, StyleClass::italic);
    EXPECT_EQ(runes[3].style.style_class, StyleClass::underline);
    // bold and underline together are outside of the known classes
    EXPECT_EQ(static_cast<int>(runes[4].style.style_class), 5);
    EXPECT_EQ(runes[5].style.style_class, StyleClass::regular);
}

TEST(AnsiTokenizer, DecodesUtf8) {
    EXPECT_EQ(symbols_of(tokenize_ansi("➜ ×😀")), U"➜ ×😀");
}

TEST(AnsiTokenizer, InvalidUtf8BecomesReplacementCharacter) {
    EXPECT_EQ(symbols_of(tokenize_ansi("a\xFF" "b\xC3")), U"a�b�");
}

TEST(AnsiTokenizer, SkipsOtherSequencesAndCarriageReturns) {
    const auto runes = tokenize_ansi("\x1b[2Ka\r\n\x1b]0;title\x07" "b\x1b(Bc");

    EXPECT_EQ(symbols_of(runes), U"a\nbc");
}

TEST(AnsiTokenizer, SkipsCharsetDesignation) {
    const auto runes = tokenize_ansi("\x1b[31mred\x1b(B\x1b[mX");

    EXPECT_EQ(symbols_of(runes), U"redX");
    EXPECT_FALSE(runes.back().style.has_foreground);
    EXPECT_THROW(static_cast<void>(tokenize_ansi("a\x1b(")), InputStreamError);
}

TEST(AnsiTokenizer, UnterminatedSequenceFails) {
    EXPECT_THROW(static_cast<void>(tokenize_ansi("abc\x1b[31")), InputStreamError);
    EXPECT_THROW(static_cast<void>(tokenize_ansi("abc\x1b")), InputStreamError);
}

TEST(AnsiTokenizer, ReadsStreams) {
    auto in = std::istringstream {"\x1b[1mok"};

    EXPECT_EQ(symbols_of(tokenize_ansi(in)), U"ok");
}

TEST(AnsiTokenizer, UnreadableStreamFails) {
    auto in = std::ifstream {"/nonexistent/shellframe-input.txt"};

    EXPECT_THROW(static_cast<void>(tokenize_ansi(in)), InputStreamError);
}

TEST(XtermColor, Palette) {
    EXPECT_EQ(xterm_color(0), (Rgb {0, 0, 0}));
    EXPECT_EQ(xterm_color(15), (Rgb {255, 255, 255}));
    EXPECT_EQ(xterm_color(16), (Rgb {0, 0, 0}));
    EXPECT_EQ(xterm_color(231), (Rgb {255, 255, 255}));
    EXPECT_EQ(xterm_color(232), (Rgb {8, 8, 8}));
    EXPECT_EQ(xterm_color(255), (Rgb {238, 238, 238}));
    EXPECT_EQ(xterm_color(999), xterm_color(255));
}

}  // namespace
}  // namespace shellframe
