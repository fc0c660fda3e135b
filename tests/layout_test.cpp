#include "layout.h"

#include "test_support.h"

#include <gtest/gtest.h>

namespace shellframe {
namespace {

using testing::BoxGlyphFace;
using testing::plain_runes;

[[nodiscard]] auto stream_of(std::u32string_view text) -> RuneStream {
    auto stream = RuneStream {};
    stream.append(plain_runes(text));
    return stream;
}

TEST(SplitLines, DropsSingleTrailingNewline) {
    EXPECT_EQ(split_lines(stream_of(U"hello\n")), std::vector<std::u32string> {U"hello"});
    EXPECT_EQ(split_lines(stream_of(U"a\n\n")),
              (std::vector<std::u32string> {U"a", U""}));
}

TEST(SplitLines, EmptyContentIsOneEmptyLine) {
    EXPECT_EQ(split_lines(RuneStream {}), std::vector<std::u32string> {U""});
}

TEST(MeasureContent, HelloScenario) {
    const auto face = BoxGlyphFace {6.0, 11.0, 14.0};
    const auto policy = LayoutPolicy {.columns = 0, .line_spacing = 1.0};

    const auto extent = measure_content(stream_of(U"hello\n"), face, policy);

    EXPECT_DOUBLE_EQ(extent.width, 30.0);
    EXPECT_DOUBLE_EQ(extent.height, 14.0);
}

TEST(MeasureContent, UsesLongestLine) {
    const auto face = BoxGlyphFace {};
    const auto policy = LayoutPolicy {.columns = 0, .line_spacing = 1.0};

    const auto extent = measure_content(stream_of(U"ab\nabcdef\nabc"), face, policy);

    EXPECT_DOUBLE_EQ(extent.width, 36.0);
    EXPECT_DOUBLE_EQ(extent.height, 3 * 14.0);
}

TEST(MeasureContent, FixedColumnsIgnoreContentWidth) {
    const auto face = BoxGlyphFace {};
    const auto policy = LayoutPolicy {.columns = 10, .line_spacing = 1.0};

    EXPECT_DOUBLE_EQ(measure_content(stream_of(U"ab"), face, policy).width, 60.0);
    EXPECT_DOUBLE_EQ(measure_content(RuneStream {}, face, policy).width, 60.0);
}

TEST(MeasureContent, EmptyContentHasOneLineHeight) {
    const auto face = BoxGlyphFace {};
    const auto policy = LayoutPolicy {.columns = 0, .line_spacing = 1.5};

    const auto extent = measure_content(RuneStream {}, face, policy);

    EXPECT_DOUBLE_EQ(extent.width, 0.0);
    EXPECT_DOUBLE_EQ(extent.height, 14.0);
}

TEST(MeasureContent, LineSpacingScalesAllButOneLine) {
    const auto face = BoxGlyphFace {};
    const auto policy = LayoutPolicy {.columns = 0, .line_spacing = 1.5};

    const auto extent = measure_content(stream_of(U"a\nb\nc"), face, policy);

    EXPECT_DOUBLE_EQ(extent.height, 14.0 * (2 * 1.5 + 1));
}

TEST(MeasureContent, HeightGrowsWithLineCount) {
    const auto face = BoxGlyphFace {};
    const auto policy = LayoutPolicy {.columns = 0, .line_spacing = 1.2};

    auto text = std::u32string {};
    auto previous = 0.0;
    for (int lines = 0; lines < 8; ++lines) {
        const auto height = measure_content(stream_of(text), face, policy).height;
        EXPECT_GE(height, previous);

        previous = height;
        text += U"line\n";
    }
}

}  // namespace
}  // namespace shellframe
