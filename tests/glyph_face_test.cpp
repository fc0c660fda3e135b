#include "glyph_face.h"

#include "font_shaping.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <stdexcept>

namespace shellframe {
namespace {

using testing::pixel_at;
using testing::test_font_file;
using testing::transparent_image;

class RealGlyphFace : public ::testing::Test {
   protected:
    [[nodiscard]] static auto make_face(float pixel_size) -> FontGlyphFace {
        return FontGlyphFace {create_font(create_face_from_file(test_font_file), pixel_size)};
    }
};

TEST(FontPixelSize, ScalesPointsByDpi) {
    EXPECT_FLOAT_EQ(font_pixel_size(12.0, 72.0), 12.0F);
    EXPECT_FLOAT_EQ(font_pixel_size(12.0, 144.0), 24.0F);
    EXPECT_FLOAT_EQ(font_pixel_size(2.0 * 12.0, 144.0), 48.0F);
}

TEST_F(RealGlyphFace, MetricsAreFlooredToWholePixels) {
    const auto face = make_face(20.0F);

    // 984 / 1000 * 20 = 19.68 and (984 + 273) / 1000 * 20 = 25.14
    EXPECT_DOUBLE_EQ(face.ascent(), 19.0);
    EXPECT_DOUBLE_EQ(face.line_height(), 25.0);
    EXPECT_EQ(face.ascent(), std::floor(face.ascent()));
    EXPECT_EQ(face.line_height(), std::floor(face.line_height()));
}

TEST_F(RealGlyphFace, AdvanceScalesFontUnitsToPixels) {
    const auto face = make_face(20.0F);

    EXPECT_DOUBLE_EQ(face.advance(U"a"), 12.0);
    EXPECT_DOUBLE_EQ(face.advance(U""), 0.0);
    EXPECT_DOUBLE_EQ(make_face(40.0F).advance(U"a"), 24.0);
}

TEST_F(RealGlyphFace, MonospaceAdvanceIsLinear) {
    const auto face = make_face(24.0F);

    EXPECT_DOUBLE_EQ(face.advance(U"aaa"), 3 * face.advance(U"a"));
    EXPECT_DOUBLE_EQ(face.advance(U"a b"), face.advance(U"aaa"));
}

TEST_F(RealGlyphFace, DrawsGlyphPixels) {
    const auto face = make_face(20.0F);
    auto image = transparent_image(20, 30);

    BLContext ctx(image);
    face.draw(ctx, BLPoint(2.0, face.ascent()), U'M', BLRgba32(0xFFFFFFFF));
    face.draw(ctx, BLPoint(2.0, face.ascent()), U' ', BLRgba32(0xFFFFFFFF));
    ctx.end();

    auto painted = 0;
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            painted += pixel_at(image, x, y) != 0 ? 1 : 0;
        }
    }
    EXPECT_GT(painted, 0);
}

TEST(FaceFor, FallsBackToRegular) {
    const auto regular = std::make_shared<const testing::BoxGlyphFace>(6.0);
    const auto bold = std::make_shared<const testing::BoxGlyphFace>(7.0);
    const auto faces = FontFaceSet {.regular = regular, .bold = bold};

    EXPECT_EQ(&face_for(faces, StyleClass::bold), bold.get());
    EXPECT_EQ(&face_for(faces, StyleClass::italic), regular.get());
    EXPECT_EQ(&face_for(faces, static_cast<StyleClass>(6)), regular.get());
    EXPECT_THROW(static_cast<void>(face_for(FontFaceSet {}, StyleClass::regular)),
                 std::logic_error);
}

}  // namespace
}  // namespace shellframe
