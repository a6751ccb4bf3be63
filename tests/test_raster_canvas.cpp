#include <gtest/gtest.h>
#include "raster_canvas.hpp"
#include "captcha_errors.hpp"

using namespace captcha;

TEST(ColorTest, ParseLongAndShortForms) {
    Color yellow = Color::parse("#ffff00");
    EXPECT_EQ(yellow, (Color{255, 255, 0}));
    EXPECT_EQ(Color::parse("#FFFF00"), yellow);
    EXPECT_EQ(Color::parse("#ff0"), yellow);
    EXPECT_EQ(Color::parse("#6e6e6e"), (Color{0x6e, 0x6e, 0x6e}));
}

TEST(ColorTest, ParseRejectsGarbage) {
    EXPECT_THROW(Color::parse(""), RenderConfigError);
    EXPECT_THROW(Color::parse("ffff00"), RenderConfigError);
    EXPECT_THROW(Color::parse("#ffff0"), RenderConfigError);
    EXPECT_THROW(Color::parse("#gggggg"), RenderConfigError);
    EXPECT_THROW(Color::parse("yellow"), RenderConfigError);
}

TEST(RasterCanvasTest, BackgroundAndPixels) {
    Color bg{10, 20, 30};
    RasterCanvas canvas(8, 4, bg);
    EXPECT_EQ(canvas.width(), 8);
    EXPECT_EQ(canvas.height(), 4);
    EXPECT_EQ(canvas.pixel(7, 3), bg);

    canvas.set_pixel(2, 1, Color{255, 0, 0});
    EXPECT_EQ(canvas.pixel(2, 1), (Color{255, 0, 0}));

    // Out of bounds writes are clipped.
    canvas.set_pixel(-1, 0, Color{1, 1, 1});
    canvas.set_pixel(8, 4, Color{1, 1, 1});
    EXPECT_EQ(canvas.pixel(0, 0), bg);
}

TEST(RasterCanvasTest, BlendExtremes) {
    RasterCanvas canvas(2, 2, Color{0, 0, 0});
    canvas.blend_pixel(0, 0, Color{200, 100, 50}, 255);
    canvas.blend_pixel(1, 0, Color{200, 100, 50}, 0);
    EXPECT_EQ(canvas.pixel(0, 0), (Color{200, 100, 50}));
    EXPECT_EQ(canvas.pixel(1, 0), (Color{0, 0, 0}));
}

TEST(RasterCanvasTest, LinesAndRects) {
    Color ink{0, 0, 255};
    RasterCanvas canvas(10, 10, Color{255, 255, 255});
    canvas.draw_line(0, 5, 9, 5, ink);
    for (int x = 0; x < 10; ++x) {
        EXPECT_EQ(canvas.pixel(x, 5), ink) << "x=" << x;
    }

    canvas.draw_rect(0, 0, 9, 9, ink);
    EXPECT_EQ(canvas.pixel(0, 0), ink);
    EXPECT_EQ(canvas.pixel(9, 9), ink);
    EXPECT_EQ(canvas.pixel(0, 9), ink);
    EXPECT_EQ(canvas.pixel(3, 3), (Color{255, 255, 255}));
}

TEST(RasterCanvasTest, RejectsEmptyCanvas) {
    EXPECT_THROW(RasterCanvas(0, 10, Color{}), RenderConfigError);
    EXPECT_THROW(RasterCanvas(10, -1, Color{}), RenderConfigError);
}

TEST(RasterCanvasTest, EncodesPng) {
    RasterCanvas canvas(16, 9, Color{255, 255, 0});
    std::vector<uint8_t> png = canvas.encode_png();

    const uint8_t signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    ASSERT_GT(png.size(), 33u);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(png[i], signature[i]);
    }
    // IHDR width and height, big endian.
    EXPECT_EQ(png[19], 16);
    EXPECT_EQ(png[23], 9);
}
