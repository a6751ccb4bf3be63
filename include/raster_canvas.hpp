#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace captcha {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    /**
     * Parses "#rrggbb" or "#rgb" (case-insensitive).
     * @throws RenderConfigError on any other form.
     */
    static Color parse(const std::string& hex);

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// 8-bit RGB pixel buffer with the drawing primitives the renderer needs.
// Coordinates outside the canvas are clipped silently.
class RasterCanvas {
public:
    RasterCanvas(int width, int height, Color background);

    int width() const { return width_; }
    int height() const { return height_; }

    Color pixel(int x, int y) const;
    void set_pixel(int x, int y, Color c);
    // Mixes c over the existing pixel with coverage alpha (0 = none, 255 = opaque).
    void blend_pixel(int x, int y, Color c, uint8_t alpha);

    void fill_rect(int x, int y, int w, int h, Color c);
    void draw_line(int x0, int y0, int x1, int y1, Color c, int thickness = 1);
    void draw_rect(int x0, int y0, int x1, int y1, Color c, int thickness = 1);
    void draw_ellipse(int cx, int cy, int rx, int ry, Color c, int thickness = 1);

    // Encodes the canvas as an 8-bit RGB PNG.
    std::vector<uint8_t> encode_png() const;

private:
    void plot(int x, int y, Color c, int thickness);

    int width_;
    int height_;
    std::vector<uint8_t> pixels_;
};

}
