#include "raster_canvas.hpp"
#include "captcha_errors.hpp"

#include <png.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace captcha {

namespace {

constexpr double kPi = 3.14159265358979323846;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

void append_png_data(png_structp png, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

}

Color Color::parse(const std::string& hex) {
    if (hex.empty() || hex[0] != '#' || (hex.size() != 7 && hex.size() != 4)) {
        throw RenderConfigError("invalid color '" + hex + "', expected #rrggbb");
    }

    int digits[6];
    for (size_t i = 1; i < hex.size(); ++i) {
        digits[i - 1] = hex_value(hex[i]);
        if (digits[i - 1] < 0) {
            throw RenderConfigError("invalid color '" + hex + "', expected #rrggbb");
        }
    }

    Color c;
    if (hex.size() == 4) {
        c.r = static_cast<uint8_t>(digits[0] * 17);
        c.g = static_cast<uint8_t>(digits[1] * 17);
        c.b = static_cast<uint8_t>(digits[2] * 17);
    } else {
        c.r = static_cast<uint8_t>(digits[0] * 16 + digits[1]);
        c.g = static_cast<uint8_t>(digits[2] * 16 + digits[3]);
        c.b = static_cast<uint8_t>(digits[4] * 16 + digits[5]);
    }
    return c;
}

RasterCanvas::RasterCanvas(int width, int height, Color background)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw RenderConfigError("canvas dimensions must be positive");
    }
    pixels_.resize(static_cast<size_t>(width) * height * 3);
    for (size_t i = 0; i < pixels_.size(); i += 3) {
        pixels_[i] = background.r;
        pixels_[i + 1] = background.g;
        pixels_[i + 2] = background.b;
    }
}

Color RasterCanvas::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return Color{};
    size_t i = (static_cast<size_t>(y) * width_ + x) * 3;
    return Color{pixels_[i], pixels_[i + 1], pixels_[i + 2]};
}

void RasterCanvas::set_pixel(int x, int y, Color c) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    size_t i = (static_cast<size_t>(y) * width_ + x) * 3;
    pixels_[i] = c.r;
    pixels_[i + 1] = c.g;
    pixels_[i + 2] = c.b;
}

void RasterCanvas::blend_pixel(int x, int y, Color c, uint8_t alpha) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_ || alpha == 0) return;
    size_t i = (static_cast<size_t>(y) * width_ + x) * 3;
    auto mix = [alpha](uint8_t dst, uint8_t src) {
        return static_cast<uint8_t>((src * alpha + dst * (255 - alpha)) / 255);
    };
    pixels_[i] = mix(pixels_[i], c.r);
    pixels_[i + 1] = mix(pixels_[i + 1], c.g);
    pixels_[i + 2] = mix(pixels_[i + 2], c.b);
}

void RasterCanvas::fill_rect(int x, int y, int w, int h, Color c) {
    for (int yy = y; yy < y + h; ++yy)
        for (int xx = x; xx < x + w; ++xx)
            set_pixel(xx, yy, c);
}

void RasterCanvas::plot(int x, int y, Color c, int thickness) {
    if (thickness <= 1) {
        set_pixel(x, y, c);
        return;
    }
    int half = thickness / 2;
    fill_rect(x - half, y - half, thickness, thickness, c);
}

// Bresenham
void RasterCanvas::draw_line(int x0, int y0, int x1, int y1, Color c, int thickness) {
    int dx = std::abs(x1 - x0), sx = x0 < x1 ? 1 : -1;
    int dy = -std::abs(y1 - y0), sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;

    while (true) {
        plot(x0, y0, c, thickness);
        if (x0 == x1 && y0 == y1) break;
        int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
}

void RasterCanvas::draw_rect(int x0, int y0, int x1, int y1, Color c, int thickness) {
    draw_line(x0, y0, x1, y0, c, thickness);
    draw_line(x1, y0, x1, y1, c, thickness);
    draw_line(x1, y1, x0, y1, c, thickness);
    draw_line(x0, y1, x0, y0, c, thickness);
}

void RasterCanvas::draw_ellipse(int cx, int cy, int rx, int ry, Color c, int thickness) {
    if (rx <= 0 || ry <= 0) return;
    const int steps = std::max(16, 8 * std::max(rx, ry));
    const double step = 2.0 * kPi / steps;
    for (int i = 0; i < steps; ++i) {
        double t = i * step;
        int x = cx + static_cast<int>(std::lround(rx * std::cos(t)));
        int y = cy + static_cast<int>(std::lround(ry * std::sin(t)));
        plot(x, y, c, thickness);
    }
}

std::vector<uint8_t> RasterCanvas::encode_png() const {
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        throw std::runtime_error("png_create_write_struct failed");
    }
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        throw std::runtime_error("png_create_info_struct failed");
    }

    std::vector<uint8_t> out;
    std::vector<png_bytep> rows(height_);
    for (int y = 0; y < height_; ++y) {
        rows[y] = const_cast<png_bytep>(&pixels_[static_cast<size_t>(y) * width_ * 3]);
    }

    // libpng reports errors by longjmp back here.
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("PNG encoding failed");
    }

    png_set_write_fn(png, &out, append_png_data, nullptr);
    png_set_IHDR(png, info, width_, height_, 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    return out;
}

}
