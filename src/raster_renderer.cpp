#include "image_renderer.hpp"
#include "bitmap_font.hpp"
#include "captcha_errors.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace json = boost::json;

namespace captcha {

namespace {

constexpr double kPi = 3.14159265358979323846;

const std::set<std::string> kImageKeys = {
    "width", "height", "ptsize", "lines", "font", "bgcolor",
    "thickness", "frame", "angle",
    "rndmax", "rnd_data"  // consumed by the challenge generator
};

int read_int(const json::object& obj, const char* key, int def, int min, int max) {
    const json::value* v = obj.if_contains(key);
    if (!v) return def;
    if (!v->is_int64() && !v->is_uint64()) {
        throw RenderConfigError(std::string("image option '") + key + "' must be an integer");
    }
    auto n = v->to_number<long long>();
    if (n < min || n > max) {
        throw RenderConfigError(std::string("image option '") + key + "' must be between " +
                                std::to_string(min) + " and " + std::to_string(max));
    }
    return static_cast<int>(n);
}

int required_int(const json::object& obj, const char* key, int min, int max) {
    if (!obj.contains(key)) {
        throw RenderConfigError(std::string("image option '") + key + "' is required");
    }
    return read_int(obj, key, 0, min, max);
}

std::string read_string(const json::value& v, const std::string& what) {
    if (!v.is_string()) {
        throw RenderConfigError(what + " must be a string");
    }
    return std::string(v.as_string());
}

int read_particle(const json::value& v, const char* what, int min, int max) {
    if (!v.is_int64() && !v.is_uint64()) {
        throw RenderConfigError(std::string("particle option '") + what + "' must be an integer");
    }
    auto n = v.to_number<long long>();
    if (n < min || n > max) {
        throw RenderConfigError(std::string("particle option '") + what + "' must be between " +
                                std::to_string(min) + " and " + std::to_string(max));
    }
    return static_cast<int>(n);
}

RenderSettings::Method parse_method(const std::string& name) {
    if (name == "normal") return RenderSettings::Method::NORMAL;
    if (name == "ttf") return RenderSettings::Method::TTF;
    throw RenderConfigError("unknown draw method '" + name + "' (expected normal or ttf)");
}

RenderSettings::Style parse_style(const std::string& name) {
    if (name == "default") return RenderSettings::Style::DEFAULT;
    if (name == "rect") return RenderSettings::Style::RECT;
    if (name == "box") return RenderSettings::Style::BOX;
    if (name == "circle") return RenderSettings::Style::CIRCLE;
    if (name == "ellipse") return RenderSettings::Style::ELLIPSE;
    if (name == "ec") return RenderSettings::Style::EC;
    if (name == "blank") return RenderSettings::Style::BLANK;
    throw RenderConfigError("unknown style '" + name + "'");
}

// Owns a FreeType library and one face sized to ptsize.
class FreeTypeFace {
public:
    FreeTypeFace(const std::string& path, int ptsize) {
        if (FT_Init_FreeType(&library_)) {
            throw std::runtime_error("FreeType initialisation failed");
        }
        if (FT_New_Face(library_, path.c_str(), 0, &face_)) {
            FT_Done_FreeType(library_);
            throw RenderConfigError("cannot load font '" + path + "'");
        }
        if (FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(ptsize))) {
            FT_Done_Face(face_);
            FT_Done_FreeType(library_);
            throw RenderConfigError("font '" + path + "' cannot be scaled to the requested ptsize");
        }
    }

    ~FreeTypeFace() {
        FT_Done_Face(face_);
        FT_Done_FreeType(library_);
    }

    FreeTypeFace(const FreeTypeFace&) = delete;
    FreeTypeFace& operator=(const FreeTypeFace&) = delete;

    FT_Face get() const { return face_; }

private:
    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
};

}

RenderSettings RasterRenderer::parse_settings(const ChallengeConfig& config) {
    const json::object& image = config.image();
    RenderSettings s;

    for (const auto& entry : image) {
        std::string key(entry.key());
        if (!kImageKeys.count(key)) {
            throw RenderConfigError("unknown image option '" + key + "'");
        }
    }

    s.width = required_int(image, "width", 1, MAX_DIMENSION);
    s.height = required_int(image, "height", 1, MAX_DIMENSION);
    s.ptsize = read_int(image, "ptsize", s.ptsize, 1, 200);
    s.lines = read_int(image, "lines", s.lines, 0, 1000);
    s.thickness = read_int(image, "thickness", s.thickness, 1, 10);

    if (const json::value* v = image.if_contains("bgcolor")) {
        s.background = Color::parse(read_string(*v, "image option 'bgcolor'"));
    }
    if (const json::value* v = image.if_contains("font")) {
        s.font = read_string(*v, "image option 'font'");
    }
    if (const json::value* v = image.if_contains("frame")) {
        if (!v->is_bool()) {
            throw RenderConfigError("image option 'frame' must be a bool");
        }
        s.frame = v->as_bool();
    }
    if (const json::value* v = image.if_contains("angle")) {
        if (!v->is_number()) {
            throw RenderConfigError("image option 'angle' must be a number");
        }
        s.angle = v->to_number<double>();
        if (s.angle < 0.0 || s.angle > 90.0) {
            throw RenderConfigError("image option 'angle' must be between 0 and 90");
        }
    }

    // create options: [method, style, text_color, line_color]
    const json::array& create = config.create_options();
    if (create.size() > 4) {
        throw RenderConfigError("renderCreateOptions takes at most 4 entries (method, style, text color, line color)");
    }
    if (create.size() > 0) s.method = parse_method(read_string(create[0], "create option 'method'"));
    if (create.size() > 1) s.style = parse_style(read_string(create[1], "create option 'style'"));
    if (create.size() > 2) s.text_color = Color::parse(read_string(create[2], "create option 'text_color'"));
    if (create.size() > 3) s.line_color = Color::parse(read_string(create[3], "create option 'line_color'"));

    if (s.method == RenderSettings::Method::TTF && s.font.empty()) {
        throw RenderConfigError("the ttf method requires the image option 'font'");
    }
    if (s.method == RenderSettings::Method::NORMAL) {
        for (char c : config.charset()) {
            if (!BitmapFont::has_glyph(c)) {
                throw RenderConfigError("the normal method has no glyph for a character in 'rnd_data'");
            }
        }
    }

    // particle options: [density, maxdots]
    const json::array& particles = config.particle_options();
    if (particles.size() > 2) {
        throw RenderConfigError("particleOptions takes at most 2 entries (density, maxdots)");
    }
    s.density = particles.size() > 0
        ? read_particle(particles[0], "density", 0, 1000000)
        : (s.width * s.height) / 20;
    if (particles.size() > 1) s.maxdots = read_particle(particles[1], "maxdots", 1, 50);

    return s;
}

void RasterRenderer::validate(const ChallengeConfig& config) const {
    RenderSettings s = parse_settings(config);
    if (s.method == RenderSettings::Method::TTF) {
        FreeTypeFace face(s.font, s.ptsize);
    }
}

RenderedImage RasterRenderer::render(const std::string& text, const ChallengeConfig& config) const {
    RenderSettings s = parse_settings(config);

    std::random_device rd;
    std::mt19937 rng(rd());

    RasterCanvas canvas(s.width, s.height, s.background);

    draw_style(canvas, s, rng);
    if (s.method == RenderSettings::Method::TTF) {
        draw_truetype_text(canvas, text, s, rng);
    } else {
        draw_bitmap_text(canvas, text, s, rng);
    }
    draw_particles(canvas, s, rng);

    if (s.frame) {
        canvas.draw_rect(0, 0, s.width - 1, s.height - 1, s.line_color);
    }

    return RenderedImage{canvas.encode_png(), MIME_TYPE};
}

void RasterRenderer::draw_style(RasterCanvas& canvas, const RenderSettings& s, std::mt19937& rng) {
    const int w = canvas.width();
    const int h = canvas.height();
    const int n = s.lines;
    if (n == 0) return;

    auto circles = [&]() {
        int r_step = std::max(2, std::max(w, h) / (2 * n));
        for (int i = 1; i <= n; ++i)
            canvas.draw_ellipse(w / 2, h / 2, i * r_step, i * r_step, s.line_color, s.thickness);
    };
    auto ellipses = [&]() {
        for (int i = 1; i <= n; ++i)
            canvas.draw_ellipse(w / 2, h / 2, std::max(1, i * w / (2 * n)), std::max(1, i * h / (2 * n)),
                                s.line_color, s.thickness);
    };

    switch (s.style) {
        case RenderSettings::Style::DEFAULT: {
            std::uniform_int_distribution<int> left(0, std::max(0, w / 4));
            std::uniform_int_distribution<int> right(std::min(w - 1, 3 * w / 4), w - 1);
            std::uniform_int_distribution<int> any_y(0, h - 1);
            for (int i = 0; i < n; ++i)
                canvas.draw_line(left(rng), any_y(rng), right(rng), any_y(rng), s.line_color, s.thickness);
            break;
        }
        case RenderSettings::Style::RECT: {
            int step = std::max(2, w / (n + 1));
            for (int x = step; x < w; x += step)
                canvas.draw_line(x, 0, x, h - 1, s.line_color, s.thickness);
            for (int y = step; y < h; y += step)
                canvas.draw_line(0, y, w - 1, y, s.line_color, s.thickness);
            break;
        }
        case RenderSettings::Style::BOX: {
            int step = std::max(2, std::min(w, h) / (2 * (n + 1)));
            for (int i = 1; i <= n; ++i) {
                int inset = i * step;
                if (2 * inset >= std::min(w, h)) break;
                canvas.draw_rect(inset, inset, w - 1 - inset, h - 1 - inset, s.line_color, s.thickness);
            }
            break;
        }
        case RenderSettings::Style::CIRCLE:
            circles();
            break;
        case RenderSettings::Style::ELLIPSE:
            ellipses();
            break;
        case RenderSettings::Style::EC:
            ellipses();
            circles();
            break;
        case RenderSettings::Style::BLANK:
            break;
    }
}

void RasterRenderer::draw_bitmap_text(RasterCanvas& canvas, const std::string& text, const RenderSettings& s, std::mt19937& rng) {
    const int gw = BitmapFont::GLYPH_WIDTH;
    const int gh = BitmapFont::GLYPH_HEIGHT;
    const int n = static_cast<int>(text.size());
    if (n == 0) return;

    // Shrink until the string fits.
    int scale = std::max(1, (s.ptsize + 3) / gh);
    while (scale > 1 &&
           (n * (gw + 1) * scale - scale > canvas.width() - 4 || gh * scale > canvas.height() - 2)) {
        --scale;
    }

    const int total = n * (gw + 1) * scale - scale;
    int x = std::max(2, (canvas.width() - total) / 2);
    const int top = std::max(0, (canvas.height() - gh * scale) / 2);
    const int max_jitter = std::max(0, std::min(2 * scale, top - 1));
    std::uniform_int_distribution<int> jitter(-max_jitter, max_jitter);

    for (char c : text) {
        const BitmapFont::Glyph* glyph = BitmapFont::glyph(c);
        if (!glyph) {
            throw RenderConfigError("the normal method has no glyph for a challenge character");
        }

        int y = top + jitter(rng);
        for (int row = 0; row < gh; ++row) {
            for (int col = 0; col < gw; ++col) {
                if ((*glyph)[row] & (0x10 >> col)) {
                    canvas.fill_rect(x + col * scale, y + row * scale, scale, scale, s.text_color);
                }
            }
        }
        x += (gw + 1) * scale;
    }
}

void RasterRenderer::draw_truetype_text(RasterCanvas& canvas, const std::string& text, const RenderSettings& s, std::mt19937& rng) {
    FreeTypeFace ft(s.font, s.ptsize);
    FT_Face face = ft.get();

    int total = 0;
    for (char c : text) {
        if (FT_Load_Char(face, static_cast<unsigned char>(c), FT_LOAD_DEFAULT) == 0) {
            total += static_cast<int>(face->glyph->advance.x >> 6);
        }
    }

    const int ascender = static_cast<int>(face->size->metrics.ascender >> 6);
    const int descender = static_cast<int>(face->size->metrics.descender >> 6);
    const int baseline = (canvas.height() - (ascender - descender)) / 2 + ascender;
    int pen_x = std::max(2, (canvas.width() - total) / 2);

    std::uniform_real_distribution<double> rotation(-s.angle, s.angle);
    const int max_jitter = std::max(0, std::min(s.ptsize / 4, (canvas.height() - (ascender - descender)) / 2));
    std::uniform_int_distribution<int> jitter(-max_jitter, max_jitter);

    for (char c : text) {
        double rad = rotation(rng) * kPi / 180.0;
        FT_Matrix m;
        m.xx = static_cast<FT_Fixed>(std::cos(rad) * 0x10000L);
        m.xy = static_cast<FT_Fixed>(-std::sin(rad) * 0x10000L);
        m.yx = static_cast<FT_Fixed>(std::sin(rad) * 0x10000L);
        m.yy = static_cast<FT_Fixed>(std::cos(rad) * 0x10000L);
        FT_Vector origin{0, 0};
        FT_Set_Transform(face, &m, &origin);

        if (FT_Load_Char(face, static_cast<unsigned char>(c), FT_LOAD_RENDER)) {
            throw RenderConfigError("font '" + s.font + "' cannot render a challenge character");
        }

        FT_GlyphSlot slot = face->glyph;
        const FT_Bitmap& bmp = slot->bitmap;
        const int y_off = jitter(rng);

        for (unsigned row = 0; row < bmp.rows; ++row) {
            for (unsigned col = 0; col < bmp.width; ++col) {
                uint8_t alpha;
                if (bmp.pixel_mode == FT_PIXEL_MODE_MONO) {
                    const unsigned char byte = bmp.buffer[row * bmp.pitch + col / 8];
                    alpha = (byte & (0x80 >> (col % 8))) ? 255 : 0;
                } else {
                    alpha = bmp.buffer[row * bmp.pitch + col];
                }
                canvas.blend_pixel(pen_x + slot->bitmap_left + static_cast<int>(col),
                                   baseline - slot->bitmap_top + static_cast<int>(row) + y_off,
                                   s.text_color, alpha);
            }
        }
        pen_x += static_cast<int>(slot->advance.x >> 6);
    }

    FT_Set_Transform(face, nullptr, nullptr);
}

void RasterRenderer::draw_particles(RasterCanvas& canvas, const RenderSettings& s, std::mt19937& rng) {
    std::uniform_int_distribution<int> any_x(0, canvas.width() - 1);
    std::uniform_int_distribution<int> any_y(0, canvas.height() - 1);
    std::uniform_int_distribution<int> step(-1, 1);

    for (int i = 0; i < s.density; ++i) {
        int x = any_x(rng);
        int y = any_y(rng);
        for (int d = 0; d < s.maxdots; ++d) {
            canvas.set_pixel(x, y, s.line_color);
            x += step(rng);
            y += step(rng);
        }
    }
}

}
