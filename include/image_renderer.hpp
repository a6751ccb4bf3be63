#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "captcha_config.hpp"
#include "raster_canvas.hpp"

namespace captcha {

struct RenderedImage {
    std::vector<uint8_t> data;
    std::string mime_type;
};

// Rendering backend seam: given text and style knobs, produce raster bytes and a mime type.
// Implementations must be safe to call concurrently.
class ImageRenderer {
public:
    virtual ~ImageRenderer() = default;

    /**
     * Renders text with the image/create/particle options carried by config.
     * @throws RenderConfigError if the options are structurally invalid.
     */
    virtual RenderedImage render(const std::string& text, const ChallengeConfig& config) const = 0;

    // Checks the options without drawing. Throws RenderConfigError.
    virtual void validate(const ChallengeConfig& config) const = 0;
};

// Fully resolved options for RasterRenderer.
struct RenderSettings {
    enum class Method { NORMAL, TTF };
    enum class Style { DEFAULT, RECT, BOX, CIRCLE, ELLIPSE, EC, BLANK };

    // image options
    int width = 0;
    int height = 0;
    int ptsize = 18;
    int lines = 10;
    int thickness = 1;
    bool frame = true;
    double angle = 0.0;
    std::string font;
    Color background{255, 255, 255};

    // create options
    Method method = Method::NORMAL;
    Style style = Style::DEFAULT;
    Color text_color{0, 0, 0};
    Color line_color{0x6e, 0x6e, 0x6e};

    // particle options
    int density = 0;
    int maxdots = 1;
};

// Built-in renderer: FreeType for TrueType glyphs, a 5x7 bitmap font for the
// "normal" method, libpng for encoding.
class RasterRenderer : public ImageRenderer {
public:
    static constexpr int MAX_DIMENSION = 2000;
    static constexpr const char* MIME_TYPE = "image/png";

    RenderedImage render(const std::string& text, const ChallengeConfig& config) const override;
    void validate(const ChallengeConfig& config) const override;

    // Parses and range-checks every option. Throws RenderConfigError.
    static RenderSettings parse_settings(const ChallengeConfig& config);

private:
    static void draw_style(RasterCanvas& canvas, const RenderSettings& s, std::mt19937& rng);
    static void draw_bitmap_text(RasterCanvas& canvas, const std::string& text, const RenderSettings& s, std::mt19937& rng);
    static void draw_truetype_text(RasterCanvas& canvas, const std::string& text, const RenderSettings& s, std::mt19937& rng);
    static void draw_particles(RasterCanvas& canvas, const RenderSettings& s, std::mt19937& rng);
};

}
