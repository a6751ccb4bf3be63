#pragma once

#include <array>
#include <cstdint>

namespace captcha {

// Built-in 5x7 font covering [A-Za-z0-9], used by the "normal" draw method.
// Each glyph row holds 5 bits, bit 4 being the leftmost column.
class BitmapFont {
public:
    static constexpr int GLYPH_WIDTH = 5;
    static constexpr int GLYPH_HEIGHT = 7;

    using Glyph = std::array<uint8_t, GLYPH_HEIGHT>;

    // Returns nullptr for characters without a glyph.
    static const Glyph* glyph(char c);

    static bool has_glyph(char c) { return glyph(c) != nullptr; }
};

}
