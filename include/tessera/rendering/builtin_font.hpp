// Tessera Rendering Core
// builtin_font.hpp - Default 8x16 glyph sheet

#pragma once

#include "sprite_sheet.hpp"

#include <cstdint>

namespace tessera::rendering {

// 256 glyphs indexed by character code; glyph 0 is blank, 32-126 are ASCII,
// 219 is a solid block (CP437 position). Other codes are blank.
class BuiltinFont {
public:
    static constexpr uint32_t GLYPH_WIDTH = 8;
    static constexpr uint32_t GLYPH_HEIGHT = 16;
    static constexpr uint32_t GLYPH_COUNT = 256;
    static constexpr uint32_t SOLID_BLOCK = 219;

    // ink_value is written for set pixels: 1 suits direct color mode, a
    // palette index (1-15) suits palette mode
    [[nodiscard]] static SpriteSheet create_sheet(uint8_t ink_value = 1);

private:
    BuiltinFont() = delete;
};

}  // namespace tessera::rendering
