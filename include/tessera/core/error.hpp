// Tessera Core
// error.hpp - Error kinds surfaced by the rendering core

#pragma once

#include <cstdint>

namespace tessera::core {

enum class RenderError : uint8_t {
    None,
    OutOfBounds,             // Grid access outside [0, width) x [0, height)
    ResourceCreationFailed,  // GPU buffer/texture/pipeline creation or submission failed
    MissingBinding,          // Required shader binding absent at setup or before a draw
    InvalidGlyphIndex,       // Glyph outside the atlas; remapped, never propagated
};

[[nodiscard]] constexpr const char* render_error_name(RenderError error) {
    switch (error) {
        case RenderError::None:
            return "None";
        case RenderError::OutOfBounds:
            return "OutOfBounds";
        case RenderError::ResourceCreationFailed:
            return "ResourceCreationFailed";
        case RenderError::MissingBinding:
            return "MissingBinding";
        case RenderError::InvalidGlyphIndex:
            return "InvalidGlyphIndex";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool succeeded(RenderError error) {
    return error == RenderError::None;
}

}  // namespace tessera::core
