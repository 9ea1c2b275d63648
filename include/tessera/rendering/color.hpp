// Tessera Rendering Core
// color.hpp - RGBA8 colors, color-space conversion and 16-entry palettes

#pragma once

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tessera::rendering {

// ============================================================================
// Color
// ============================================================================

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha = 255)
        : r(red), g(green), b(blue), a(alpha) {}

    // h in degrees (taken mod 360), s and v clamped to [0, 1]; alpha is opaque
    [[nodiscard]] static Color from_hsv(float h, float s, float v);

    // h in degrees (taken mod 360), s and l clamped to [0, 1]
    [[nodiscard]] static Color from_hsl(float h, float s, float l);

    // Whiteness/blackness above 1.0 in total are normalized into a gray
    [[nodiscard]] static Color from_hwb(float h, float w, float b);

    // "#rrggbb" or "#rrggbbaa" (leading '#' optional)
    [[nodiscard]] static std::optional<Color> from_hex_string(std::string_view text);

    // (hue degrees, saturation, value); alpha ignored
    [[nodiscard]] glm::vec3 to_hsv() const;

    // r | g << 8 | b << 16 | a << 24, the memory order of an RGBA8Unorm attribute
    [[nodiscard]] constexpr uint32_t pack_rgba8() const {
        return static_cast<uint32_t>(r) | (static_cast<uint32_t>(g) << 8) | (static_cast<uint32_t>(b) << 16) |
               (static_cast<uint32_t>(a) << 24);
    }

    [[nodiscard]] static constexpr Color unpack_rgba8(uint32_t packed) {
        return Color(static_cast<uint8_t>(packed & 0xFF), static_cast<uint8_t>((packed >> 8) & 0xFF),
                     static_cast<uint8_t>((packed >> 16) & 0xFF), static_cast<uint8_t>((packed >> 24) & 0xFF));
    }

    [[nodiscard]] glm::vec4 to_vec4() const {
        return glm::vec4(r, g, b, a) / 255.0f;
    }

    [[nodiscard]] constexpr Color with_alpha(uint8_t alpha) const { return Color(r, g, b, alpha); }

    constexpr bool operator==(const Color& other) const = default;
};

namespace colors {
inline constexpr Color BLACK{0, 0, 0, 255};
inline constexpr Color WHITE{255, 255, 255, 255};
inline constexpr Color TRANSPARENT_BLACK{0, 0, 0, 0};
}  // namespace colors

// ============================================================================
// Palette
// ============================================================================

// Sixteen colors addressed by a 4-bit index; the atlas texel in palette mode
class Palette {
public:
    static constexpr size_t SIZE = 16;

    // The 16-color VGA text-mode palette
    Palette();

    [[nodiscard]] static Palette mono(Color color);

    // Builder-style: Palette().set(1, colors::WHITE).set(2, ...)
    [[nodiscard]] Palette set(size_t index, Color color) const;

    [[nodiscard]] const Color& operator[](size_t index) const { return colors_[index]; }
    [[nodiscard]] Color& operator[](size_t index) { return colors_[index]; }

    [[nodiscard]] const std::array<Color, SIZE>& get_colors() const { return colors_; }

    // RGBA8 texels with alpha forced to 255, ready for a palette texture row
    void write_rgba8(uint8_t* out) const;

    bool operator==(const Palette& other) const = default;

private:
    std::array<Color, SIZE> colors_;
};

}  // namespace tessera::rendering
