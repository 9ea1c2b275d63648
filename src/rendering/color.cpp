// Tessera Rendering Core
// color.cpp - Color conversion and palette implementation

#include <algorithm>
#include <cmath>
#include <tessera/rendering/color.hpp>

namespace tessera::rendering {

namespace {

// Shared tail of the HSV/HSL conversions: pick the channel order from the hue sextant
Color from_chroma(float hh, float chroma, float x, float m) {
    auto i = static_cast<uint8_t>((chroma + m) * 255.0f);
    auto j = static_cast<uint8_t>((x + m) * 255.0f);
    auto k = static_cast<uint8_t>(m * 255.0f);

    switch (static_cast<int>(hh)) {
        case 0:
            return Color(i, j, k);
        case 1:
            return Color(j, i, k);
        case 2:
            return Color(k, i, j);
        case 3:
            return Color(k, j, i);
        case 4:
            return Color(j, k, i);
        default:
            return Color(i, k, j);
    }
}

float hue_sextant(float h) {
    float wrapped = std::fmod(h, 360.0f);
    if (h < 0.0f) {
        wrapped += 360.0f;
    }
    return wrapped / 60.0f;
}

std::optional<uint8_t> parse_hex_byte(std::string_view text) {
    uint32_t value = 0;
    for (char c : text) {
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return static_cast<uint8_t>(value);
}

}  // namespace

// ============================================================================
// Color
// ============================================================================

Color Color::from_hsv(float h, float s, float v) {
    float hh = hue_sextant(h);
    float ss = std::clamp(s, 0.0f, 1.0f);
    float vv = std::clamp(v, 0.0f, 1.0f);

    float chroma = vv * ss;
    float x = chroma * (1.0f - std::abs(std::fmod(hh, 2.0f) - 1.0f));
    float m = vv - chroma;
    return from_chroma(hh, chroma, x, m);
}

Color Color::from_hsl(float h, float s, float l) {
    float hh = hue_sextant(h);
    float ss = std::clamp(s, 0.0f, 1.0f);
    float ll = std::clamp(l, 0.0f, 1.0f);

    float chroma = (1.0f - std::abs(2.0f * ll - 1.0f)) * ss;
    float x = chroma * (1.0f - std::abs(std::fmod(hh, 2.0f) - 1.0f));
    float m = ll - chroma / 2.0f;
    return from_chroma(hh, chroma, x, m);
}

Color Color::from_hwb(float h, float w, float b) {
    float ww = std::max(w, 0.0f);
    float bb = std::max(b, 0.0f);
    if (ww + bb > 1.0f) {
        float total = ww + bb;
        ww /= total;
        bb /= total;
    }
    // Pure gray when bb == 1 (value 0), saturation is then irrelevant
    float saturation = bb < 1.0f ? 1.0f - ww / (1.0f - bb) : 0.0f;
    return from_hsv(h, saturation, 1.0f - bb);
}

std::optional<Color> Color::from_hex_string(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6 && text.size() != 8) {
        return std::nullopt;
    }

    auto red = parse_hex_byte(text.substr(0, 2));
    auto green = parse_hex_byte(text.substr(2, 2));
    auto blue = parse_hex_byte(text.substr(4, 2));
    auto alpha = text.size() == 8 ? parse_hex_byte(text.substr(6, 2)) : std::optional<uint8_t>(255);
    if (!red || !green || !blue || !alpha) {
        return std::nullopt;
    }
    return Color(*red, *green, *blue, *alpha);
}

glm::vec3 Color::to_hsv() const {
    if (r == 0 && g == 0 && b == 0) {
        return glm::vec3(0.0f);
    }

    float rf = static_cast<float>(r) / 255.0f;
    float gf = static_cast<float>(g) / 255.0f;
    float bf = static_cast<float>(b) / 255.0f;
    float min = std::min({rf, gf, bf});
    float max = std::max({rf, gf, bf});
    float delta = max - min;

    float h = 0.0f;
    if (delta == 0.0f) {
        h = 0.0f;
    } else if (rf == max) {
        h = (gf - bf) / delta;
    } else if (gf == max) {
        h = 2.0f + (bf - rf) / delta;
    } else {
        h = 4.0f + (rf - gf) / delta;
    }

    float hue = std::fmod(h * 60.0f, 360.0f);
    if (hue < 0.0f) {
        hue += 360.0f;
    }
    return glm::vec3(hue, delta / max, max);
}

// ============================================================================
// Palette
// ============================================================================

Palette::Palette()
    : colors_{{
          {0x00, 0x00, 0x00},
          {0x00, 0x00, 0xaa},
          {0x00, 0xaa, 0x00},
          {0x00, 0xaa, 0xaa},
          {0xaa, 0x00, 0x00},
          {0xaa, 0x00, 0xaa},
          {0xaa, 0x55, 0x00},
          {0xaa, 0xaa, 0xaa},
          {0x55, 0x55, 0x55},
          {0x55, 0x55, 0xff},
          {0x55, 0xff, 0x55},
          {0x55, 0xff, 0xff},
          {0xff, 0x55, 0x55},
          {0xff, 0x55, 0xff},
          {0xff, 0xff, 0x55},
          {0xff, 0xff, 0xff},
      }} {}

Palette Palette::mono(Color color) {
    Palette palette;
    palette.colors_.fill(color);
    return palette;
}

Palette Palette::set(size_t index, Color color) const {
    Palette copy = *this;
    if (index < SIZE) {
        copy.colors_[index] = color;
    }
    return copy;
}

void Palette::write_rgba8(uint8_t* out) const {
    for (const Color& color : colors_) {
        *out++ = color.r;
        *out++ = color.g;
        *out++ = color.b;
        *out++ = 255;
    }
}

}  // namespace tessera::rendering
