// Tessera Rendering Tests
// color_test.cpp - Color conversion and palette tests

#include <gtest/gtest.h>

#include <array>
#include <tessera/rendering/color.hpp>

namespace tessera::rendering::test {

TEST(ColorTest, DefaultIsOpaqueBlack) {
    Color color;
    EXPECT_EQ(color, colors::BLACK);
    EXPECT_EQ(color.a, 255);
}

TEST(ColorTest, PackMatchesRgba8MemoryOrder) {
    Color color(0x11, 0x22, 0x33, 0x44);
    EXPECT_EQ(color.pack_rgba8(), 0x44332211u);
    EXPECT_EQ(Color::unpack_rgba8(0x44332211u), color);
}

TEST(ColorTest, HsvPrimaries) {
    EXPECT_EQ(Color::from_hsv(0.0f, 1.0f, 1.0f), Color(255, 0, 0));
    EXPECT_EQ(Color::from_hsv(120.0f, 1.0f, 1.0f), Color(0, 255, 0));
    EXPECT_EQ(Color::from_hsv(240.0f, 1.0f, 1.0f), Color(0, 0, 255));
    EXPECT_EQ(Color::from_hsv(360.0f, 1.0f, 1.0f), Color(255, 0, 0));
    EXPECT_EQ(Color::from_hsv(-120.0f, 1.0f, 1.0f), Color(0, 0, 255));
}

TEST(ColorTest, HsvClampsSaturationAndValue) {
    EXPECT_EQ(Color::from_hsv(0.0f, 2.0f, 5.0f), Color(255, 0, 0));
    EXPECT_EQ(Color::from_hsv(0.0f, 0.0f, 0.0f), colors::BLACK);
    EXPECT_EQ(Color::from_hsv(77.0f, 0.0f, 1.0f), colors::WHITE);
}

TEST(ColorTest, HslPrimaries) {
    EXPECT_EQ(Color::from_hsl(0.0f, 1.0f, 0.5f), Color(255, 0, 0));
    EXPECT_EQ(Color::from_hsl(240.0f, 1.0f, 0.5f), Color(0, 0, 255));
    EXPECT_EQ(Color::from_hsl(0.0f, 1.0f, 1.0f), colors::WHITE);
    EXPECT_EQ(Color::from_hsl(0.0f, 1.0f, 0.0f), colors::BLACK);
}

TEST(ColorTest, HwbNormalizesExcessWhitenessAndBlackness) {
    EXPECT_EQ(Color::from_hwb(0.0f, 0.0f, 0.0f), Color(255, 0, 0));
    EXPECT_EQ(Color::from_hwb(0.0f, 0.0f, 1.0f), colors::BLACK);
    EXPECT_EQ(Color::from_hwb(200.0f, 0.6f, 0.6f), Color(127, 127, 127));
}

TEST(ColorTest, HexStrings) {
    EXPECT_EQ(Color::from_hex_string("#ff8000"), Color(255, 128, 0, 255));
    EXPECT_EQ(Color::from_hex_string("1a0000ff"), Color(0x1a, 0, 0, 0xff));
    EXPECT_EQ(Color::from_hex_string("#FFFFFF80"), Color(255, 255, 255, 128));
    EXPECT_FALSE(Color::from_hex_string("#fff").has_value());
    EXPECT_FALSE(Color::from_hex_string("#gg0000").has_value());
    EXPECT_FALSE(Color::from_hex_string("").has_value());
}

TEST(ColorTest, ToHsvRecoversHue) {
    glm::vec3 hsv = Color(0, 255, 0).to_hsv();
    EXPECT_FLOAT_EQ(hsv.x, 120.0f);
    EXPECT_FLOAT_EQ(hsv.y, 1.0f);
    EXPECT_FLOAT_EQ(hsv.z, 1.0f);

    EXPECT_EQ(colors::BLACK.to_hsv(), glm::vec3(0.0f));
}

TEST(PaletteTest, DefaultIsVgaTextPalette) {
    Palette palette;
    EXPECT_EQ(palette[0], colors::BLACK);
    EXPECT_EQ(palette[1], Color(0x00, 0x00, 0xaa));
    EXPECT_EQ(palette[6], Color(0xaa, 0x55, 0x00));
    EXPECT_EQ(palette[15], colors::WHITE);
}

TEST(PaletteTest, SetReturnsModifiedCopy) {
    Palette base;
    Palette changed = base.set(3, Color(1, 2, 3)).set(99, colors::WHITE);

    EXPECT_EQ(changed[3], Color(1, 2, 3));
    EXPECT_EQ(base[3], Color(0x00, 0xaa, 0xaa));
    EXPECT_NE(base, changed);
}

TEST(PaletteTest, MonoFillsEveryEntry) {
    Palette palette = Palette::mono(Color(9, 8, 7));
    for (const Color& color : palette.get_colors()) {
        EXPECT_EQ(color, Color(9, 8, 7));
    }
}

TEST(PaletteTest, WriteRgba8ForcesOpaqueAlpha) {
    Palette palette = Palette::mono(Color(10, 20, 30, 0));
    std::array<uint8_t, Palette::SIZE * 4> texels{};
    palette.write_rgba8(texels.data());

    for (size_t i = 0; i < Palette::SIZE; ++i) {
        EXPECT_EQ(texels[i * 4 + 0], 10);
        EXPECT_EQ(texels[i * 4 + 1], 20);
        EXPECT_EQ(texels[i * 4 + 2], 30);
        EXPECT_EQ(texels[i * 4 + 3], 255);
    }
}

}  // namespace tessera::rendering::test
