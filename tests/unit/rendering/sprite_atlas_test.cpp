// Tessera Rendering Tests
// sprite_atlas_test.cpp - Sprite atlas layout and upload tests

#include <gtest/gtest.h>

#include "mock_graphics_device.hpp"

#include <tessera/rendering/builtin_font.hpp>
#include <set>
#include <tessera/rendering/sprite_atlas.hpp>
#include <utility>

namespace tessera::rendering::test {

using graphics::test::MockGraphicsDevice;
using graphics::test::MockTexture;

TEST(AtlasLayoutTest, UvBaseAddressesTiles) {
    AtlasLayout layout;
    layout.columns = 16;
    layout.rows = 16;
    layout.cell_pixel_size = {8, 16};
    layout.texture_size = {128, 256};

    EXPECT_EQ(layout.cell_count(), 256u);
    EXPECT_TRUE(layout.contains(255));
    EXPECT_FALSE(layout.contains(256));

    EXPECT_EQ(layout.uv_base(0), glm::vec2(0.0f, 0.0f));
    EXPECT_EQ(layout.tile_for(17), glm::uvec2(1, 1));
    EXPECT_FLOAT_EQ(layout.uv_base(17).x, 1.0f / 16.0f);
    EXPECT_FLOAT_EQ(layout.uv_base(17).y, 1.0f / 16.0f);
    EXPECT_FLOAT_EQ(layout.uv_base(255).x, 15.0f / 16.0f);
}

TEST(AtlasLayoutTest, EveryGlyphOfNonSquareAtlasStaysInBounds) {
    AtlasLayout layout;
    layout.columns = 16;
    layout.rows = 8;
    layout.texture_size = {128, 128};

    ASSERT_EQ(layout.cell_count(), 128u);
    std::set<std::pair<uint32_t, uint32_t>> seen;
    for (uint32_t glyph = 0; glyph < layout.cell_count(); ++glyph) {
        const glm::uvec2 tile = layout.tile_for(glyph);
        EXPECT_LT(tile.x, layout.columns) << "glyph " << glyph;
        EXPECT_LT(tile.y, layout.rows) << "glyph " << glyph;
        EXPECT_TRUE(seen.emplace(tile.x, tile.y).second) << "glyph " << glyph << " shares a tile";

        const glm::vec2 uv = layout.uv_base(glyph);
        EXPECT_FLOAT_EQ(uv.x, static_cast<float>(glyph % 16) / 16.0f) << "glyph " << glyph;
        EXPECT_FLOAT_EQ(uv.y, static_cast<float>(glyph / 16) / 8.0f) << "glyph " << glyph;
        EXPECT_LT(uv.y + 1.0f / 8.0f, 1.0f + 1e-6f) << "glyph " << glyph;
    }
    EXPECT_EQ(seen.size(), layout.cell_count());
    EXPECT_FALSE(layout.contains(128));
}

TEST(AtlasLayoutTest, FromSheet) {
    SpriteSheet sheet = BuiltinFont::create_sheet();
    AtlasLayout layout = AtlasLayout::from_sheet(sheet);
    EXPECT_EQ(layout.columns, 16u);
    EXPECT_EQ(layout.rows, 16u);
    EXPECT_EQ(layout.cell_pixel_size, glm::uvec2(8, 16));
    EXPECT_EQ(layout.texture_size, glm::uvec2(128, 256));
}

class SpriteAtlasTest : public ::testing::Test {
protected:
    MockGraphicsDevice device_;
    SpriteAtlas atlas_;
};

TEST_F(SpriteAtlasTest, UploadsSheetAsR8UintTexture) {
    SpriteSheet sheet = BuiltinFont::create_sheet();
    ASSERT_TRUE(atlas_.initialize(&device_, sheet, ColorMode::Direct));

    EXPECT_TRUE(atlas_.is_initialized());
    EXPECT_FALSE(atlas_.uses_palette());
    ASSERT_NE(atlas_.get_texture(), nullptr);
    ASSERT_NE(atlas_.get_sampler(), nullptr);
    EXPECT_EQ(atlas_.get_texture()->get_format(), graphics::TextureFormat::R8Uint);
    EXPECT_EQ(atlas_.get_texture()->get_width(), 128u);
    EXPECT_EQ(atlas_.get_sampler()->get_mag_filter(), graphics::FilterMode::Nearest);
    EXPECT_EQ(atlas_.get_sampler()->get_address_mode_u(), graphics::AddressMode::ClampToEdge);

    auto* texture = static_cast<MockTexture*>(atlas_.get_texture());
    EXPECT_EQ(texture->texels(), sheet.get_pixels());
    EXPECT_EQ(device_.submit_count, 1u);
    EXPECT_EQ(device_.live_buffers(), 0);  // Staging released
}

TEST_F(SpriteAtlasTest, PaletteModeIsRecorded) {
    ASSERT_TRUE(atlas_.initialize(&device_, BuiltinFont::create_sheet(15), ColorMode::Palette));
    EXPECT_TRUE(atlas_.uses_palette());
    EXPECT_STREQ(color_mode_name(atlas_.get_color_mode()), "palette");
}

TEST_F(SpriteAtlasTest, TextureFailureLeavesAtlasEmpty) {
    device_.fail_textures = true;
    EXPECT_FALSE(atlas_.initialize(&device_, BuiltinFont::create_sheet(), ColorMode::Direct));
    EXPECT_FALSE(atlas_.is_initialized());
    EXPECT_EQ(atlas_.get_sampler(), nullptr);
}

TEST_F(SpriteAtlasTest, ThrowingDeviceIsReported) {
    device_.throw_on_texture = true;
    EXPECT_FALSE(atlas_.initialize(&device_, BuiltinFont::create_sheet(), ColorMode::Direct));
    EXPECT_FALSE(atlas_.is_initialized());
}

TEST_F(SpriteAtlasTest, NullDeviceFails) {
    EXPECT_FALSE(atlas_.initialize(nullptr, BuiltinFont::create_sheet(), ColorMode::Direct));
}

}  // namespace tessera::rendering::test
