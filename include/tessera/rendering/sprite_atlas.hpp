// Tessera Rendering Core
// sprite_atlas.hpp - Immutable GPU glyph atlas

#pragma once

#include "sprite_sheet.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <tessera/graphics/device.hpp>
#include <tessera/graphics/sampler.hpp>
#include <tessera/graphics/texture.hpp>

namespace tessera::rendering {

// How the cell pass turns an atlas texel into a color; fixed when the atlas is loaded
enum class ColorMode : uint8_t {
    Direct,   // Texel != 0 selects the cell foreground, 0 the background
    Palette,  // Texel is an index into the cell's 16-color palette
};

[[nodiscard]] const char* color_mode_name(ColorMode mode);

// Tile arithmetic shared by the atlas and the instance builder
struct AtlasLayout {
    uint32_t columns = 1;
    uint32_t rows = 1;
    glm::uvec2 cell_pixel_size{8, 16};
    glm::uvec2 texture_size{8, 16};

    [[nodiscard]] static AtlasLayout from_sheet(const SpriteSheet& sheet);

    [[nodiscard]] uint32_t cell_count() const { return columns * rows; }
    [[nodiscard]] bool contains(uint32_t glyph_index) const { return glyph_index < cell_count(); }

    // (column, row) of a glyph; caller guarantees contains(glyph_index)
    [[nodiscard]] glm::uvec2 tile_for(uint32_t glyph_index) const {
        return glm::uvec2(glyph_index % columns, glyph_index / columns);
    }

    // Top-left UV of a glyph's tile, in [0, 1)
    [[nodiscard]] glm::vec2 uv_base(uint32_t glyph_index) const {
        glm::uvec2 tile = tile_for(glyph_index);
        return glm::vec2(static_cast<float>(tile.x) / static_cast<float>(columns),
                         static_cast<float>(tile.y) / static_cast<float>(rows));
    }

    bool operator==(const AtlasLayout& other) const = default;
};

// R8Uint texture + nearest/clamp sampler. Never modified after initialize(),
// so it can be shared by every frame in flight without synchronization.
class SpriteAtlas {
public:
    SpriteAtlas();
    ~SpriteAtlas();

    // Non-copyable
    SpriteAtlas(const SpriteAtlas&) = delete;
    SpriteAtlas& operator=(const SpriteAtlas&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    bool initialize(graphics::GraphicsDevice* device, const SpriteSheet& sheet, ColorMode mode);
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return texture_ != nullptr; }

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] const AtlasLayout& get_layout() const { return layout_; }
    [[nodiscard]] ColorMode get_color_mode() const { return color_mode_; }
    [[nodiscard]] bool uses_palette() const { return color_mode_ == ColorMode::Palette; }

    [[nodiscard]] graphics::Texture* get_texture() const { return texture_.get(); }
    [[nodiscard]] graphics::Sampler* get_sampler() const { return sampler_.get(); }

private:
    AtlasLayout layout_;
    ColorMode color_mode_ = ColorMode::Direct;

    std::unique_ptr<graphics::Texture> texture_;
    std::unique_ptr<graphics::Sampler> sampler_;

    bool upload(graphics::GraphicsDevice* device, const SpriteSheet& sheet);
};

}  // namespace tessera::rendering
