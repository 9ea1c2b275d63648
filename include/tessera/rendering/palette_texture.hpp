// Tessera Rendering Core
// palette_texture.hpp - Per-cell 16-color palette volume for palette color mode

#pragma once

#include "cell_grid.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <tessera/core/error.hpp>
#include <tessera/graphics/buffer.hpp>
#include <tessera/graphics/command_buffer.hpp>
#include <tessera/graphics/device.hpp>
#include <tessera/graphics/texture.hpp>
#include <vector>

namespace tessera::rendering {

// RGBA8Unorm 3D texture of 16 x grid_width x grid_height. Texel (i, x, y) is
// palette entry i of cell (x, y). Sized with the grid; rewritten when it changes.
class CellPaletteTexture {
public:
    CellPaletteTexture();
    ~CellPaletteTexture();

    // Non-copyable
    CellPaletteTexture(const CellPaletteTexture&) = delete;
    CellPaletteTexture& operator=(const CellPaletteTexture&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    bool initialize(graphics::GraphicsDevice* device, uint32_t frames_in_flight);
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return device_ != nullptr; }

    // Recreates the volume (and staging ring) for a new grid size. The caller
    // keeps any texture it replaces alive via release_previous().
    [[nodiscard]] core::RenderError resize(uint32_t grid_width, uint32_t grid_height);

    // The texture replaced by the last resize(), handed to the caller for deferred release
    [[nodiscard]] std::unique_ptr<graphics::Texture> release_previous() { return std::move(previous_); }

    // ========================================================================
    // Upload
    // ========================================================================

    // Flattens the grid palettes into the staging buffer for frame_index and records
    // the copy into cmd. The grid must match the current size.
    [[nodiscard]] core::RenderError upload(const CellGrid& grid, graphics::CommandBuffer* cmd, uint64_t frame_index);

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] graphics::Texture* get_texture() const { return texture_.get(); }

    // (16, grid_width, grid_height); zero before the first resize()
    [[nodiscard]] glm::uvec3 get_dimensions() const { return dimensions_; }

    [[nodiscard]] const std::vector<uint8_t>& get_texel_data() const { return texels_; }
    [[nodiscard]] uint32_t get_upload_count() const { return upload_count_; }

private:
    graphics::GraphicsDevice* device_ = nullptr;
    uint32_t frames_in_flight_ = 2;

    std::unique_ptr<graphics::Texture> texture_;
    std::unique_ptr<graphics::Texture> previous_;
    std::vector<std::unique_ptr<graphics::Buffer>> staging_;
    glm::uvec3 dimensions_{0};

    std::vector<uint8_t> texels_;
    uint32_t upload_count_ = 0;
};

}  // namespace tessera::rendering
