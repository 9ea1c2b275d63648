// Tessera Rendering Core
// cell_vertex.hpp - Vertex and instance formats for the cell and screen passes

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <tessera/graphics/types.hpp>
#include <vector>

namespace tessera::rendering {

// Vertex buffer slots shared by pipelines and draw recording
inline constexpr uint32_t QUAD_VERTEX_BINDING = 0;
inline constexpr uint32_t CELL_INSTANCE_BINDING = 1;

// Unit quad corner (16 bytes)
struct QuadVertex {
    float position[2];
    float uv[2];

    static std::vector<graphics::VertexAttribute> get_attributes() {
        return {
            {0, QUAD_VERTEX_BINDING, graphics::TextureFormat::RG32Float, 0},  // position
            {1, QUAD_VERTEX_BINDING, graphics::TextureFormat::RG32Float, 8},  // uv
        };
    }

    static graphics::VertexBinding get_binding() { return {QUAD_VERTEX_BINDING, sizeof(QuadVertex), false}; }
};

static_assert(sizeof(QuadVertex) == 16, "QuadVertex must be 16 bytes");

// One record per grid cell, consumed per instance (40 bytes, no padding)
struct CellInstance {
    // Clip-space position of the cell's bottom-left corner
    float translate[2];

    // Top-left UV of the glyph tile in the atlas
    float uv_base[2];

    // Grid position; addresses the per-cell palette in palette mode
    uint32_t cell_coords[2];

    // Glyph index after out-of-range remapping
    uint32_t sprite;

    // Row-major cell index (y * width + x)
    uint32_t index;

    // Direct-mode colors, packed RGBA8
    uint32_t fg_color;
    uint32_t bg_color;

    static std::vector<graphics::VertexAttribute> get_attributes() {
        return {
            {2, CELL_INSTANCE_BINDING, graphics::TextureFormat::RG32Float, offsetof(CellInstance, translate)},
            {3, CELL_INSTANCE_BINDING, graphics::TextureFormat::RG32Float, offsetof(CellInstance, uv_base)},
            {4, CELL_INSTANCE_BINDING, graphics::TextureFormat::RG32Uint, offsetof(CellInstance, cell_coords)},
            {5, CELL_INSTANCE_BINDING, graphics::TextureFormat::R32Uint, offsetof(CellInstance, sprite)},
            {6, CELL_INSTANCE_BINDING, graphics::TextureFormat::R32Uint, offsetof(CellInstance, index)},
            {7, CELL_INSTANCE_BINDING, graphics::TextureFormat::RGBA8Unorm, offsetof(CellInstance, fg_color)},
            {8, CELL_INSTANCE_BINDING, graphics::TextureFormat::RGBA8Unorm, offsetof(CellInstance, bg_color)},
        };
    }

    static graphics::VertexBinding get_binding() { return {CELL_INSTANCE_BINDING, sizeof(CellInstance), true}; }
};

static_assert(sizeof(CellInstance) == 40, "CellInstance must be 40 bytes with no padding");
static_assert(offsetof(CellInstance, fg_color) == 32, "CellInstance color offset changed");

// ============================================================================
// Static Geometry
// ============================================================================

// Cell quad in cell-local units, (0,0) bottom-left; uv has v pointing down the atlas
inline constexpr std::array<QuadVertex, 4> CELL_QUAD_VERTICES = {{
    {{1.0f, 0.0f}, {1.0f, 1.0f}},
    {{0.0f, 0.0f}, {0.0f, 1.0f}},
    {{0.0f, 1.0f}, {0.0f, 0.0f}},
    {{1.0f, 1.0f}, {1.0f, 0.0f}},
}};

// Full-screen quad in clip space
inline constexpr std::array<QuadVertex, 4> SCREEN_QUAD_VERTICES = {{
    {{1.0f, -1.0f}, {1.0f, 1.0f}},
    {{-1.0f, -1.0f}, {0.0f, 1.0f}},
    {{-1.0f, 1.0f}, {0.0f, 0.0f}},
    {{1.0f, 1.0f}, {1.0f, 0.0f}},
}};

inline constexpr std::array<uint16_t, 6> QUAD_INDICES = {0, 1, 2, 2, 3, 0};

}  // namespace tessera::rendering
