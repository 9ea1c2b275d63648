// Tessera Rendering Core
// uniform_blocks.hpp - GPU uniform blocks for the cell and screen passes

#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <tessera/core/error.hpp>
#include <tessera/graphics/buffer.hpp>
#include <tessera/graphics/device.hpp>

namespace tessera::rendering {

// How the intermediate image is fitted into the output surface
enum class ScaleMode : uint8_t {
    Fit,      // Preserve aspect ratio, letterbox the remainder
    Stretch,  // Fill the surface, ignoring aspect ratio
    Integer,  // Largest whole-number multiple that fits; Fit when none does
};

[[nodiscard]] const char* scale_mode_name(ScaleMode mode);
[[nodiscard]] std::optional<ScaleMode> parse_scale_mode(std::string_view name);

// Bits of ScreenGlobals::effect_flags
namespace screen_effect {
inline constexpr uint32_t NONE = 0;
inline constexpr uint32_t SCANLINES = 1u << 0;
inline constexpr uint32_t VIGNETTE = 1u << 1;
}  // namespace screen_effect

// ============================================================================
// CPU-side Input
// ============================================================================

// Everything the uniform blocks are derived from, passed by value each frame
struct GlobalsUniform {
    glm::uvec2 output_size{0};      // Surface size in pixels
    glm::uvec2 cell_pixel_size{0};  // Sprite size in pixels
    glm::uvec2 grid_size{0};        // Grid size in cells
    glm::uvec2 atlas_dimensions{0};  // Atlas tiles (columns, rows)
    glm::uvec2 atlas_texture_size{0};
    glm::uvec3 palette_texture_dimensions{0};  // (16, width, height); zero in direct mode
    uint32_t frame_counter = 0;
    float elapsed_time = 0.0f;
    uint32_t effect_flags = screen_effect::NONE;
    ScaleMode scale_mode = ScaleMode::Fit;

    // Intermediate target size: one sprite per cell
    [[nodiscard]] glm::uvec2 intermediate_size() const { return grid_size * cell_pixel_size; }
};

// ============================================================================
// GPU Blocks (std140)
// ============================================================================

struct CellGlobals {
    uint32_t screen_size_in_sprites[2];
    uint32_t sprite_map_dimensions[2];
    uint32_t sprite_texture_dimensions[2];
    uint32_t sprite_dimensions[2];
    uint32_t palette_texture_dimensions[2];  // Palette volume width (16) and height (grid width)
    uint32_t reserved[2];
};

static_assert(sizeof(CellGlobals) == 48, "CellGlobals must match the std140 block");

struct ScreenGlobals {
    float screen_size_in_pixels[2];
    float scale_factor[2];
    uint32_t frame_counter;
    float elapsed_time;
    uint32_t effect_flags;
    uint32_t reserved;
};

static_assert(sizeof(ScreenGlobals) == 32, "ScreenGlobals must match the std140 block");

// Fraction of the output surface covered by the intermediate image on each axis.
// Degenerate sizes yield (1, 1).
[[nodiscard]] glm::vec2 compute_scale_factor(glm::uvec2 output_size, glm::uvec2 intermediate_size, ScaleMode mode);

// Maps a surface pixel to the grid cell under it, honoring letterboxing.
// nullopt when the position falls in the letterbox or outside the surface.
[[nodiscard]] std::optional<glm::uvec2> screen_to_cell(glm::vec2 position, glm::uvec2 output_size,
                                                       glm::uvec2 grid_size, glm::vec2 scale_factor);

// ============================================================================
// Uniform Block Manager
// ============================================================================

class UniformBlockManager {
public:
    UniformBlockManager();
    ~UniformBlockManager();

    // Non-copyable
    UniformBlockManager(const UniformBlockManager&) = delete;
    UniformBlockManager& operator=(const UniformBlockManager&) = delete;

    bool initialize(graphics::GraphicsDevice* device);
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return cell_buffer_ != nullptr; }

    // Derive both blocks; each is marked dirty only if its bytes changed since the last upload
    void update(const GlobalsUniform& globals);

    // Writes dirty blocks. A second call with the same frame_index writes nothing.
    [[nodiscard]] core::RenderError upload(uint64_t frame_index);

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] const CellGlobals& get_cell_globals() const { return cell_globals_; }
    [[nodiscard]] const ScreenGlobals& get_screen_globals() const { return screen_globals_; }
    [[nodiscard]] glm::vec2 get_scale_factor() const { return scale_factor_; }

    [[nodiscard]] bool is_cell_dirty() const { return cell_dirty_; }
    [[nodiscard]] bool is_screen_dirty() const { return screen_dirty_; }

    [[nodiscard]] uint32_t get_scale_recompute_count() const { return scale_recompute_count_; }
    [[nodiscard]] uint32_t get_cell_write_count() const { return cell_write_count_; }
    [[nodiscard]] uint32_t get_screen_write_count() const { return screen_write_count_; }

    [[nodiscard]] graphics::Buffer* get_cell_buffer() const { return cell_buffer_.get(); }
    [[nodiscard]] graphics::Buffer* get_screen_buffer() const { return screen_buffer_.get(); }

private:
    std::unique_ptr<graphics::Buffer> cell_buffer_;
    std::unique_ptr<graphics::Buffer> screen_buffer_;

    CellGlobals cell_globals_{};
    ScreenGlobals screen_globals_{};
    CellGlobals uploaded_cell_{};
    ScreenGlobals uploaded_screen_{};
    bool cell_dirty_ = true;
    bool screen_dirty_ = true;
    bool has_uploaded_ = false;

    // Scale factor cache key
    glm::vec2 scale_factor_{1.0f};
    glm::uvec2 scale_output_size_{0};
    glm::uvec2 scale_intermediate_size_{0};
    ScaleMode scale_mode_ = ScaleMode::Fit;
    bool scale_valid_ = false;

    std::optional<uint64_t> last_upload_frame_;
    uint32_t scale_recompute_count_ = 0;
    uint32_t cell_write_count_ = 0;
    uint32_t screen_write_count_ = 0;
};

}  // namespace tessera::rendering
