// Tessera Rendering Core
// frame_orchestrator.hpp - Per-frame sequencing of grid upload, cell pass and screen pass

#pragma once

#include "cell_grid.hpp"
#include "cell_pass.hpp"
#include "color.hpp"
#include "instance_buffer.hpp"
#include "palette_texture.hpp"
#include "retirement_queue.hpp"
#include "screen_pass.hpp"
#include "sprite_atlas.hpp"
#include "uniform_blocks.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <tessera/core/config.hpp>
#include <tessera/core/error.hpp>
#include <tessera/graphics/buffer.hpp>
#include <tessera/graphics/device.hpp>
#include <tessera/graphics/texture.hpp>
#include <tessera/platform/timer.hpp>
#include <vector>

namespace tessera::rendering {

// ============================================================================
// Configuration
// ============================================================================

struct FrameOrchestratorConfig {
    glm::uvec2 output_size{960, 600};  // Initial surface size in pixels
    uint32_t frames_in_flight = 2;    // Frames recorded ahead of the GPU before render_frame() waits for idle
    float instance_slack_factor = 1.5f;
    ScaleMode scale_mode = ScaleMode::Fit;
    graphics::FilterMode screen_filter = graphics::FilterMode::Nearest;
    bool post_processing = false;
    Color clear_color = colors::BLACK;
    Color intermediate_clear_color{0x1a, 0x00, 0x00, 0xff};
    bool offscreen = false;           // Render into an owned texture instead of the swap chain
    uint32_t fps_log_interval = 1000;  // Frames between FPS log lines; 0 disables

    // Reads the window, renderer and debug sections; invalid values keep the defaults
    [[nodiscard]] static FrameOrchestratorConfig from_config(const core::Config& config);
};

// Uninitialized -> Ready -> Rendering -> Presented -> Rendering ...
enum class FrameState : uint8_t {
    Uninitialized,
    Ready,
    Rendering,
    Presented,
};

[[nodiscard]] const char* frame_state_name(FrameState state);

// ============================================================================
// Frame Orchestrator
// ============================================================================

class FrameOrchestrator {
public:
    static constexpr size_t TEXTURE_RETIREMENT_CAPACITY = 8;

    FrameOrchestrator();
    ~FrameOrchestrator();

    // Non-copyable
    FrameOrchestrator(const FrameOrchestrator&) = delete;
    FrameOrchestrator& operator=(const FrameOrchestrator&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    [[nodiscard]] core::RenderError initialize(graphics::GraphicsDevice* device, const SpriteAtlas* atlas,
                                               const FrameOrchestratorConfig& config = {});
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return state_ != FrameState::Uninitialized; }

    // ========================================================================
    // Per Frame
    // ========================================================================

    // Takes effect at the start of the next render_frame()
    void request_resize(uint32_t width, uint32_t height);

    // Full frame. On error nothing is presented and the previous frame stays visible, except when the
    // swap chain image was already acquired: that image is cleared to clear_color before it is presented.
    [[nodiscard]] core::RenderError render_frame(const CellGrid& grid);

    // RGBA8 rows of the last presented offscreen frame; nullopt when presenting to a swap chain
    [[nodiscard]] std::optional<std::vector<uint8_t>> capture_output();

    // Surface pixel to grid cell for the current letterbox
    [[nodiscard]] std::optional<glm::uvec2> cell_at(glm::vec2 position) const;

    // ========================================================================
    // State
    // ========================================================================

    [[nodiscard]] FrameState get_state() const { return state_; }
    [[nodiscard]] bool has_presented() const { return has_presented_; }
    [[nodiscard]] uint64_t get_frame_index() const { return frame_index_; }
    [[nodiscard]] uint32_t get_frame_counter() const { return frame_counter_; }
    [[nodiscard]] float get_elapsed_time() const { return elapsed_time_; }
    [[nodiscard]] double get_fps() const { return frame_timer_.get_fps(); }

    [[nodiscard]] glm::uvec2 get_output_size() const { return output_size_; }
    [[nodiscard]] glm::uvec2 get_grid_size() const { return grid_size_; }
    [[nodiscard]] bool is_offscreen() const { return offscreen_; }

    [[nodiscard]] graphics::Texture* get_intermediate_target() const { return intermediate_.get(); }
    [[nodiscard]] uint32_t get_intermediate_recreate_count() const { return intermediate_recreate_count_; }
    [[nodiscard]] uint32_t get_instance_rebuild_count() const { return instance_rebuild_count_; }
    [[nodiscard]] uint64_t get_completed_frames() const { return completed_frames_; }
    [[nodiscard]] uint32_t get_frames_in_flight_wait_count() const { return frames_in_flight_wait_count_; }

    [[nodiscard]] const InstanceBufferBuilder& get_instance_builder() const { return instances_; }
    [[nodiscard]] const UniformBlockManager& get_uniforms() const { return uniforms_; }
    [[nodiscard]] const CellPass& get_cell_pass() const { return cell_pass_; }
    [[nodiscard]] const ScreenPass& get_screen_pass() const { return screen_pass_; }
    [[nodiscard]] const CellPaletteTexture& get_palette_texture() const { return palette_texture_; }

private:
    graphics::GraphicsDevice* device_ = nullptr;
    const SpriteAtlas* atlas_ = nullptr;
    FrameOrchestratorConfig config_;
    FrameState state_ = FrameState::Uninitialized;

    CellPass cell_pass_;
    ScreenPass screen_pass_;
    InstanceBufferBuilder instances_;
    UniformBlockManager uniforms_;
    CellPaletteTexture palette_texture_;

    // Static geometry
    std::unique_ptr<graphics::Buffer> cell_quad_buffer_;
    std::unique_ptr<graphics::Buffer> screen_quad_buffer_;
    std::unique_ptr<graphics::Buffer> quad_index_buffer_;

    // Size-dependent targets
    std::unique_ptr<graphics::Texture> intermediate_;
    std::unique_ptr<graphics::Texture> output_texture_;  // Offscreen mode only
    RetirementQueue<graphics::Texture, TEXTURE_RETIREMENT_CAPACITY> retired_textures_;

    bool offscreen_ = false;
    graphics::TextureFormat output_format_ = graphics::TextureFormat::BGRA8Unorm;
    glm::uvec2 output_size_{0};
    std::optional<glm::uvec2> pending_output_size_;
    glm::uvec2 grid_size_{0};

    // Change tracking
    const CellGrid* last_grid_ = nullptr;
    uint64_t last_revision_ = 0;
    bool geometry_changed_ = true;
    bool palette_dirty_ = false;

    // Frames below completed_frames_ are known to be finished on the GPU
    uint64_t completed_frames_ = 0;
    bool frame_submitted_ = false;
    bool has_presented_ = false;

    uint64_t frame_index_ = 0;
    uint32_t frame_counter_ = 0;
    float elapsed_time_ = 0.0f;
    platform::FrameTimer frame_timer_;

    uint32_t intermediate_recreate_count_ = 0;
    uint32_t instance_rebuild_count_ = 0;
    uint32_t frames_in_flight_wait_count_ = 0;

    bool create_static_geometry();
    [[nodiscard]] std::unique_ptr<graphics::Texture> create_output_texture(glm::uvec2 size);
    [[nodiscard]] core::RenderError apply_pending_resize();
    [[nodiscard]] core::RenderError recreate_grid_targets(glm::uvec2 grid_size);
    void retire_texture(std::unique_ptr<graphics::Texture> texture);
    void enforce_frames_in_flight();
    [[nodiscard]] core::RenderError record_and_submit(const CellGrid& grid);
    void submit_frame(graphics::CommandBuffer* cmd);
    void advance_frame();
};

}  // namespace tessera::rendering
