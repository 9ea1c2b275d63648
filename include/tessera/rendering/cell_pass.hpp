// Tessera Rendering Core
// cell_pass.hpp - Instanced draw of every grid cell into the intermediate target

#pragma once

#include "color.hpp"
#include "shader_loader.hpp"
#include "sprite_atlas.hpp"

#include <cstdint>
#include <memory>
#include <tessera/core/error.hpp>
#include <tessera/graphics/buffer.hpp>
#include <tessera/graphics/command_buffer.hpp>
#include <tessera/graphics/device.hpp>
#include <tessera/graphics/pipeline.hpp>
#include <tessera/graphics/sampler.hpp>
#include <tessera/graphics/shader.hpp>
#include <tessera/graphics/texture.hpp>

namespace tessera::rendering {

// Canonical cell pass bindings (set 0)
namespace cell_binding {
inline constexpr uint32_t GLOBALS = 0;
inline constexpr uint32_t SPRITE_ATLAS = 1;
inline constexpr uint32_t PALETTE = 2;
}  // namespace cell_binding

// Idle -> Building (record) -> Submitted (mark_submitted) -> Idle (mark_complete)
enum class PassState : uint8_t {
    Idle,
    Building,
    Submitted,
};

[[nodiscard]] const char* pass_state_name(PassState state);

struct CellPassInputs {
    graphics::Texture* target = nullptr;  // Intermediate render target
    const graphics::Buffer* quad_vertices = nullptr;
    const graphics::Buffer* quad_indices = nullptr;
    const graphics::Buffer* instances = nullptr;
    uint32_t instance_count = 0;
    const graphics::Buffer* globals = nullptr;  // CellGlobals
    const graphics::Texture* palette = nullptr;  // Required in palette mode only
    Color clear_color = colors::BLACK;
};

class CellPass {
public:
    CellPass();
    ~CellPass();

    // Non-copyable
    CellPass(const CellPass&) = delete;
    CellPass& operator=(const CellPass&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Shader variant follows the atlas color mode. MissingBinding when the atlas is
    // absent or the compiled shaders lack a required binding.
    [[nodiscard]] core::RenderError initialize(graphics::GraphicsDevice* device, const SpriteAtlas* atlas,
                                               graphics::TextureFormat color_format);
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return pipeline_ != nullptr; }

    // ========================================================================
    // Recording
    // ========================================================================

    // Checks everything record() needs without touching a command buffer
    [[nodiscard]] core::RenderError validate(const CellPassInputs& inputs) const;

    // One render pass, one draw_indexed(6, instance_count). Nothing is recorded on error.
    [[nodiscard]] core::RenderError record(graphics::CommandBuffer* cmd, const CellPassInputs& inputs);

    void mark_submitted();
    void mark_complete();

    [[nodiscard]] PassState get_state() const { return state_; }
    [[nodiscard]] ColorMode get_color_mode() const { return color_mode_; }
    [[nodiscard]] uint32_t get_draw_count() const { return draw_count_; }

    // Binding layout check against reflection of both stages
    [[nodiscard]] static core::RenderError validate_bindings(const graphics::ShaderReflection& vertex,
                                                             const graphics::ShaderReflection& fragment,
                                                             ColorMode mode);

    [[nodiscard]] static const char* vertex_source();
    [[nodiscard]] static const char* fragment_source();

private:
    graphics::GraphicsDevice* device_ = nullptr;
    const SpriteAtlas* atlas_ = nullptr;
    ColorMode color_mode_ = ColorMode::Direct;
    graphics::TextureFormat color_format_ = graphics::TextureFormat::RGBA8Unorm;

    std::unique_ptr<graphics::Shader> vertex_shader_;
    std::unique_ptr<graphics::Shader> fragment_shader_;
    std::unique_ptr<graphics::Pipeline> pipeline_;
    std::unique_ptr<graphics::Sampler> palette_sampler_;

    PassState state_ = PassState::Idle;
    uint32_t draw_count_ = 0;

    bool create_pipeline();
};

}  // namespace tessera::rendering
