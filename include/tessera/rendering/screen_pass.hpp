// Tessera Rendering Core
// screen_pass.hpp - Letterboxed blit of the intermediate target to the output surface

#pragma once

#include "color.hpp"

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

// Canonical screen pass bindings (set 0)
namespace screen_binding {
inline constexpr uint32_t INTERMEDIATE = 0;
inline constexpr uint32_t GLOBALS = 1;
}  // namespace screen_binding

struct ScreenPassConfig {
    graphics::FilterMode filter = graphics::FilterMode::Nearest;
    Color clear_color = colors::BLACK;  // Letterbox bars
};

struct ScreenPassInputs {
    graphics::Texture* output = nullptr;
    const graphics::Buffer* quad_vertices = nullptr;
    const graphics::Buffer* quad_indices = nullptr;
    const graphics::Buffer* globals = nullptr;  // ScreenGlobals
};

class ScreenPass {
public:
    ScreenPass();
    ~ScreenPass();

    // Non-copyable
    ScreenPass(const ScreenPass&) = delete;
    ScreenPass& operator=(const ScreenPass&) = delete;

    [[nodiscard]] core::RenderError initialize(graphics::GraphicsDevice* device, graphics::TextureFormat output_format,
                                               const ScreenPassConfig& config = {});
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return pipeline_ != nullptr; }

    // Rebinds the intermediate target; call whenever it is recreated
    void set_source(const graphics::Texture* texture);
    [[nodiscard]] const graphics::Texture* get_source() const { return source_; }
    [[nodiscard]] uint32_t get_source_bind_count() const { return source_bind_count_; }

    [[nodiscard]] core::RenderError validate(const ScreenPassInputs& inputs) const;

    // Full-screen quad scaled by ScreenGlobals::scale_factor over a cleared surface
    [[nodiscard]] core::RenderError record(graphics::CommandBuffer* cmd, const ScreenPassInputs& inputs);

    // Clears the output to clear_color without drawing. Used when an acquired image must still be presented.
    [[nodiscard]] core::RenderError record_clear(graphics::CommandBuffer* cmd, graphics::Texture* output);

    [[nodiscard]] graphics::FilterMode get_filter() const { return config_.filter; }
    [[nodiscard]] uint32_t get_draw_count() const { return draw_count_; }
    [[nodiscard]] uint32_t get_clear_count() const { return clear_count_; }

    [[nodiscard]] static core::RenderError validate_bindings(const graphics::ShaderReflection& vertex,
                                                             const graphics::ShaderReflection& fragment);

private:
    graphics::GraphicsDevice* device_ = nullptr;
    ScreenPassConfig config_;
    graphics::TextureFormat output_format_ = graphics::TextureFormat::BGRA8Unorm;

    std::unique_ptr<graphics::Shader> vertex_shader_;
    std::unique_ptr<graphics::Shader> fragment_shader_;
    std::unique_ptr<graphics::Pipeline> pipeline_;
    std::unique_ptr<graphics::Sampler> sampler_;

    const graphics::Texture* source_ = nullptr;
    uint32_t source_bind_count_ = 0;
    uint32_t draw_count_ = 0;
    uint32_t clear_count_ = 0;

    bool create_pipeline();
};

}  // namespace tessera::rendering
