// Tessera Rendering Core
// shader_loader.hpp - Embedded GLSL to backend shader objects

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tessera/graphics/device.hpp>
#include <tessera/graphics/shader.hpp>
#include <tessera/graphics/shader_compiler.hpp>
#include <vector>

namespace tessera::rendering {

struct LoadedShader {
    std::unique_ptr<graphics::Shader> shader;
    graphics::ShaderReflection reflection;
};

// Compiles GLSL and creates the device shader in the form the backend consumes:
// MSL source with entry "main0" on Metal, SPIR-V with entry "main" elsewhere.
// Logs and returns nullopt on compile or creation failure.
[[nodiscard]] std::optional<LoadedShader> load_shader(graphics::GraphicsDevice* device,
                                                      graphics::ShaderCompiler& compiler, std::string_view source,
                                                      graphics::ShaderStage stage,
                                                      const std::vector<std::string>& defines,
                                                      std::string_view debug_name);

// ============================================================================
// Binding Checks
// ============================================================================

[[nodiscard]] bool has_uniform_buffer(const graphics::ShaderReflection& reflection, uint32_t binding);

[[nodiscard]] bool has_sampled_image(const graphics::ShaderReflection& reflection, uint32_t binding,
                                     graphics::TextureType dimension);

}  // namespace tessera::rendering
