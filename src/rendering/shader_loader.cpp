// Tessera Rendering Core
// shader_loader.cpp - Embedded GLSL to backend shader objects

#include <algorithm>
#include <exception>
#include <tessera/core/logger.hpp>
#include <tessera/rendering/shader_loader.hpp>

namespace tessera::rendering {

std::optional<LoadedShader> load_shader(graphics::GraphicsDevice* device, graphics::ShaderCompiler& compiler,
                                        std::string_view source, graphics::ShaderStage stage,
                                        const std::vector<std::string>& defines, std::string_view debug_name) {
    const bool metal = device->get_capabilities().api_name == "Metal";

    graphics::ShaderCompileOptions options;
    options.stage = stage;
    options.entry_point = "main";
    options.defines = defines;
    options.generate_reflection = true;
    options.generate_msl = metal;

    auto result = compiler.compile_glsl(source, options);
    if (!result.success) {
        TESSERA_LOG_ERROR(core::log_category::GRAPHICS, "Failed to compile {} ({}): {}", debug_name,
                          graphics::shader_stage_name(stage), result.error_message);
        return std::nullopt;
    }

    graphics::ShaderDesc desc;
    desc.stage = stage;
    desc.debug_name = std::string(debug_name);
    if (metal) {
        desc.bytecode = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(result.msl_source.data()),
                                                 result.msl_source.size());
        desc.entry_point = "main0";
    } else {
        desc.bytecode = std::span<const uint8_t>(result.spirv_bytecode);
        desc.entry_point = "main";
    }

    LoadedShader loaded;
    try {
        loaded.shader = device->create_shader(desc);
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::GRAPHICS, "Creating shader {} threw: {}", debug_name, e.what());
        return std::nullopt;
    }
    if (!loaded.shader) {
        TESSERA_LOG_ERROR(core::log_category::GRAPHICS, "Failed to create shader {}", debug_name);
        return std::nullopt;
    }

    loaded.reflection = std::move(result.reflection);
    return loaded;
}

bool has_uniform_buffer(const graphics::ShaderReflection& reflection, uint32_t binding) {
    return std::any_of(reflection.uniform_buffers.begin(), reflection.uniform_buffers.end(),
                       [binding](const graphics::ShaderUniformBuffer& ub) { return ub.binding == binding; });
}

bool has_sampled_image(const graphics::ShaderReflection& reflection, uint32_t binding,
                       graphics::TextureType dimension) {
    return std::any_of(reflection.sampled_images.begin(), reflection.sampled_images.end(),
                       [binding, dimension](const graphics::ShaderSampledImage& image) {
                           return image.binding == binding && image.dimension == dimension;
                       });
}

}  // namespace tessera::rendering
