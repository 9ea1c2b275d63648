// Tessera Graphics Abstraction Layer
// shader_compiler.hpp - GLSL compilation, reflection and MSL cross-compilation

#pragma once

#include "types.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::graphics {

// ============================================================================
// Shader Compilation Options
// ============================================================================

struct ShaderCompileOptions {
    ShaderStage stage = ShaderStage::Vertex;
    std::string entry_point = "main";
    std::vector<std::string> defines;  // "NAME" or "NAME VALUE", injected as #define lines
    bool generate_debug_info = false;
    bool optimize = true;
    bool generate_reflection = true;
    bool generate_msl = true;
};

// ============================================================================
// Compiled Shader Result
// ============================================================================

struct CompiledShader {
    bool success = false;
    std::string error_message;
    std::vector<uint8_t> spirv_bytecode;  // SPIR-V bytecode (Vulkan)
    std::string msl_source;               // Metal Shading Language source (empty if not requested)
    ShaderReflection reflection;
};

// ============================================================================
// Shader Compiler
// ============================================================================

// Compiles GLSL 450 to SPIR-V and cross-compiles to MSL for Metal
class ShaderCompiler {
public:
    ShaderCompiler();
    ~ShaderCompiler();

    // Non-copyable
    ShaderCompiler(const ShaderCompiler&) = delete;
    ShaderCompiler& operator=(const ShaderCompiler&) = delete;

    ShaderCompiler(ShaderCompiler&&) noexcept;
    ShaderCompiler& operator=(ShaderCompiler&&) noexcept;

    [[nodiscard]] CompiledShader compile_glsl(std::string_view source, const ShaderCompileOptions& options);

    // Cross-compile SPIR-V to MSL. Uniform buffers keep their binding as the
    // buffer index (offset past the vertex buffer slots); textures and samplers
    // keep their binding as the texture/sampler index.
    [[nodiscard]] std::optional<std::string> spirv_to_msl(std::span<const uint8_t> spirv, ShaderStage stage);

    [[nodiscard]] std::optional<ShaderReflection> reflect_spirv(std::span<const uint8_t> spirv, ShaderStage stage);

    // Number of successful compile_glsl() calls on this compiler
    [[nodiscard]] uint32_t get_compiled_count() const;

    // Metal buffer slots reserved for vertex streams before uniform buffers
    static constexpr uint32_t MSL_VERTEX_BUFFER_SLOTS = 4;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Utility Functions
// ============================================================================

[[nodiscard]] const char* shader_stage_name(ShaderStage stage);

}  // namespace tessera::graphics
