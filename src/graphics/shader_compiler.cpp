// Tessera Graphics Abstraction Layer
// shader_compiler.cpp - GLSL compilation, reflection and MSL cross-compilation

#include <spdlog/spdlog.h>

#include <cstring>
#include <glslang/Public/ResourceLimits.h>
#include <glslang/Public/ShaderLang.h>
#include <glslang/SPIRV/GlslangToSpv.h>
#include <mutex>
#include <spirv_cross/spirv_cross.hpp>
#include <spirv_cross/spirv_msl.hpp>
#include <tessera/graphics/shader_compiler.hpp>

namespace tessera::graphics {

namespace {

std::once_flag glslang_init_flag;

void initialize_glslang() {
    std::call_once(glslang_init_flag, []() { glslang::InitializeProcess(); });
}

EShLanguage to_glslang_stage(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:
            return EShLangVertex;
        case ShaderStage::Fragment:
            return EShLangFragment;
    }
    return EShLangVertex;
}

spv::ExecutionModel to_execution_model(ShaderStage stage) {
    return stage == ShaderStage::Fragment ? spv::ExecutionModelFragment : spv::ExecutionModelVertex;
}

std::vector<uint32_t> to_words(std::span<const uint8_t> spirv) {
    std::vector<uint32_t> words(spirv.size() / 4);
    std::memcpy(words.data(), spirv.data(), words.size() * sizeof(uint32_t));
    return words;
}

std::string type_name_of(const spirv_cross::SPIRType& type) {
    const char* prefix = "";
    const char* scalar = "float";
    switch (type.basetype) {
        case spirv_cross::SPIRType::Float:
            prefix = "";
            scalar = "float";
            break;
        case spirv_cross::SPIRType::Int:
            prefix = "i";
            scalar = "int";
            break;
        case spirv_cross::SPIRType::UInt:
            prefix = "u";
            scalar = "uint";
            break;
        default:
            return "unknown";
    }
    if (type.columns > 1) {
        return std::string(prefix) + "mat" + std::to_string(type.columns);
    }
    if (type.vecsize > 1) {
        return std::string(prefix) + "vec" + std::to_string(type.vecsize);
    }
    return scalar;
}

ShaderReflection extract_reflection(spirv_cross::Compiler& compiler, ShaderStage stage) {
    ShaderReflection reflection;
    reflection.stage = stage;

    spirv_cross::ShaderResources resources = compiler.get_shader_resources();

    for (const auto& ubo : resources.uniform_buffers) {
        ShaderUniformBuffer uniform_buffer;
        uniform_buffer.name = ubo.name;
        uniform_buffer.set = compiler.get_decoration(ubo.id, spv::DecorationDescriptorSet);
        uniform_buffer.binding = compiler.get_decoration(ubo.id, spv::DecorationBinding);

        const auto& type = compiler.get_type(ubo.base_type_id);
        uniform_buffer.size = compiler.get_declared_struct_size(type);

        for (uint32_t i = 0; i < type.member_types.size(); ++i) {
            ShaderUniformMember member;
            member.name = compiler.get_member_name(ubo.base_type_id, i);
            member.offset = compiler.type_struct_member_offset(type, i);
            member.size = compiler.get_declared_struct_member_size(type, i);

            const auto& member_type = compiler.get_type(type.member_types[i]);
            member.type_name = type_name_of(member_type);
            if (!member_type.array.empty()) {
                member.array_size = member_type.array[0];
            }
            uniform_buffer.members.push_back(member);
        }

        reflection.uniform_buffers.push_back(uniform_buffer);
    }

    for (const auto& sampler : resources.sampled_images) {
        ShaderSampledImage sampled_image;
        sampled_image.name = sampler.name;
        sampled_image.set = compiler.get_decoration(sampler.id, spv::DecorationDescriptorSet);
        sampled_image.binding = compiler.get_decoration(sampler.id, spv::DecorationBinding);

        const auto& type = compiler.get_type(sampler.type_id);
        switch (type.image.dim) {
            case spv::Dim1D:
                sampled_image.dimension = TextureType::Texture1D;
                break;
            case spv::Dim3D:
                sampled_image.dimension = TextureType::Texture3D;
                break;
            default:
                sampled_image.dimension = TextureType::Texture2D;
                break;
        }
        sampled_image.is_array = type.image.arrayed;
        if (sampled_image.is_array && sampled_image.dimension == TextureType::Texture2D) {
            sampled_image.dimension = TextureType::Texture2DArray;
        }

        reflection.sampled_images.push_back(sampled_image);
    }

    for (const auto& input : resources.stage_inputs) {
        ShaderStageInput stage_input;
        stage_input.name = input.name;
        stage_input.location = compiler.get_decoration(input.id, spv::DecorationLocation);
        stage_input.type_name = type_name_of(compiler.get_type(input.type_id));
        reflection.inputs.push_back(stage_input);
    }

    for (const auto& output : resources.stage_outputs) {
        ShaderStageInput stage_output;
        stage_output.name = output.name;
        stage_output.location = compiler.get_decoration(output.id, spv::DecorationLocation);
        stage_output.type_name = type_name_of(compiler.get_type(output.type_id));
        reflection.outputs.push_back(stage_output);
    }

    return reflection;
}

}  // namespace

// ============================================================================
// ShaderCompiler Implementation
// ============================================================================

struct ShaderCompiler::Impl {
    uint32_t compiled_count = 0;
};

ShaderCompiler::ShaderCompiler() : impl_(std::make_unique<Impl>()) {
    initialize_glslang();
}

ShaderCompiler::~ShaderCompiler() = default;

ShaderCompiler::ShaderCompiler(ShaderCompiler&&) noexcept = default;
ShaderCompiler& ShaderCompiler::operator=(ShaderCompiler&&) noexcept = default;

CompiledShader ShaderCompiler::compile_glsl(std::string_view source, const ShaderCompileOptions& options) {
    CompiledShader result;
    result.reflection.stage = options.stage;
    result.reflection.entry_point = options.entry_point;

    EShLanguage glslang_stage = to_glslang_stage(options.stage);
    glslang::TShader shader(glslang_stage);

    const char* source_str = source.data();
    int source_len = static_cast<int>(source.size());
    shader.setStringsWithLengths(&source_str, &source_len, 1);
    shader.setEntryPoint(options.entry_point.c_str());
    shader.setSourceEntryPoint(options.entry_point.c_str());

    shader.setEnvInput(glslang::EShSourceGlsl, glslang_stage, glslang::EShClientVulkan, 100);
    shader.setEnvClient(glslang::EShClientVulkan, glslang::EShTargetVulkan_1_2);
    shader.setEnvTarget(glslang::EShTargetSpv, glslang::EShTargetSpv_1_5);

    // Defines go through the preamble so the #version line stays first
    std::string preamble;
    for (const auto& define : options.defines) {
        preamble += "#define " + define + "\n";
    }
    if (!preamble.empty()) {
        shader.setPreamble(preamble.c_str());
    }

    EShMessages messages = static_cast<EShMessages>(EShMsgSpvRules | EShMsgVulkanRules);
    if (options.generate_debug_info) {
        messages = static_cast<EShMessages>(messages | EShMsgDebugInfo);
    }

    if (!shader.parse(GetDefaultResources(), 450, false, messages)) {
        result.error_message = shader.getInfoLog();
        spdlog::error("GLSL {} compilation failed: {}", shader_stage_name(options.stage), result.error_message);
        return result;
    }

    glslang::TProgram program;
    program.addShader(&shader);
    if (!program.link(messages)) {
        result.error_message = program.getInfoLog();
        spdlog::error("GLSL linking failed: {}", result.error_message);
        return result;
    }

    std::vector<uint32_t> spirv;
    spv::SpvBuildLogger logger;
    glslang::SpvOptions spv_options;
    spv_options.generateDebugInfo = options.generate_debug_info;
    spv_options.disableOptimizer = !options.optimize;

    glslang::GlslangToSpv(*program.getIntermediate(glslang_stage), spirv, &logger, &spv_options);
    if (spirv.empty()) {
        result.error_message = "SPIR-V generation failed: " + logger.getAllMessages();
        spdlog::error("{}", result.error_message);
        return result;
    }

    result.spirv_bytecode.resize(spirv.size() * sizeof(uint32_t));
    std::memcpy(result.spirv_bytecode.data(), spirv.data(), result.spirv_bytecode.size());

    if (options.generate_reflection) {
        auto reflection = reflect_spirv(result.spirv_bytecode, options.stage);
        if (!reflection) {
            result.error_message = "SPIR-V reflection failed";
            return result;
        }
        result.reflection = std::move(*reflection);
        result.reflection.entry_point = options.entry_point;
    }

    if (options.generate_msl) {
        auto msl = spirv_to_msl(result.spirv_bytecode, options.stage);
        if (!msl) {
            result.error_message = "SPIR-V to MSL cross-compilation failed";
            return result;
        }
        result.msl_source = std::move(*msl);
    }

    ++impl_->compiled_count;
    result.success = true;
    spdlog::debug("Shader compiled: stage={} spirv={} bytes", shader_stage_name(options.stage),
                  result.spirv_bytecode.size());
    return result;
}

std::optional<std::string> ShaderCompiler::spirv_to_msl(std::span<const uint8_t> spirv, ShaderStage stage) {
    if (spirv.empty() || spirv.size() % 4 != 0) {
        spdlog::error("Invalid SPIR-V bytecode");
        return std::nullopt;
    }

    try {
        spirv_cross::CompilerMSL msl(to_words(spirv));

        spirv_cross::CompilerMSL::Options msl_options;
        msl_options.platform = spirv_cross::CompilerMSL::Options::macOS;
        msl_options.msl_version = spirv_cross::CompilerMSL::Options::make_msl_version(3, 0);
        msl_options.enable_decoration_binding = true;
        msl_options.argument_buffers = false;
        msl.set_msl_options(msl_options);

        // Uniform blocks follow the vertex stream slots; textures keep their binding
        spirv_cross::ShaderResources resources = msl.get_shader_resources();
        for (const auto& ubo : resources.uniform_buffers) {
            spirv_cross::MSLResourceBinding binding;
            binding.stage = to_execution_model(stage);
            binding.desc_set = msl.get_decoration(ubo.id, spv::DecorationDescriptorSet);
            binding.binding = msl.get_decoration(ubo.id, spv::DecorationBinding);
            binding.msl_buffer = MSL_VERTEX_BUFFER_SLOTS + binding.binding;
            msl.add_msl_resource_binding(binding);
        }
        for (const auto& image : resources.sampled_images) {
            spirv_cross::MSLResourceBinding binding;
            binding.stage = to_execution_model(stage);
            binding.desc_set = msl.get_decoration(image.id, spv::DecorationDescriptorSet);
            binding.binding = msl.get_decoration(image.id, spv::DecorationBinding);
            binding.msl_texture = binding.binding;
            binding.msl_sampler = binding.binding;
            msl.add_msl_resource_binding(binding);
        }

        return msl.compile();
    } catch (const spirv_cross::CompilerError& e) {
        spdlog::error("SPIR-V to MSL cross-compilation failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ShaderReflection> ShaderCompiler::reflect_spirv(std::span<const uint8_t> spirv, ShaderStage stage) {
    if (spirv.empty() || spirv.size() % 4 != 0) {
        return std::nullopt;
    }

    try {
        spirv_cross::Compiler compiler(to_words(spirv));
        return extract_reflection(compiler, stage);
    } catch (const spirv_cross::CompilerError& e) {
        spdlog::error("SPIR-V reflection failed: {}", e.what());
        return std::nullopt;
    }
}

uint32_t ShaderCompiler::get_compiled_count() const {
    return impl_->compiled_count;
}

// ============================================================================
// Utility Functions
// ============================================================================

const char* shader_stage_name(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:
            return "Vertex";
        case ShaderStage::Fragment:
            return "Fragment";
    }
    return "Unknown";
}

}  // namespace tessera::graphics
