// Tessera Graphics Tests
// shader_compiler_test.cpp - GLSL compilation and reflection tests

#include <gtest/gtest.h>

#include <algorithm>
#include <tessera/graphics/shader_compiler.hpp>
#include <tessera/rendering/cell_pass.hpp>
#include <tessera/rendering/uniform_blocks.hpp>

namespace tessera::graphics::test {

namespace {

const char* MINIMAL_VERTEX = R"(
#version 450
layout(location = 0) in vec2 in_position;
void main() {
    gl_Position = vec4(in_position, 0.0, 1.0);
}
)";

const char* BROKEN_FRAGMENT = R"(
#version 450
layout(location = 0) out vec4 out_color;
void main() {
    out_color = undefined_symbol;
}
)";

}  // namespace

class ShaderCompilerTest : public ::testing::Test {
protected:
    ShaderCompiler compiler_;
};

TEST_F(ShaderCompilerTest, CompilesMinimalVertexShader) {
    ShaderCompileOptions options;
    options.stage = ShaderStage::Vertex;
    options.generate_msl = false;

    auto result = compiler_.compile_glsl(MINIMAL_VERTEX, options);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(result.spirv_bytecode.empty());
    EXPECT_EQ(result.spirv_bytecode.size() % 4, 0u);
    EXPECT_TRUE(result.msl_source.empty());
    EXPECT_EQ(compiler_.get_compiled_count(), 1u);

    ASSERT_EQ(result.reflection.inputs.size(), 1u);
    EXPECT_EQ(result.reflection.inputs[0].location, 0u);
}

TEST_F(ShaderCompilerTest, ReportsCompileErrors) {
    ShaderCompileOptions options;
    options.stage = ShaderStage::Fragment;

    auto result = compiler_.compile_glsl(BROKEN_FRAGMENT, options);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_EQ(compiler_.get_compiled_count(), 0u);
}

TEST_F(ShaderCompilerTest, CellShadersReflectCanonicalBindings) {
    ShaderCompileOptions vs_options;
    vs_options.stage = ShaderStage::Vertex;
    auto vertex = compiler_.compile_glsl(rendering::CellPass::vertex_source(), vs_options);
    ASSERT_TRUE(vertex.success) << vertex.error_message;

    ShaderCompileOptions fs_options;
    fs_options.stage = ShaderStage::Fragment;
    auto fragment = compiler_.compile_glsl(rendering::CellPass::fragment_source(), fs_options);
    ASSERT_TRUE(fragment.success) << fragment.error_message;

    const auto& buffers = vertex.reflection.uniform_buffers;
    auto globals = std::find_if(buffers.begin(), buffers.end(), [](const ShaderUniformBuffer& ub) {
        return ub.binding == rendering::cell_binding::GLOBALS;
    });
    ASSERT_NE(globals, buffers.end());
    EXPECT_EQ(globals->size, sizeof(rendering::CellGlobals));

    EXPECT_TRUE(rendering::has_sampled_image(fragment.reflection, rendering::cell_binding::SPRITE_ATLAS,
                                             TextureType::Texture2D));
    EXPECT_FALSE(rendering::has_sampled_image(fragment.reflection, rendering::cell_binding::PALETTE,
                                              TextureType::Texture3D));
    EXPECT_EQ(
        rendering::CellPass::validate_bindings(vertex.reflection, fragment.reflection, rendering::ColorMode::Direct),
        core::RenderError::None);
}

TEST_F(ShaderCompilerTest, DefinesSelectPaletteVariant) {
    ShaderCompileOptions options;
    options.stage = ShaderStage::Fragment;
    options.defines = {"COLOR_MODE_PALETTE"};

    auto fragment = compiler_.compile_glsl(rendering::CellPass::fragment_source(), options);
    ASSERT_TRUE(fragment.success) << fragment.error_message;
    EXPECT_TRUE(rendering::has_sampled_image(fragment.reflection, rendering::cell_binding::PALETTE,
                                             TextureType::Texture3D));
}

TEST_F(ShaderCompilerTest, CrossCompilesToMsl) {
    ShaderCompileOptions options;
    options.stage = ShaderStage::Vertex;
    options.generate_msl = true;

    auto result = compiler_.compile_glsl(rendering::CellPass::vertex_source(), options);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_NE(result.msl_source.find("main0"), std::string::npos);
}

TEST_F(ShaderCompilerTest, RejectsMalformedSpirv) {
    std::vector<uint8_t> garbage = {1, 2, 3};
    EXPECT_FALSE(compiler_.reflect_spirv(garbage, ShaderStage::Vertex).has_value());
    EXPECT_FALSE(compiler_.spirv_to_msl(garbage, ShaderStage::Vertex).has_value());
}

TEST(TextureFormatTest, BytesPerTexel) {
    EXPECT_EQ(texture_format_size(TextureFormat::R8Uint), 1u);
    EXPECT_EQ(texture_format_size(TextureFormat::RGBA8Unorm), 4u);
    EXPECT_EQ(texture_format_size(TextureFormat::BGRA8Unorm), 4u);
    EXPECT_EQ(texture_format_size(TextureFormat::RG32Float), 8u);
    EXPECT_EQ(texture_format_size(TextureFormat::Unknown), 0u);
}

TEST(ShaderStageTest, Names) {
    EXPECT_STREQ(shader_stage_name(ShaderStage::Vertex), "Vertex");
    EXPECT_STREQ(shader_stage_name(ShaderStage::Fragment), "Fragment");
}

}  // namespace tessera::graphics::test
