// Tessera Rendering Tests
// cell_pass_test.cpp - Cell pass binding validation and draw recording tests

#include <gtest/gtest.h>

#include "mock_graphics_device.hpp"

#include <tessera/rendering/builtin_font.hpp>
#include <tessera/rendering/cell_pass.hpp>

namespace tessera::rendering::test {

using graphics::test::MockCommandBuffer;
using graphics::test::MockGraphicsDevice;
using graphics::test::MockTexture;

class CellPassTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(atlas_.initialize(&device_, BuiltinFont::create_sheet(), ColorMode::Direct));

        graphics::TextureDesc target_desc;
        target_desc.format = graphics::TextureFormat::RGBA8Unorm;
        target_desc.width = 640;
        target_desc.height = 400;
        target_desc.usage = graphics::TextureUsage::RenderTarget | graphics::TextureUsage::Sampled;
        target_ = device_.create_texture(target_desc);

        graphics::BufferDesc buffer_desc;
        buffer_desc.size = 64;
        buffer_desc.host_visible = true;
        vertices_ = device_.create_buffer(buffer_desc);
        indices_ = device_.create_buffer(buffer_desc);
        instances_ = device_.create_buffer(buffer_desc);
        globals_ = device_.create_buffer(buffer_desc);
    }

    CellPassInputs inputs(uint32_t instance_count) const {
        CellPassInputs in;
        in.target = target_.get();
        in.quad_vertices = vertices_.get();
        in.quad_indices = indices_.get();
        in.instances = instances_.get();
        in.instance_count = instance_count;
        in.globals = globals_.get();
        in.clear_color = Color(0x1a, 0, 0, 0xff);
        return in;
    }

    static const graphics::test::RecordedCommand* find(const MockCommandBuffer& cmd, const std::string& name) {
        for (const auto& command : cmd.commands()) {
            if (command.name == name) {
                return &command;
            }
        }
        return nullptr;
    }

    MockGraphicsDevice device_;
    SpriteAtlas atlas_;
    CellPass pass_;
    std::unique_ptr<graphics::Texture> target_;
    std::unique_ptr<graphics::Buffer> vertices_;
    std::unique_ptr<graphics::Buffer> indices_;
    std::unique_ptr<graphics::Buffer> instances_;
    std::unique_ptr<graphics::Buffer> globals_;
};

TEST_F(CellPassTest, MissingAtlasIsMissingBinding) {
    EXPECT_EQ(pass_.initialize(&device_, nullptr, graphics::TextureFormat::RGBA8Unorm),
              core::RenderError::MissingBinding);

    SpriteAtlas empty_atlas;
    EXPECT_EQ(pass_.initialize(&device_, &empty_atlas, graphics::TextureFormat::RGBA8Unorm),
              core::RenderError::MissingBinding);
    EXPECT_FALSE(pass_.is_initialized());
}

TEST_F(CellPassTest, EmptyReflectionIsMissingBinding) {
    graphics::ShaderReflection empty;
    EXPECT_EQ(CellPass::validate_bindings(empty, empty, ColorMode::Direct), core::RenderError::MissingBinding);

    graphics::ShaderReflection vertex;
    vertex.uniform_buffers.push_back({"globals", 0, cell_binding::GLOBALS, sizeof(CellGlobals), {}});
    graphics::ShaderReflection fragment;
    fragment.sampled_images.push_back({"sprite_atlas", 0, cell_binding::SPRITE_ATLAS,
                                       graphics::TextureType::Texture2D, false});
    EXPECT_EQ(CellPass::validate_bindings(vertex, fragment, ColorMode::Direct), core::RenderError::None);
    EXPECT_EQ(CellPass::validate_bindings(vertex, fragment, ColorMode::Palette), core::RenderError::MissingBinding);
}

TEST_F(CellPassTest, PipelineDescribesInstancedQuad) {
    ASSERT_EQ(pass_.initialize(&device_, &atlas_, graphics::TextureFormat::RGBA8Unorm), core::RenderError::None);
    ASSERT_EQ(device_.pipeline_descs.size(), 1u);

    const graphics::PipelineDesc& desc = device_.pipeline_descs.back();
    EXPECT_EQ(desc.vertex_attributes.size(), 9u);
    ASSERT_EQ(desc.vertex_bindings.size(), 2u);
    EXPECT_FALSE(desc.vertex_bindings[0].per_instance);
    EXPECT_TRUE(desc.vertex_bindings[1].per_instance);
    EXPECT_EQ(desc.vertex_bindings[1].stride, sizeof(CellInstance));
    EXPECT_EQ(desc.rasterizer.cull_mode, graphics::CullMode::None);
    ASSERT_EQ(desc.color_blend.size(), 1u);
    EXPECT_FALSE(desc.color_blend[0].enable);
    ASSERT_EQ(desc.color_formats.size(), 1u);
    EXPECT_EQ(desc.color_formats[0], graphics::TextureFormat::RGBA8Unorm);

    // SPIR-V entry points on a non-Metal backend
    ASSERT_EQ(device_.shader_entry_points.size(), 2u);
    EXPECT_EQ(device_.shader_entry_points[0], "main");
}

TEST_F(CellPassTest, RecordsOneInstancedDraw) {
    ASSERT_EQ(pass_.initialize(&device_, &atlas_, graphics::TextureFormat::RGBA8Unorm), core::RenderError::None);

    MockCommandBuffer cmd;
    ASSERT_EQ(pass_.record(&cmd, inputs(2000)), core::RenderError::None);

    uint32_t draws = 0;
    for (const auto& command : cmd.commands()) {
        if (command.name == "draw_indexed") {
            ++draws;
            EXPECT_EQ(command.arg0, 6u);
            EXPECT_EQ(command.arg1, 2000u);
        }
    }
    EXPECT_EQ(draws, 1u);
    EXPECT_EQ(pass_.get_draw_count(), 1u);

    const auto* atlas_bind = find(cmd, "bind_texture");
    ASSERT_NE(atlas_bind, nullptr);
    EXPECT_EQ(atlas_bind->arg0, cell_binding::SPRITE_ATLAS);
    EXPECT_EQ(atlas_bind->resource, atlas_.get_texture());

    EXPECT_EQ(cmd.commands().front().name, "begin_render_pass");
    EXPECT_EQ(cmd.commands().back().name, "end_render_pass");

    // The target was cleared with the intermediate clear color
    const auto& texels = static_cast<MockTexture*>(target_.get())->texels();
    EXPECT_EQ(texels[0], 0x1a);
    EXPECT_EQ(texels[3], 0xff);
}

TEST_F(CellPassTest, EmptyGridClearsWithoutDrawing) {
    ASSERT_EQ(pass_.initialize(&device_, &atlas_, graphics::TextureFormat::RGBA8Unorm), core::RenderError::None);

    MockCommandBuffer cmd;
    ASSERT_EQ(pass_.record(&cmd, inputs(0)), core::RenderError::None);
    EXPECT_EQ(find(cmd, "draw_indexed"), nullptr);
    EXPECT_NE(find(cmd, "begin_render_pass"), nullptr);
}

TEST_F(CellPassTest, MissingInputsRecordNothing) {
    ASSERT_EQ(pass_.initialize(&device_, &atlas_, graphics::TextureFormat::RGBA8Unorm), core::RenderError::None);

    MockCommandBuffer cmd;
    CellPassInputs missing_globals = inputs(10);
    missing_globals.globals = nullptr;
    EXPECT_EQ(pass_.record(&cmd, missing_globals), core::RenderError::MissingBinding);

    CellPassInputs missing_target = inputs(10);
    missing_target.target = nullptr;
    EXPECT_EQ(pass_.record(&cmd, missing_target), core::RenderError::MissingBinding);

    EXPECT_TRUE(cmd.commands().empty());
    EXPECT_EQ(pass_.get_state(), PassState::Idle);
}

TEST_F(CellPassTest, UninitializedPassRefusesToRecord) {
    MockCommandBuffer cmd;
    EXPECT_EQ(pass_.record(&cmd, inputs(10)), core::RenderError::MissingBinding);
}

TEST_F(CellPassTest, StateMachineCycles) {
    ASSERT_EQ(pass_.initialize(&device_, &atlas_, graphics::TextureFormat::RGBA8Unorm), core::RenderError::None);
    EXPECT_EQ(pass_.get_state(), PassState::Idle);

    MockCommandBuffer cmd;
    ASSERT_EQ(pass_.record(&cmd, inputs(1)), core::RenderError::None);
    EXPECT_EQ(pass_.get_state(), PassState::Building);

    pass_.mark_submitted();
    EXPECT_EQ(pass_.get_state(), PassState::Submitted);

    pass_.mark_complete();
    EXPECT_EQ(pass_.get_state(), PassState::Idle);
    EXPECT_STREQ(pass_state_name(PassState::Submitted), "submitted");
}

TEST_F(CellPassTest, PaletteModeBindsPaletteVolume) {
    SpriteAtlas palette_atlas;
    ASSERT_TRUE(palette_atlas.initialize(&device_, BuiltinFont::create_sheet(15), ColorMode::Palette));
    ASSERT_EQ(pass_.initialize(&device_, &palette_atlas, graphics::TextureFormat::RGBA8Unorm),
              core::RenderError::None);
    EXPECT_EQ(pass_.get_color_mode(), ColorMode::Palette);

    MockCommandBuffer cmd;
    CellPassInputs in = inputs(4);
    EXPECT_EQ(pass_.validate(in), core::RenderError::MissingBinding);  // No palette yet

    graphics::TextureDesc palette_desc;
    palette_desc.type = graphics::TextureType::Texture3D;
    palette_desc.format = graphics::TextureFormat::RGBA8Unorm;
    palette_desc.width = 16;
    palette_desc.height = 2;
    palette_desc.depth = 2;
    auto palette = device_.create_texture(palette_desc);
    in.palette = palette.get();

    ASSERT_EQ(pass_.record(&cmd, in), core::RenderError::None);
    bool bound = false;
    for (const auto& command : cmd.commands()) {
        if (command.name == "bind_texture" && command.arg0 == cell_binding::PALETTE) {
            bound = command.resource == palette.get();
        }
    }
    EXPECT_TRUE(bound);
}

TEST_F(CellPassTest, MetalBackendUsesMslEntryPoint) {
    device_.set_api_name("Metal");
    ASSERT_EQ(pass_.initialize(&device_, &atlas_, graphics::TextureFormat::RGBA8Unorm), core::RenderError::None);
    ASSERT_EQ(device_.shader_entry_points.size(), 2u);
    EXPECT_EQ(device_.shader_entry_points[0], "main0");
    EXPECT_EQ(device_.shader_entry_points[1], "main0");
}

}  // namespace tessera::rendering::test
