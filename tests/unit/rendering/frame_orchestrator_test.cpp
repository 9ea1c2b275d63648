// Tessera Rendering Tests
// frame_orchestrator_test.cpp - End-to-end frame sequencing against the mock device

#include <gtest/gtest.h>

#include "mock_graphics_device.hpp"

#include <tessera/core/config.hpp>
#include <tessera/rendering/rendering.hpp>

namespace tessera::rendering::test {

using graphics::test::MockGraphicsDevice;

class FrameOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(atlas_.initialize(&device_, BuiltinFont::create_sheet(), ColorMode::Direct));
        config_.offscreen = true;
        config_.fps_log_interval = 0;
    }

    void initialize() { ASSERT_EQ(orchestrator_.initialize(&device_, &atlas_, config_), core::RenderError::None); }

    MockGraphicsDevice device_;
    SpriteAtlas atlas_;
    FrameOrchestratorConfig config_;
    FrameOrchestrator orchestrator_;
    CellGrid grid_{80, 25};
};

TEST_F(FrameOrchestratorTest, RequiresInitializedAtlas) {
    SpriteAtlas empty;
    EXPECT_EQ(orchestrator_.initialize(&device_, &empty, config_), core::RenderError::MissingBinding);
    EXPECT_EQ(orchestrator_.initialize(&device_, nullptr, config_), core::RenderError::MissingBinding);
    EXPECT_EQ(orchestrator_.get_state(), FrameState::Uninitialized);
    EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
}

TEST_F(FrameOrchestratorTest, FirstFrameBuildsEverything) {
    initialize();
    EXPECT_EQ(orchestrator_.get_state(), FrameState::Ready);

    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(orchestrator_.get_state(), FrameState::Presented);
    EXPECT_EQ(orchestrator_.get_frame_index(), 1u);
    EXPECT_EQ(orchestrator_.get_frame_counter(), 1u);
    EXPECT_EQ(orchestrator_.get_grid_size(), glm::uvec2(80, 25));

    ASSERT_NE(orchestrator_.get_intermediate_target(), nullptr);
    EXPECT_EQ(orchestrator_.get_intermediate_target()->get_width(), 640u);
    EXPECT_EQ(orchestrator_.get_intermediate_target()->get_height(), 400u);
    EXPECT_EQ(orchestrator_.get_instance_builder().instance_count(), 2000u);

    // Cell pass then screen pass, one submission
    EXPECT_EQ(device_.count_in_last_submission("begin_render_pass"), 2u);
    EXPECT_EQ(device_.count_in_last_submission("draw_indexed"), 2u);
    EXPECT_EQ(orchestrator_.get_cell_pass().get_state(), PassState::Submitted);

    const CellGlobals& cell = orchestrator_.get_uniforms().get_cell_globals();
    EXPECT_EQ(cell.screen_size_in_sprites[0], 80u);
    EXPECT_EQ(cell.sprite_dimensions[1], 16u);
}

TEST_F(FrameOrchestratorTest, UnchangedGridIsNotRebuilt) {
    initialize();
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    }
    EXPECT_EQ(orchestrator_.get_instance_rebuild_count(), 1u);
    EXPECT_EQ(orchestrator_.get_instance_builder().get_generation(), 1u);

    ASSERT_EQ(grid_.set_glyph(0, 0, 'X'), core::RenderError::None);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(orchestrator_.get_instance_rebuild_count(), 2u);
    EXPECT_EQ(orchestrator_.get_instance_builder().get_instances()[0].sprite, static_cast<uint32_t>('X'));
}

TEST_F(FrameOrchestratorTest, GridResizeRecreatesIntermediateOnce) {
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(orchestrator_.get_intermediate_recreate_count(), 1u);

    grid_.resize(100, 30);
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    }
    EXPECT_EQ(orchestrator_.get_intermediate_recreate_count(), 2u);
    EXPECT_EQ(orchestrator_.get_intermediate_target()->get_width(), 800u);
    EXPECT_EQ(orchestrator_.get_screen_pass().get_source(), orchestrator_.get_intermediate_target());
    EXPECT_EQ(orchestrator_.get_uniforms().get_cell_globals().screen_size_in_sprites[0], 100u);
    EXPECT_EQ(orchestrator_.get_instance_builder().instance_count(), 3000u);
}

TEST_F(FrameOrchestratorTest, RetiredIntermediateOutlivesFramesInFlight) {
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    const int live = device_.live_textures();

    grid_.resize(40, 10);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(device_.live_textures(), live + 1);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(device_.live_textures(), live + 1);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(device_.live_textures(), live);
}

TEST_F(FrameOrchestratorTest, WindowResizeLeavesGridTargetsAlone) {
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    graphics::Texture* intermediate = orchestrator_.get_intermediate_target();

    orchestrator_.request_resize(1000, 600);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);

    EXPECT_EQ(orchestrator_.get_intermediate_target(), intermediate);
    EXPECT_EQ(orchestrator_.get_intermediate_recreate_count(), 1u);
    EXPECT_EQ(orchestrator_.get_instance_rebuild_count(), 1u);
    EXPECT_EQ(orchestrator_.get_output_size(), glm::uvec2(1000, 600));

    const ScreenGlobals& screen = orchestrator_.get_uniforms().get_screen_globals();
    EXPECT_FLOAT_EQ(screen.screen_size_in_pixels[0], 1000.0f);
    EXPECT_FLOAT_EQ(screen.scale_factor[0], 0.96f);
    EXPECT_EQ(orchestrator_.get_uniforms().get_cell_globals().screen_size_in_sprites[0], 80u);
}

TEST_F(FrameOrchestratorTest, ZeroSizedResizeIsIgnored) {
    initialize();
    orchestrator_.request_resize(0, 0);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(orchestrator_.get_output_size(), glm::uvec2(960, 600));
}

TEST_F(FrameOrchestratorTest, TextureFailureSubmitsNothing) {
    initialize();
    const uint32_t submits = device_.submit_count;

    device_.fail_textures = true;
    EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
    EXPECT_EQ(device_.submit_count, submits);
    EXPECT_EQ(orchestrator_.get_state(), FrameState::Ready);
    EXPECT_EQ(orchestrator_.get_frame_index(), 0u);

    // Recovers once the device does
    device_.fail_textures = false;
    EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
}

TEST_F(FrameOrchestratorTest, ThrowingDeviceIsReported) {
    initialize();
    device_.throw_on_texture = true;
    EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
    EXPECT_EQ(orchestrator_.get_state(), FrameState::Ready);
}

TEST_F(FrameOrchestratorTest, OversizedGridIsRejected) {
    device_.set_max_texture_size(1024);
    initialize();
    CellGrid huge(200, 10);  // 1600 pixels wide
    EXPECT_EQ(orchestrator_.render_frame(huge), core::RenderError::ResourceCreationFailed);
}

TEST_F(FrameOrchestratorTest, EmptyGridIsRejected) {
    initialize();
    CellGrid empty;
    EXPECT_EQ(orchestrator_.render_frame(empty), core::RenderError::ResourceCreationFailed);
}

TEST_F(FrameOrchestratorTest, CaptureReturnsClearedOutput) {
    config_.clear_color = Color(10, 20, 30, 255);
    initialize();
    EXPECT_FALSE(orchestrator_.capture_output().has_value());  // Nothing presented yet

    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    auto pixels = orchestrator_.capture_output();
    ASSERT_TRUE(pixels.has_value());
    ASSERT_EQ(pixels->size(), 960u * 600u * 4u);
    EXPECT_EQ((*pixels)[0], 10);
    EXPECT_EQ((*pixels)[1], 20);
    EXPECT_EQ((*pixels)[2], 30);
    EXPECT_EQ((*pixels)[pixels->size() - 1], 255);
}

TEST_F(FrameOrchestratorTest, CaptureSurvivesFailedFrame) {
    config_.clear_color = Color(10, 20, 30, 255);
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);

    device_.fail_textures = true;
    grid_.resize(100, 30);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
    EXPECT_EQ(orchestrator_.get_state(), FrameState::Ready);
    EXPECT_TRUE(orchestrator_.has_presented());

    // The last presented image is still in the output texture
    auto pixels = orchestrator_.capture_output();
    ASSERT_TRUE(pixels.has_value());
    EXPECT_EQ((*pixels)[0], 10);
}

TEST_F(FrameOrchestratorTest, FramesInFlightBoundsUnwaitedSubmissions) {
    config_.frames_in_flight = 2;
    initialize();
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
        EXPECT_LE(device_.submits_in_flight, 2u);
    }
    EXPECT_EQ(device_.max_submits_in_flight, 2u);
    EXPECT_EQ(orchestrator_.get_frames_in_flight_wait_count(), 4u);
    EXPECT_LE(orchestrator_.get_frame_index() - orchestrator_.get_completed_frames(), 2u);
}

TEST_F(FrameOrchestratorTest, DeeperPipelineWaitsLess) {
    config_.frames_in_flight = 3;
    initialize();
    for (int i = 0; i < 9; ++i) {
        ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    }
    EXPECT_EQ(device_.max_submits_in_flight, 3u);
    EXPECT_EQ(orchestrator_.get_frames_in_flight_wait_count(), 2u);
}

TEST_F(FrameOrchestratorTest, CaptureCountsAsCompletion) {
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    ASSERT_TRUE(orchestrator_.capture_output().has_value());
    EXPECT_EQ(orchestrator_.get_completed_frames(), 1u);

    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(orchestrator_.get_frames_in_flight_wait_count(), 0u);
}

TEST_F(FrameOrchestratorTest, CursorMapsToCells) {
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(orchestrator_.cell_at({0.0f, 0.0f}), glm::uvec2(0, 0));
    EXPECT_EQ(orchestrator_.cell_at({959.0f, 599.0f}), glm::uvec2(79, 24));
}

TEST_F(FrameOrchestratorTest, MetalBackendLoadsMslEntryPoints) {
    device_.set_api_name("Metal");
    initialize();
    ASSERT_EQ(device_.shader_entry_points.size(), 4u);
    for (const auto& entry : device_.shader_entry_points) {
        EXPECT_EQ(entry, "main0");
    }
}

TEST_F(FrameOrchestratorTest, PostProcessingSetsEffectFlags) {
    config_.post_processing = true;
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(orchestrator_.get_uniforms().get_screen_globals().effect_flags,
              screen_effect::SCANLINES | screen_effect::VIGNETTE);
}

TEST_F(FrameOrchestratorTest, ShutdownReleasesResources) {
    initialize();
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    orchestrator_.shutdown();

    EXPECT_FALSE(orchestrator_.is_initialized());
    EXPECT_EQ(device_.live_buffers(), 0);
    EXPECT_EQ(device_.live_textures(), 1);  // The atlas belongs to the caller
}

// ============================================================================
// Swap Chain Presentation
// ============================================================================

TEST(FrameOrchestratorSwapChainTest, PresentsThroughSwapChain) {
    MockGraphicsDevice device(true, 960, 600);
    SpriteAtlas atlas;
    ASSERT_TRUE(atlas.initialize(&device, BuiltinFont::create_sheet(), ColorMode::Direct));

    FrameOrchestratorConfig config;
    config.fps_log_interval = 0;
    FrameOrchestrator orchestrator;
    ASSERT_EQ(orchestrator.initialize(&device, &atlas, config), core::RenderError::None);
    EXPECT_FALSE(orchestrator.is_offscreen());

    CellGrid grid(80, 25);
    ASSERT_EQ(orchestrator.render_frame(grid), core::RenderError::None);
    EXPECT_EQ(device.begin_frame_count, 1u);
    EXPECT_EQ(device.end_frame_count, 1u);
    EXPECT_FALSE(orchestrator.capture_output().has_value());

    orchestrator.request_resize(1280, 720);
    ASSERT_EQ(orchestrator.render_frame(grid), core::RenderError::None);
    EXPECT_EQ(device.swap_chain_resize_count, 1u);
    EXPECT_EQ(device.get_swap_chain()->get_width(), 1280u);
    EXPECT_EQ(orchestrator.get_intermediate_recreate_count(), 1u);
}

TEST(FrameOrchestratorSwapChainTest, NoSwapChainFallsBackToOffscreen) {
    MockGraphicsDevice device(false);
    SpriteAtlas atlas;
    ASSERT_TRUE(atlas.initialize(&device, BuiltinFont::create_sheet(), ColorMode::Direct));

    FrameOrchestrator orchestrator;
    ASSERT_EQ(orchestrator.initialize(&device, &atlas), core::RenderError::None);
    EXPECT_TRUE(orchestrator.is_offscreen());
}

class FrameOrchestratorAcquireTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(atlas_.initialize(&device_, BuiltinFont::create_sheet(), ColorMode::Direct));
        FrameOrchestratorConfig config;
        config.fps_log_interval = 0;
        ASSERT_EQ(orchestrator_.initialize(&device_, &atlas_, config), core::RenderError::None);
        ASSERT_FALSE(orchestrator_.is_offscreen());
    }

    MockGraphicsDevice device_{true, 960, 600};
    SpriteAtlas atlas_;
    FrameOrchestrator orchestrator_;
    CellGrid grid_{80, 25};
};

TEST_F(FrameOrchestratorAcquireTest, CommandBufferFailureDoesNotAcquire) {
    const uint32_t submits = device_.submit_count;  // Atlas upload
    device_.fail_command_buffers = true;
    EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
    EXPECT_EQ(device_.begin_frame_count, 0u);
    EXPECT_EQ(device_.end_frame_count, 0u);
    EXPECT_EQ(device_.submit_count, submits);
    EXPECT_EQ(orchestrator_.get_state(), FrameState::Ready);

    device_.fail_command_buffers = false;
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(device_.begin_frame_count, 1u);
    EXPECT_EQ(device_.end_frame_count, 1u);
    EXPECT_EQ(device_.unrendered_present_count, 0u);
}

TEST_F(FrameOrchestratorAcquireTest, ThrowingCommandPoolLeavesFramesBalanced) {
    device_.throw_on_command_buffer = true;
    for (int i = 0; i < 2; ++i) {
        EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
    }
    EXPECT_EQ(device_.begin_frame_count, 0u);
    EXPECT_EQ(device_.end_frame_count, 0u);
    EXPECT_FALSE(device_.get_mock_swap_chain()->is_acquired());
}

TEST_F(FrameOrchestratorAcquireTest, ThrowingSubmitStillEndsFrame) {
    device_.throw_on_submit = true;
    EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
    EXPECT_EQ(device_.begin_frame_count, 1u);
    EXPECT_EQ(device_.end_frame_count, 1u);
    EXPECT_FALSE(device_.get_mock_swap_chain()->is_acquired());
    EXPECT_EQ(orchestrator_.get_frame_index(), 0u);

    device_.throw_on_submit = false;
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(device_.begin_frame_count, 2u);
    EXPECT_EQ(device_.end_frame_count, 2u);
}

TEST_F(FrameOrchestratorAcquireTest, MissingDrawableReleasesAcquire) {
    const uint32_t submits = device_.submit_count;
    device_.get_mock_swap_chain()->drawable_lost = true;
    EXPECT_EQ(orchestrator_.render_frame(grid_), core::RenderError::ResourceCreationFailed);
    EXPECT_EQ(device_.begin_frame_count, 1u);
    EXPECT_EQ(device_.end_frame_count, 1u);
    EXPECT_EQ(device_.submit_count, submits);
    EXPECT_EQ(orchestrator_.get_frame_index(), 0u);

    device_.get_mock_swap_chain()->drawable_lost = false;
    ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    EXPECT_EQ(device_.submit_count, submits + 1);
}

TEST_F(FrameOrchestratorAcquireTest, SwapChainFramesAreBoundedToo) {
    for (int i = 0; i < 6; ++i) {
        ASSERT_EQ(orchestrator_.render_frame(grid_), core::RenderError::None);
    }
    EXPECT_EQ(device_.max_submits_in_flight, 2u);
    EXPECT_EQ(device_.unrendered_present_count, 0u);
}

// ============================================================================
// Palette Mode
// ============================================================================

TEST(FrameOrchestratorPaletteTest, UploadsPalettesOnlyWhenGridChanges) {
    MockGraphicsDevice device;
    SpriteAtlas atlas;
    ASSERT_TRUE(atlas.initialize(&device, BuiltinFont::create_sheet(15), ColorMode::Palette));

    FrameOrchestratorConfig config;
    config.fps_log_interval = 0;
    FrameOrchestrator orchestrator;
    ASSERT_EQ(orchestrator.initialize(&device, &atlas, config), core::RenderError::None);

    CellGrid grid(80, 25);
    ASSERT_EQ(orchestrator.render_frame(grid), core::RenderError::None);
    EXPECT_EQ(orchestrator.get_palette_texture().get_dimensions(), glm::uvec3(16, 80, 25));
    EXPECT_EQ(device.count_in_last_submission("copy_buffer_to_texture"), 1u);

    const CellGlobals& cell = orchestrator.get_uniforms().get_cell_globals();
    EXPECT_EQ(cell.palette_texture_dimensions[0], 16u);
    EXPECT_EQ(cell.palette_texture_dimensions[1], 80u);

    ASSERT_EQ(orchestrator.render_frame(grid), core::RenderError::None);
    EXPECT_EQ(device.count_in_last_submission("copy_buffer_to_texture"), 0u);

    Cell cell_value;
    cell_value.palette = Palette::mono(Color(255, 0, 0));
    ASSERT_EQ(grid.set(1, 1, cell_value), core::RenderError::None);
    ASSERT_EQ(orchestrator.render_frame(grid), core::RenderError::None);
    EXPECT_EQ(device.count_in_last_submission("copy_buffer_to_texture"), 1u);
    EXPECT_EQ(orchestrator.get_palette_texture().get_upload_count(), 2u);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(FrameOrchestratorConfigTest, DefaultsMatchConfigDefaults) {
    core::Config config;
    FrameOrchestratorConfig result = FrameOrchestratorConfig::from_config(config);
    FrameOrchestratorConfig defaults;

    EXPECT_EQ(result.output_size, defaults.output_size);
    EXPECT_EQ(result.frames_in_flight, defaults.frames_in_flight);
    EXPECT_FLOAT_EQ(result.instance_slack_factor, defaults.instance_slack_factor);
    EXPECT_EQ(result.scale_mode, ScaleMode::Fit);
    EXPECT_EQ(result.screen_filter, graphics::FilterMode::Nearest);
    EXPECT_EQ(result.clear_color, colors::BLACK);
    EXPECT_EQ(result.intermediate_clear_color, defaults.intermediate_clear_color);
    EXPECT_EQ(result.fps_log_interval, 1000u);
}

TEST(FrameOrchestratorConfigTest, ReadsOverrides) {
    core::Config config;
    ASSERT_TRUE(config.load_from_string(R"({
        "window": {"width": 1280, "height": 720},
        "renderer": {"frames_in_flight": 3, "scale_mode": "integer", "screen_filter": "linear",
                     "post_processing": true, "offscreen": true, "clear_color": "#10203040"},
        "debug": {"fps_log_interval": 0}
    })"));

    FrameOrchestratorConfig result = FrameOrchestratorConfig::from_config(config);
    EXPECT_EQ(result.output_size, glm::uvec2(1280, 720));
    EXPECT_EQ(result.frames_in_flight, 3u);
    EXPECT_EQ(result.scale_mode, ScaleMode::Integer);
    EXPECT_EQ(result.screen_filter, graphics::FilterMode::Linear);
    EXPECT_TRUE(result.post_processing);
    EXPECT_TRUE(result.offscreen);
    EXPECT_EQ(result.clear_color, Color(0x10, 0x20, 0x30, 0x40));
    EXPECT_EQ(result.fps_log_interval, 0u);
}

TEST(FrameOrchestratorConfigTest, InvalidValuesKeepDefaults) {
    core::Config config;
    ASSERT_TRUE(config.load_from_string(R"({
        "window": {"width": -5},
        "renderer": {"frames_in_flight": 0, "instance_slack_factor": 0.5, "scale_mode": "zoom",
                     "screen_filter": "bicubic", "clear_color": "nope"}
    })"));

    FrameOrchestratorConfig result = FrameOrchestratorConfig::from_config(config);
    FrameOrchestratorConfig defaults;
    EXPECT_EQ(result.output_size, defaults.output_size);
    EXPECT_EQ(result.frames_in_flight, defaults.frames_in_flight);
    EXPECT_FLOAT_EQ(result.instance_slack_factor, defaults.instance_slack_factor);
    EXPECT_EQ(result.scale_mode, ScaleMode::Fit);
    EXPECT_EQ(result.screen_filter, graphics::FilterMode::Nearest);
    EXPECT_EQ(result.clear_color, colors::BLACK);
}

TEST(FrameStateTest, Names) {
    EXPECT_STREQ(frame_state_name(FrameState::Presented), "presented");
    EXPECT_STREQ(frame_state_name(FrameState::Uninitialized), "uninitialized");
}

}  // namespace tessera::rendering::test
