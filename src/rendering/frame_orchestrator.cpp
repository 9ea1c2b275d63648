// Tessera Rendering Core
// frame_orchestrator.cpp - Frame sequencing, target recreation and presentation

#include <algorithm>
#include <exception>
#include <tessera/core/logger.hpp>
#include <tessera/graphics/command_buffer.hpp>
#include <tessera/graphics/swap_chain.hpp>
#include <tessera/rendering/cell_vertex.hpp>
#include <tessera/rendering/frame_orchestrator.hpp>

namespace tessera::rendering {

// ============================================================================
// Configuration
// ============================================================================

FrameOrchestratorConfig FrameOrchestratorConfig::from_config(const core::Config& config) {
    namespace section = core::config_section;
    namespace key = core::config_key;

    FrameOrchestratorConfig result;

    const int width = config.get_int(section::WINDOW, key::WIDTH, static_cast<int>(result.output_size.x));
    const int height = config.get_int(section::WINDOW, key::HEIGHT, static_cast<int>(result.output_size.y));
    if (width > 0 && height > 0) {
        result.output_size = glm::uvec2(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    } else {
        TESSERA_LOG_WARN(core::log_category::CONFIG, "Invalid window size {}x{}, using {}x{}", width, height,
                         result.output_size.x, result.output_size.y);
    }

    const int frames_in_flight = config.get_int(section::RENDERER, key::FRAMES_IN_FLIGHT,
                                                static_cast<int>(result.frames_in_flight));
    if (frames_in_flight >= 1 && frames_in_flight <= 8) {
        result.frames_in_flight = static_cast<uint32_t>(frames_in_flight);
    } else {
        TESSERA_LOG_WARN(core::log_category::CONFIG, "frames_in_flight {} outside [1, 8], using {}", frames_in_flight,
                         result.frames_in_flight);
    }

    const float slack =
        config.get_float(section::RENDERER, key::INSTANCE_SLACK_FACTOR, result.instance_slack_factor);
    if (slack >= 1.0f) {
        result.instance_slack_factor = slack;
    } else {
        TESSERA_LOG_WARN(core::log_category::CONFIG, "instance_slack_factor {} below 1.0, using {}", slack,
                         result.instance_slack_factor);
    }

    const std::string scale_mode = config.get_string(section::RENDERER, key::SCALE_MODE, "fit");
    if (auto mode = parse_scale_mode(scale_mode)) {
        result.scale_mode = *mode;
    } else {
        TESSERA_LOG_WARN(core::log_category::CONFIG, "Unknown scale_mode '{}', using fit", scale_mode);
    }

    const std::string filter = config.get_string(section::RENDERER, key::SCREEN_FILTER, "nearest");
    if (filter == "linear") {
        result.screen_filter = graphics::FilterMode::Linear;
    } else if (filter != "nearest") {
        TESSERA_LOG_WARN(core::log_category::CONFIG, "Unknown screen_filter '{}', using nearest", filter);
    }

    result.post_processing = config.get_bool(section::RENDERER, key::POST_PROCESSING, result.post_processing);
    result.offscreen = config.get_bool(section::RENDERER, key::OFFSCREEN, result.offscreen);

    const std::string clear = config.get_string(section::RENDERER, key::CLEAR_COLOR, "#000000ff");
    if (auto color = Color::from_hex_string(clear)) {
        result.clear_color = *color;
    } else {
        TESSERA_LOG_WARN(core::log_category::CONFIG, "Invalid clear_color '{}'", clear);
    }

    const std::string intermediate_clear =
        config.get_string(section::RENDERER, key::INTERMEDIATE_CLEAR_COLOR, "#1a0000ff");
    if (auto color = Color::from_hex_string(intermediate_clear)) {
        result.intermediate_clear_color = *color;
    } else {
        TESSERA_LOG_WARN(core::log_category::CONFIG, "Invalid intermediate_clear_color '{}'", intermediate_clear);
    }

    const int fps_interval = config.get_int(section::DEBUG, key::FPS_LOG_INTERVAL,
                                            static_cast<int>(result.fps_log_interval));
    result.fps_log_interval = fps_interval > 0 ? static_cast<uint32_t>(fps_interval) : 0;

    return result;
}

const char* frame_state_name(FrameState state) {
    switch (state) {
        case FrameState::Uninitialized:
            return "uninitialized";
        case FrameState::Ready:
            return "ready";
        case FrameState::Rendering:
            return "rendering";
        case FrameState::Presented:
            return "presented";
    }
    return "unknown";
}

// ============================================================================
// Lifecycle
// ============================================================================

FrameOrchestrator::FrameOrchestrator() = default;

FrameOrchestrator::~FrameOrchestrator() {
    shutdown();
}

core::RenderError FrameOrchestrator::initialize(graphics::GraphicsDevice* device, const SpriteAtlas* atlas,
                                                const FrameOrchestratorConfig& config) {
    if (state_ != FrameState::Uninitialized) {
        TESSERA_LOG_WARN(core::log_category::RENDERING, "FrameOrchestrator already initialized");
        return core::RenderError::None;
    }
    if (!device) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "FrameOrchestrator requires a graphics device");
        return core::RenderError::ResourceCreationFailed;
    }
    if (!atlas || !atlas->is_initialized()) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "FrameOrchestrator requires an initialized sprite atlas");
        return core::RenderError::MissingBinding;
    }

    device_ = device;
    atlas_ = atlas;
    config_ = config;
    output_size_ = config.output_size;

    graphics::SwapChain* swap_chain = device_->get_swap_chain();
    offscreen_ = config.offscreen || swap_chain == nullptr;
    if (!config.offscreen && swap_chain == nullptr) {
        TESSERA_LOG_INFO(core::log_category::RENDERING, "Device has no swap chain; rendering offscreen");
    }
    output_format_ = offscreen_ ? graphics::TextureFormat::RGBA8Unorm : swap_chain->get_format();

    core::RenderError error = cell_pass_.initialize(device_, atlas_, graphics::TextureFormat::RGBA8Unorm);
    if (error != core::RenderError::None) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to initialize cell pass: {}",
                          core::render_error_name(error));
        shutdown();
        return error;
    }

    ScreenPassConfig screen_config;
    screen_config.filter = config_.screen_filter;
    screen_config.clear_color = config_.clear_color;
    error = screen_pass_.initialize(device_, output_format_, screen_config);
    if (error != core::RenderError::None) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to initialize screen pass: {}",
                          core::render_error_name(error));
        shutdown();
        return error;
    }

    InstanceBufferConfig instance_config;
    instance_config.frames_in_flight = config_.frames_in_flight;
    instance_config.slack_factor = config_.instance_slack_factor;
    if (!instances_.initialize(device_, instance_config) || !uniforms_.initialize(device_)) {
        shutdown();
        return core::RenderError::ResourceCreationFailed;
    }

    if (atlas_->uses_palette() && !palette_texture_.initialize(device_, config_.frames_in_flight)) {
        shutdown();
        return core::RenderError::ResourceCreationFailed;
    }

    try {
        if (!create_static_geometry()) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create quad geometry");
            shutdown();
            return core::RenderError::ResourceCreationFailed;
        }
        if (offscreen_) {
            output_texture_ = create_output_texture(output_size_);
            if (!output_texture_) {
                shutdown();
                return core::RenderError::ResourceCreationFailed;
            }
        }
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Frame resource creation threw: {}", e.what());
        shutdown();
        return core::RenderError::ResourceCreationFailed;
    }

    frame_timer_.reset();
    state_ = FrameState::Ready;

    TESSERA_LOG_INFO(core::log_category::RENDERING, "FrameOrchestrator ready on {} ({}x{}, {}, {} frames in flight)",
                     device_->get_backend_name(), output_size_.x, output_size_.y,
                     offscreen_ ? "offscreen" : "swap chain", config_.frames_in_flight);
    return core::RenderError::None;
}

void FrameOrchestrator::shutdown() {
    if (device_ == nullptr) {
        return;
    }

    device_->wait_idle();
    completed_frames_ = frame_index_;
    retired_textures_.release_all();

    palette_texture_.shutdown();
    instances_.shutdown();
    uniforms_.shutdown();
    screen_pass_.shutdown();
    cell_pass_.shutdown();

    output_texture_.reset();
    intermediate_.reset();
    quad_index_buffer_.reset();
    screen_quad_buffer_.reset();
    cell_quad_buffer_.reset();

    pending_output_size_.reset();
    grid_size_ = glm::uvec2(0);
    last_grid_ = nullptr;
    geometry_changed_ = true;
    palette_dirty_ = false;
    has_presented_ = false;

    device_ = nullptr;
    atlas_ = nullptr;
    state_ = FrameState::Uninitialized;
}

bool FrameOrchestrator::create_static_geometry() {
    graphics::BufferDesc cell_desc;
    cell_desc.size = sizeof(CELL_QUAD_VERTICES);
    cell_desc.usage = graphics::BufferUsage::Vertex;
    cell_desc.initial_data = CELL_QUAD_VERTICES.data();
    cell_desc.debug_name = "CellQuad";
    cell_quad_buffer_ = device_->create_buffer(cell_desc);

    graphics::BufferDesc screen_desc;
    screen_desc.size = sizeof(SCREEN_QUAD_VERTICES);
    screen_desc.usage = graphics::BufferUsage::Vertex;
    screen_desc.initial_data = SCREEN_QUAD_VERTICES.data();
    screen_desc.debug_name = "ScreenQuad";
    screen_quad_buffer_ = device_->create_buffer(screen_desc);

    graphics::BufferDesc index_desc;
    index_desc.size = sizeof(QUAD_INDICES);
    index_desc.usage = graphics::BufferUsage::Index;
    index_desc.initial_data = QUAD_INDICES.data();
    index_desc.debug_name = "QuadIndices";
    quad_index_buffer_ = device_->create_buffer(index_desc);

    return cell_quad_buffer_ && screen_quad_buffer_ && quad_index_buffer_;
}

std::unique_ptr<graphics::Texture> FrameOrchestrator::create_output_texture(glm::uvec2 size) {
    graphics::TextureDesc desc;
    desc.type = graphics::TextureType::Texture2D;
    desc.format = graphics::TextureFormat::RGBA8Unorm;
    desc.width = size.x;
    desc.height = size.y;
    desc.usage = graphics::TextureUsage::RenderTarget | graphics::TextureUsage::TransferSrc;
    desc.debug_name = "OffscreenOutput";

    auto texture = device_->create_texture(desc);
    if (!texture) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create {}x{} offscreen output", size.x, size.y);
    }
    return texture;
}

// ============================================================================
// Per Frame
// ============================================================================

void FrameOrchestrator::request_resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        // Minimized windows report zero; keep the last usable size
        TESSERA_LOG_DEBUG(core::log_category::RENDERING, "Ignoring resize to {}x{}", width, height);
        return;
    }
    pending_output_size_ = glm::uvec2(width, height);
}

core::RenderError FrameOrchestrator::render_frame(const CellGrid& grid) {
    if (state_ == FrameState::Uninitialized) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "render_frame called before initialize");
        return core::RenderError::ResourceCreationFailed;
    }

    state_ = FrameState::Rendering;
    frame_submitted_ = false;
    core::RenderError error = core::RenderError::None;

    try {
        // 1. Deferred window resize
        error = apply_pending_resize();

        // 2. Frame-boundary sync point
        if (error == core::RenderError::None) {
            enforce_frames_in_flight();
            instances_.collect_retired(frame_index_);
            retired_textures_.collect(frame_index_, config_.frames_in_flight);
            // A Building pass was recorded by a failed frame and dropped unsubmitted
            if (cell_pass_.get_state() != PassState::Idle) {
                cell_pass_.mark_complete();
            }
        }

        // 3. Grid-size dependent targets
        const glm::uvec2 grid_size(grid.get_width(), grid.get_height());
        if (error == core::RenderError::None && grid_size != grid_size_) {
            error = recreate_grid_targets(grid_size);
        }

        // 4. Instance records
        if (error == core::RenderError::None &&
            (geometry_changed_ || &grid != last_grid_ || grid.get_revision() != last_revision_)) {
            instances_.build(grid, atlas_->get_layout());
            error = instances_.upload(frame_index_);
            if (error == core::RenderError::None) {
                palette_dirty_ = atlas_->uses_palette();
                last_grid_ = &grid;
                last_revision_ = grid.get_revision();
                geometry_changed_ = false;
                ++instance_rebuild_count_;
            }
        }

        // 5. Uniform blocks
        if (error == core::RenderError::None) {
            const AtlasLayout& layout = atlas_->get_layout();

            GlobalsUniform globals;
            globals.output_size = output_size_;
            globals.cell_pixel_size = layout.cell_pixel_size;
            globals.grid_size = grid_size_;
            globals.atlas_dimensions = glm::uvec2(layout.columns, layout.rows);
            globals.atlas_texture_size = layout.texture_size;
            globals.palette_texture_dimensions = palette_texture_.get_dimensions();
            globals.frame_counter = frame_counter_;
            globals.elapsed_time = elapsed_time_;
            globals.effect_flags =
                config_.post_processing ? (screen_effect::SCANLINES | screen_effect::VIGNETTE) : screen_effect::NONE;
            globals.scale_mode = config_.scale_mode;

            uniforms_.update(globals);
            error = uniforms_.upload(frame_index_);
        }

        // 6. Record, submit, present
        if (error == core::RenderError::None) {
            error = record_and_submit(grid);
        }
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Frame {} aborted: {}", frame_index_, e.what());
        error = core::RenderError::ResourceCreationFailed;
    }

    // 7. Counters. A submitted frame owns its ring slots even when it failed.
    if (frame_submitted_) {
        advance_frame();
    }
    if (error != core::RenderError::None) {
        state_ = FrameState::Ready;
        return error;
    }

    has_presented_ = true;
    state_ = FrameState::Presented;
    return core::RenderError::None;
}

core::RenderError FrameOrchestrator::apply_pending_resize() {
    if (!pending_output_size_) {
        return core::RenderError::None;
    }

    const glm::uvec2 size = *pending_output_size_;
    pending_output_size_.reset();
    if (size == output_size_) {
        return core::RenderError::None;
    }

    if (offscreen_) {
        auto texture = create_output_texture(size);
        if (!texture) {
            return core::RenderError::ResourceCreationFailed;
        }
        retire_texture(std::move(output_texture_));
        output_texture_ = std::move(texture);
        has_presented_ = false;
    } else {
        device_->resize_swap_chain(size.x, size.y);
    }

    TESSERA_LOG_DEBUG(core::log_category::RENDERING, "Output resized {}x{} -> {}x{}", output_size_.x, output_size_.y,
                      size.x, size.y);
    output_size_ = size;
    return core::RenderError::None;
}

core::RenderError FrameOrchestrator::recreate_grid_targets(glm::uvec2 grid_size) {
    if (grid_size.x == 0 || grid_size.y == 0) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cannot render an empty {}x{} grid", grid_size.x,
                          grid_size.y);
        return core::RenderError::ResourceCreationFailed;
    }

    const glm::uvec2 pixels = grid_size * atlas_->get_layout().cell_pixel_size;
    const uint32_t max_size = device_->get_capabilities().max_texture_size_2d;
    if (max_size != 0 && (pixels.x > max_size || pixels.y > max_size)) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Intermediate target {}x{} exceeds device limit {}",
                          pixels.x, pixels.y, max_size);
        return core::RenderError::ResourceCreationFailed;
    }

    graphics::TextureDesc desc;
    desc.type = graphics::TextureType::Texture2D;
    desc.format = graphics::TextureFormat::RGBA8Unorm;
    desc.width = pixels.x;
    desc.height = pixels.y;
    desc.usage = graphics::TextureUsage::Sampled | graphics::TextureUsage::RenderTarget;
    desc.debug_name = "IntermediateTarget";

    auto target = device_->create_texture(desc);
    if (!target) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create {}x{} intermediate target", pixels.x,
                          pixels.y);
        return core::RenderError::ResourceCreationFailed;
    }

    if (atlas_->uses_palette()) {
        // Old staging buffers are freed by resize(), so no copy from them may be pending
        if (palette_texture_.get_texture()) {
            device_->wait_idle();
            completed_frames_ = frame_index_;
        }
        core::RenderError error = palette_texture_.resize(grid_size.x, grid_size.y);
        if (error != core::RenderError::None) {
            return error;
        }
        retire_texture(palette_texture_.release_previous());
    }

    retire_texture(std::move(intermediate_));
    intermediate_ = std::move(target);
    screen_pass_.set_source(intermediate_.get());

    TESSERA_LOG_DEBUG(core::log_category::RENDERING, "Intermediate target recreated at {}x{} for {}x{} grid",
                      pixels.x, pixels.y, grid_size.x, grid_size.y);
    grid_size_ = grid_size;
    geometry_changed_ = true;
    ++intermediate_recreate_count_;
    return core::RenderError::None;
}

void FrameOrchestrator::retire_texture(std::unique_ptr<graphics::Texture> texture) {
    if (!texture) {
        return;
    }
    if (retired_textures_.full()) {
        device_->wait_idle();
        retired_textures_.release_all();
    }
    if (!retired_textures_.retire(texture, frame_index_)) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Texture retirement failed; releasing after idle");
        device_->wait_idle();
        texture.reset();
    }
}

namespace {

// Pairs begin_frame() with exactly one end_frame(), including when recording throws
class FrameAcquisition {
public:
    explicit FrameAcquisition(graphics::GraphicsDevice* device) : device_(device) { device_->begin_frame(); }

    ~FrameAcquisition() {
        if (!device_) {
            return;
        }
        try {
            device_->end_frame();
        } catch (const std::exception& e) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "end_frame failed during unwind: {}", e.what());
        }
    }

    FrameAcquisition(const FrameAcquisition&) = delete;
    FrameAcquisition& operator=(const FrameAcquisition&) = delete;

    void present() {
        graphics::GraphicsDevice* device = device_;
        device_ = nullptr;
        device->end_frame();
    }

private:
    graphics::GraphicsDevice* device_;
};

}  // namespace

core::RenderError FrameOrchestrator::record_and_submit(const CellGrid& grid) {
    CellPassInputs cell_inputs;
    cell_inputs.target = intermediate_.get();
    cell_inputs.quad_vertices = cell_quad_buffer_.get();
    cell_inputs.quad_indices = quad_index_buffer_.get();
    cell_inputs.instances = instances_.get_buffer();
    cell_inputs.instance_count = instances_.instance_count();
    cell_inputs.globals = uniforms_.get_cell_buffer();
    cell_inputs.palette = palette_texture_.get_texture();
    cell_inputs.clear_color = config_.intermediate_clear_color;

    core::RenderError error = cell_pass_.validate(cell_inputs);
    if (error != core::RenderError::None) {
        return error;
    }

    graphics::SwapChain* swap_chain = offscreen_ ? nullptr : device_->get_swap_chain();
    if (!offscreen_ && !swap_chain) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Swap chain lost");
        return core::RenderError::ResourceCreationFailed;
    }

    // Everything that can fail without a drawable happens before the acquire
    auto cmd = device_->create_command_buffer();
    if (!cmd) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create frame command buffer");
        return core::RenderError::ResourceCreationFailed;
    }
    cmd->begin();

    if (palette_dirty_) {
        error = palette_texture_.upload(grid, cmd.get(), frame_index_);
    }
    if (error == core::RenderError::None) {
        error = cell_pass_.record(cmd.get(), cell_inputs);
    }
    if (error != core::RenderError::None) {
        // Recorded work is dropped unsubmitted
        return error;
    }

    ScreenPassInputs screen_inputs;
    screen_inputs.quad_vertices = screen_quad_buffer_.get();
    screen_inputs.quad_indices = quad_index_buffer_.get();
    screen_inputs.globals = uniforms_.get_screen_buffer();

    if (offscreen_) {
        screen_inputs.output = output_texture_.get();
        error = screen_pass_.record(cmd.get(), screen_inputs);
        cmd->end();
        if (error != core::RenderError::None) {
            return error;
        }
        submit_frame(cmd.get());
        return core::RenderError::None;
    }

    FrameAcquisition acquisition(device_);
    screen_inputs.output = swap_chain->get_current_texture();
    if (!screen_inputs.output) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Swap chain returned no drawable");
        return core::RenderError::ResourceCreationFailed;
    }

    error = screen_pass_.record(cmd.get(), screen_inputs);
    if (error != core::RenderError::None) {
        // The acquired image is presented cleared rather than with undefined contents
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Screen pass failed ({}); presenting a cleared image",
                          core::render_error_name(error));
        const core::RenderError clear_error = screen_pass_.record_clear(cmd.get(), screen_inputs.output);
        if (clear_error != core::RenderError::None) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Clear fallback failed: {}",
                              core::render_error_name(clear_error));
        }
    }
    cmd->end();

    submit_frame(cmd.get());
    acquisition.present();
    return error;
}

void FrameOrchestrator::submit_frame(graphics::CommandBuffer* cmd) {
    device_->submit(cmd, false);
    frame_submitted_ = true;
    cell_pass_.mark_submitted();
    palette_dirty_ = false;
}

void FrameOrchestrator::enforce_frames_in_flight() {
    // Per-frame ring slots of frame N are reused by frame N + frames_in_flight
    if (frame_index_ >= completed_frames_ + config_.frames_in_flight) {
        device_->wait_idle();
        completed_frames_ = frame_index_;
        ++frames_in_flight_wait_count_;
    }
}

void FrameOrchestrator::advance_frame() {
    ++frame_index_;
    ++frame_counter_;  // Wraps at 2^32
    frame_timer_.tick();
    elapsed_time_ += static_cast<float>(frame_timer_.get_delta_time());

    if (config_.fps_log_interval != 0 && frame_index_ % config_.fps_log_interval == 0) {
        TESSERA_LOG_INFO(core::log_category::RENDERING, "{:.1f} fps ({:.2f} ms/frame) at frame {}",
                         frame_timer_.get_fps(), 1000.0 / std::max(frame_timer_.get_fps(), 1e-6), frame_index_);
    }
}

// ============================================================================
// Output
// ============================================================================

std::optional<std::vector<uint8_t>> FrameOrchestrator::capture_output() {
    if (!offscreen_ || !output_texture_) {
        TESSERA_LOG_WARN(core::log_category::RENDERING, "capture_output needs offscreen rendering");
        return std::nullopt;
    }
    if (!has_presented_) {
        TESSERA_LOG_WARN(core::log_category::RENDERING, "capture_output before any frame was presented");
        return std::nullopt;
    }

    const uint32_t width = output_texture_->get_width();
    const uint32_t height = output_texture_->get_height();
    std::vector<uint8_t> pixels(output_texture_->get_byte_size());

    try {
        graphics::BufferDesc desc;
        desc.size = pixels.size();
        desc.usage = graphics::BufferUsage::TransferDst;
        desc.host_visible = true;
        desc.debug_name = "CaptureReadback";

        auto readback = device_->create_buffer(desc);
        auto cmd = device_->create_command_buffer();
        if (!readback || !cmd) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create capture resources");
            return std::nullopt;
        }

        cmd->begin();
        graphics::BufferImageCopy region;
        region.texture_width = width;
        region.texture_height = height;
        cmd->copy_texture_to_buffer(output_texture_.get(), readback.get(), region);
        cmd->end();
        device_->submit(cmd.get(), true);
        completed_frames_ = frame_index_;

        readback->read(pixels.data(), pixels.size());
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Output capture failed: {}", e.what());
        return std::nullopt;
    }
    return pixels;
}

std::optional<glm::uvec2> FrameOrchestrator::cell_at(glm::vec2 position) const {
    return screen_to_cell(position, output_size_, grid_size_, uniforms_.get_scale_factor());
}

}  // namespace tessera::rendering
