// Tessera Rendering Core
// uniform_blocks.cpp - Uniform block derivation, scale factor and upload

#include <algorithm>
#include <cmath>
#include <cstring>
#include <exception>
#include <numeric>
#include <tessera/core/logger.hpp>
#include <tessera/rendering/uniform_blocks.hpp>

namespace tessera::rendering {

const char* scale_mode_name(ScaleMode mode) {
    switch (mode) {
        case ScaleMode::Fit:
            return "fit";
        case ScaleMode::Stretch:
            return "stretch";
        case ScaleMode::Integer:
            return "integer";
    }
    return "unknown";
}

std::optional<ScaleMode> parse_scale_mode(std::string_view name) {
    if (name == "fit") {
        return ScaleMode::Fit;
    }
    if (name == "stretch") {
        return ScaleMode::Stretch;
    }
    if (name == "integer") {
        return ScaleMode::Integer;
    }
    return std::nullopt;
}

// ============================================================================
// Scale Factor
// ============================================================================

namespace {

glm::vec2 fit_scale(glm::uvec2 output_size, glm::uvec2 intermediate_size) {
    // Reduce to the intermediate aspect ratio so the products stay small
    const uint32_t divisor = std::gcd(intermediate_size.x, intermediate_size.y);
    const uint64_t ax = intermediate_size.x / divisor;
    const uint64_t ay = intermediate_size.y / divisor;
    const uint64_t sw = output_size.x;
    const uint64_t sh = output_size.y;

    const uint64_t target_w = std::min(sw, (sh * ax) / ay);
    const uint64_t target_h = std::min(sh, (sw * ay) / ax);
    return glm::vec2(static_cast<float>(target_w) / static_cast<float>(sw),
                     static_cast<float>(target_h) / static_cast<float>(sh));
}

}  // namespace

glm::vec2 compute_scale_factor(glm::uvec2 output_size, glm::uvec2 intermediate_size, ScaleMode mode) {
    if (output_size.x == 0 || output_size.y == 0 || intermediate_size.x == 0 || intermediate_size.y == 0) {
        return glm::vec2(1.0f);
    }

    switch (mode) {
        case ScaleMode::Stretch:
            return glm::vec2(1.0f);

        case ScaleMode::Integer: {
            const uint32_t multiple =
                std::min(output_size.x / intermediate_size.x, output_size.y / intermediate_size.y);
            if (multiple == 0) {
                return fit_scale(output_size, intermediate_size);
            }
            return glm::vec2(static_cast<float>(intermediate_size.x * multiple) / static_cast<float>(output_size.x),
                             static_cast<float>(intermediate_size.y * multiple) / static_cast<float>(output_size.y));
        }

        case ScaleMode::Fit:
            break;
    }
    return fit_scale(output_size, intermediate_size);
}

std::optional<glm::uvec2> screen_to_cell(glm::vec2 position, glm::uvec2 output_size, glm::uvec2 grid_size,
                                         glm::vec2 scale_factor) {
    if (output_size.x == 0 || output_size.y == 0 || grid_size.x == 0 || grid_size.y == 0) {
        return std::nullopt;
    }

    const glm::vec2 surface(output_size);
    const glm::vec2 target = surface * scale_factor;
    const glm::vec2 offset = (surface - target) * 0.5f;
    const glm::vec2 local = (position - offset) / target;

    if (local.x < 0.0f || local.y < 0.0f || local.x >= 1.0f || local.y >= 1.0f) {
        return std::nullopt;
    }

    const glm::vec2 cell = glm::floor(local * glm::vec2(grid_size));
    return glm::min(glm::uvec2(cell), grid_size - glm::uvec2(1));
}

// ============================================================================
// Uniform Block Manager
// ============================================================================

UniformBlockManager::UniformBlockManager() = default;

UniformBlockManager::~UniformBlockManager() {
    shutdown();
}

bool UniformBlockManager::initialize(graphics::GraphicsDevice* device) {
    if (!device) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "UniformBlockManager requires a graphics device");
        return false;
    }

    try {
        graphics::BufferDesc cell_desc;
        cell_desc.size = sizeof(CellGlobals);
        cell_desc.usage = graphics::BufferUsage::Uniform;
        cell_desc.host_visible = true;
        cell_desc.debug_name = "CellGlobals";

        cell_buffer_ = device->create_buffer(cell_desc);
        if (!cell_buffer_) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create CellGlobals uniform buffer");
            shutdown();
            return false;
        }

        graphics::BufferDesc screen_desc;
        screen_desc.size = sizeof(ScreenGlobals);
        screen_desc.usage = graphics::BufferUsage::Uniform;
        screen_desc.host_visible = true;
        screen_desc.debug_name = "ScreenGlobals";

        screen_buffer_ = device->create_buffer(screen_desc);
        if (!screen_buffer_) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create ScreenGlobals uniform buffer");
            shutdown();
            return false;
        }
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Uniform buffer creation threw: {}", e.what());
        shutdown();
        return false;
    }

    cell_dirty_ = true;
    screen_dirty_ = true;
    has_uploaded_ = false;
    last_upload_frame_.reset();
    return true;
}

void UniformBlockManager::shutdown() {
    screen_buffer_.reset();
    cell_buffer_.reset();
}

void UniformBlockManager::update(const GlobalsUniform& globals) {
    const glm::uvec2 intermediate = globals.intermediate_size();
    if (!scale_valid_ || globals.output_size != scale_output_size_ || intermediate != scale_intermediate_size_ ||
        globals.scale_mode != scale_mode_) {
        scale_factor_ = compute_scale_factor(globals.output_size, intermediate, globals.scale_mode);
        scale_output_size_ = globals.output_size;
        scale_intermediate_size_ = intermediate;
        scale_mode_ = globals.scale_mode;
        scale_valid_ = true;
        ++scale_recompute_count_;
        TESSERA_LOG_DEBUG(core::log_category::RENDERING, "Scale factor ({:.4f}, {:.4f}) for {}x{} in {}x{} ({})",
                          scale_factor_.x, scale_factor_.y, intermediate.x, intermediate.y, globals.output_size.x,
                          globals.output_size.y, scale_mode_name(globals.scale_mode));
    }

    CellGlobals cell{};
    cell.screen_size_in_sprites[0] = globals.grid_size.x;
    cell.screen_size_in_sprites[1] = globals.grid_size.y;
    cell.sprite_map_dimensions[0] = globals.atlas_dimensions.x;
    cell.sprite_map_dimensions[1] = globals.atlas_dimensions.y;
    cell.sprite_texture_dimensions[0] = globals.atlas_texture_size.x;
    cell.sprite_texture_dimensions[1] = globals.atlas_texture_size.y;
    cell.sprite_dimensions[0] = globals.cell_pixel_size.x;
    cell.sprite_dimensions[1] = globals.cell_pixel_size.y;
    cell.palette_texture_dimensions[0] = globals.palette_texture_dimensions.x;
    cell.palette_texture_dimensions[1] = globals.palette_texture_dimensions.y;

    ScreenGlobals screen{};
    screen.screen_size_in_pixels[0] = static_cast<float>(globals.output_size.x);
    screen.screen_size_in_pixels[1] = static_cast<float>(globals.output_size.y);
    screen.scale_factor[0] = scale_factor_.x;
    screen.scale_factor[1] = scale_factor_.y;
    screen.frame_counter = globals.frame_counter;
    screen.elapsed_time = globals.elapsed_time;
    screen.effect_flags = globals.effect_flags;

    cell_globals_ = cell;
    screen_globals_ = screen;
    cell_dirty_ = !has_uploaded_ || std::memcmp(&cell_globals_, &uploaded_cell_, sizeof(CellGlobals)) != 0;
    screen_dirty_ = !has_uploaded_ || std::memcmp(&screen_globals_, &uploaded_screen_, sizeof(ScreenGlobals)) != 0;
}

core::RenderError UniformBlockManager::upload(uint64_t frame_index) {
    if (!cell_buffer_ || !screen_buffer_) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "UniformBlockManager::upload before initialize");
        return core::RenderError::ResourceCreationFailed;
    }
    if (last_upload_frame_ && *last_upload_frame_ == frame_index) {
        return core::RenderError::None;
    }

    if (cell_dirty_) {
        cell_buffer_->write(&cell_globals_, sizeof(CellGlobals));
        uploaded_cell_ = cell_globals_;
        cell_dirty_ = false;
        ++cell_write_count_;
    }
    if (screen_dirty_) {
        screen_buffer_->write(&screen_globals_, sizeof(ScreenGlobals));
        uploaded_screen_ = screen_globals_;
        screen_dirty_ = false;
        ++screen_write_count_;
    }

    has_uploaded_ = true;
    last_upload_frame_ = frame_index;
    return core::RenderError::None;
}

}  // namespace tessera::rendering
