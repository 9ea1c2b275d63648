// Tessera Rendering Core
// instance_buffer.cpp - Instance record generation and buffer growth

#include <cmath>
#include <exception>
#include <tessera/core/logger.hpp>
#include <tessera/rendering/instance_buffer.hpp>

namespace tessera::rendering {

InstanceBufferBuilder::InstanceBufferBuilder() = default;

InstanceBufferBuilder::~InstanceBufferBuilder() {
    shutdown();
}

bool InstanceBufferBuilder::initialize(graphics::GraphicsDevice* device, const InstanceBufferConfig& config) {
    if (device_ != nullptr) {
        TESSERA_LOG_WARN(core::log_category::RENDERING, "InstanceBufferBuilder already initialized");
        return false;
    }
    if (!device) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "InstanceBufferBuilder requires a graphics device");
        return false;
    }

    device_ = device;
    config_ = config;
    if (config_.frames_in_flight == 0) {
        config_.frames_in_flight = 1;
    }
    if (config_.slack_factor < 1.0f) {
        TESSERA_LOG_WARN(core::log_category::RENDERING, "Instance slack factor {} below 1.0, using 1.0",
                         config_.slack_factor);
        config_.slack_factor = 1.0f;
    }
    return true;
}

void InstanceBufferBuilder::shutdown() {
    if (device_ && (!retired_.empty() || buffer_)) {
        device_->wait_idle();
    }
    retired_.release_all();
    buffer_.reset();
    capacity_ = 0;
    device_ = nullptr;
}

// ============================================================================
// CPU Build
// ============================================================================

void InstanceBufferBuilder::build(const CellGrid& grid, const AtlasLayout& layout) {
    const uint32_t width = grid.get_width();
    const uint32_t height = grid.get_height();

    instances_.clear();
    instances_.reserve(grid.size());
    invalid_glyph_count_ = 0;

    if (grid.empty()) {
        return;
    }

    const float step_x = 2.0f / static_cast<float>(width);
    const float step_y = 2.0f / static_cast<float>(height);

    for (const auto& entry : grid.cells()) {
        uint32_t glyph = entry.cell.glyph_index;
        if (!layout.contains(glyph)) {
            if (!invalid_glyph_logged_) {
                TESSERA_LOG_WARN(core::log_category::RENDERING,
                                 "Glyph index {} at ({}, {}) is outside the {}-tile atlas; drawing tile 0", glyph,
                                 entry.x, entry.y, layout.cell_count());
                invalid_glyph_logged_ = true;
            }
            ++invalid_glyph_count_;
            glyph = 0;
        }

        const glm::vec2 uv = layout.uv_base(glyph);

        CellInstance instance{};
        instance.translate[0] = -1.0f + static_cast<float>(entry.x) * step_x;
        instance.translate[1] = 1.0f - static_cast<float>(entry.y + 1) * step_y;
        instance.uv_base[0] = uv.x;
        instance.uv_base[1] = uv.y;
        instance.cell_coords[0] = entry.x;
        instance.cell_coords[1] = entry.y;
        instance.sprite = glyph;
        instance.index = entry.y * width + entry.x;
        instance.fg_color = entry.cell.fg_color.pack_rgba8();
        instance.bg_color = entry.cell.bg_color.pack_rgba8();
        instances_.push_back(instance);
    }
}

std::span<const uint8_t> InstanceBufferBuilder::get_bytes() const {
    return {reinterpret_cast<const uint8_t*>(instances_.data()), instances_.size() * sizeof(CellInstance)};
}

// ============================================================================
// GPU Upload
// ============================================================================

core::RenderError InstanceBufferBuilder::upload(uint64_t frame_index) {
    if (!device_) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "InstanceBufferBuilder::upload before initialize");
        return core::RenderError::ResourceCreationFailed;
    }

    const uint32_t required = instance_count();
    if (required == 0) {
        return core::RenderError::None;
    }

    if (!buffer_ || required > capacity_) {
        if (!grow(required, frame_index)) {
            return core::RenderError::ResourceCreationFailed;
        }
    }

    auto bytes = get_bytes();
    buffer_->write(bytes.data(), bytes.size());
    return core::RenderError::None;
}

bool InstanceBufferBuilder::grow(uint32_t required, uint64_t frame_index) {
    const auto new_capacity =
        static_cast<uint32_t>(std::ceil(static_cast<double>(required) * static_cast<double>(config_.slack_factor)));

    graphics::BufferDesc desc;
    desc.size = static_cast<size_t>(new_capacity) * sizeof(CellInstance);
    desc.usage = graphics::BufferUsage::Vertex;
    desc.host_visible = true;
    desc.debug_name = "CellInstances";

    std::unique_ptr<graphics::Buffer> buffer;
    try {
        buffer = device_->create_buffer(desc);
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Instance buffer allocation threw: {}", e.what());
        return false;
    }
    if (!buffer) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to allocate instance buffer ({} records, {} bytes)",
                          new_capacity, desc.size);
        return false;
    }

    if (buffer_) {
        if (retired_.full()) {
            TESSERA_LOG_DEBUG(core::log_category::RENDERING,
                              "Instance retirement queue full; waiting for the device to drain");
            device_->wait_idle();
            retired_.release_all();
        }
        if (!retired_.retire(buffer_, frame_index)) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING,
                              "Instance buffer could not be retired; releasing after idle");
            device_->wait_idle();
            buffer_.reset();
        }
    }

    TESSERA_LOG_DEBUG(core::log_category::RENDERING, "Instance buffer grown to {} records (needed {})", new_capacity,
                      required);
    buffer_ = std::move(buffer);
    capacity_ = new_capacity;
    ++generation_;
    return true;
}

size_t InstanceBufferBuilder::collect_retired(uint64_t frame_index) {
    return retired_.collect(frame_index, config_.frames_in_flight);
}

size_t InstanceBufferBuilder::release_all_retired() {
    return retired_.release_all();
}

}  // namespace tessera::rendering
