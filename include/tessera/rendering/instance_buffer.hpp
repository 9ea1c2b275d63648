// Tessera Rendering Core
// instance_buffer.hpp - Per-cell instance records and their growable GPU buffer

#pragma once

#include "cell_grid.hpp"
#include "cell_vertex.hpp"
#include "retirement_queue.hpp"
#include "sprite_atlas.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <tessera/core/error.hpp>
#include <tessera/graphics/buffer.hpp>
#include <tessera/graphics/device.hpp>
#include <vector>

namespace tessera::rendering {

struct InstanceBufferConfig {
    uint32_t frames_in_flight = 2;  // Frames a retired buffer must outlive
    float slack_factor = 1.5f;      // Growth headroom when the buffer is reallocated
};

// Converts a CellGrid into CellInstance records (CPU) and keeps a host-visible
// vertex buffer large enough to hold them (GPU). Outgrown buffers are retired,
// not destroyed, until the frames that may still read them have completed.
class InstanceBufferBuilder {
public:
    static constexpr size_t RETIREMENT_CAPACITY = 8;

    InstanceBufferBuilder();
    ~InstanceBufferBuilder();

    // Non-copyable
    InstanceBufferBuilder(const InstanceBufferBuilder&) = delete;
    InstanceBufferBuilder& operator=(const InstanceBufferBuilder&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    bool initialize(graphics::GraphicsDevice* device, const InstanceBufferConfig& config = {});
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return device_ != nullptr; }

    // ========================================================================
    // CPU Build
    // ========================================================================

    // One record per cell in row-major order. Usable without a device.
    void build(const CellGrid& grid, const AtlasLayout& layout);

    [[nodiscard]] const std::vector<CellInstance>& get_instances() const { return instances_; }
    [[nodiscard]] std::span<const uint8_t> get_bytes() const;
    [[nodiscard]] uint32_t instance_count() const { return static_cast<uint32_t>(instances_.size()); }

    // Cells whose glyph fell outside the atlas during the last build()
    [[nodiscard]] uint32_t get_invalid_glyph_count() const { return invalid_glyph_count_; }

    // ========================================================================
    // GPU Upload
    // ========================================================================

    // Grows the buffer when needed (retiring the old one under frame_index), then writes
    // the records. On failure the previous buffer stays current.
    [[nodiscard]] core::RenderError upload(uint64_t frame_index);

    // Frame-boundary sync point; returns the number of buffers released
    size_t collect_retired(uint64_t frame_index);

    // Only valid after GraphicsDevice::wait_idle()
    size_t release_all_retired();

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] graphics::Buffer* get_buffer() const { return buffer_.get(); }

    // Records the current buffer can hold
    [[nodiscard]] uint32_t get_capacity() const { return capacity_; }

    // Number of buffers allocated over the builder's lifetime
    [[nodiscard]] uint32_t get_generation() const { return generation_; }

    [[nodiscard]] size_t get_retired_count() const { return retired_.size(); }
    [[nodiscard]] const InstanceBufferConfig& get_config() const { return config_; }

private:
    graphics::GraphicsDevice* device_ = nullptr;
    InstanceBufferConfig config_;

    std::vector<CellInstance> instances_;
    uint32_t invalid_glyph_count_ = 0;
    bool invalid_glyph_logged_ = false;

    std::unique_ptr<graphics::Buffer> buffer_;
    uint32_t capacity_ = 0;
    uint32_t generation_ = 0;
    RetirementQueue<graphics::Buffer, RETIREMENT_CAPACITY> retired_;

    bool grow(uint32_t required, uint64_t frame_index);
};

}  // namespace tessera::rendering
