// Tessera Graphics Abstraction Layer
// command_buffer.hpp - Command recording interface

#pragma once

#include "types.hpp"

#include <cstdint>

namespace tessera::graphics {

class Buffer;
class Pipeline;
class Sampler;
class Texture;

// Records GPU commands for later submission through GraphicsDevice::submit()
class CommandBuffer {
public:
    virtual ~CommandBuffer() = default;

    // Non-copyable
    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

    // ========================================================================
    // Recording Lifecycle
    // ========================================================================

    virtual void begin() = 0;
    virtual void end() = 0;

    // ========================================================================
    // Render Pass Scope
    // ========================================================================

    // Single color attachment; the cell and screen passes never use depth
    virtual void begin_render_pass(const RenderPassDesc& desc, Texture* color_attachment, const ClearColor& clear) = 0;

    virtual void end_render_pass() = 0;

    // ========================================================================
    // Pipeline / Resource Binding
    // ========================================================================

    virtual void bind_pipeline(const Pipeline* pipeline) = 0;

    virtual void bind_vertex_buffer(uint32_t slot, const Buffer* buffer, size_t offset = 0) = 0;
    virtual void bind_index_buffer(const Buffer* buffer, IndexType type, size_t offset = 0) = 0;

    // size == 0 binds the whole buffer
    virtual void bind_uniform_buffer(uint32_t binding, const Buffer* buffer, size_t offset = 0, size_t size = 0) = 0;

    virtual void bind_texture(uint32_t binding, const Texture* texture, const Sampler* sampler) = 0;

    // ========================================================================
    // Dynamic State
    // ========================================================================

    virtual void set_viewport(const Viewport& viewport) = 0;
    virtual void set_scissor(const Rect& scissor) = 0;

    // ========================================================================
    // Draw Commands
    // ========================================================================

    // Both passes draw an indexed quad; the cell pass instances it once per cell
    virtual void draw_indexed(uint32_t index_count, uint32_t instance_count = 1, uint32_t first_index = 0,
                              int32_t vertex_offset = 0, uint32_t first_instance = 0) = 0;

    // ========================================================================
    // Transfer Commands
    // ========================================================================

    virtual void copy_buffer_to_texture(const Buffer* src, Texture* dst, const BufferImageCopy& region) = 0;

    virtual void copy_texture_to_buffer(const Texture* src, Buffer* dst, const BufferImageCopy& region) = 0;

protected:
    CommandBuffer() = default;
};

}  // namespace tessera::graphics
