// Tessera Graphics Abstraction Layer
// device.hpp - Graphics device interface

#pragma once

#include "types.hpp"

#include <memory>

namespace tessera::graphics {

class Buffer;
class CommandBuffer;
class Pipeline;
class Sampler;
class Shader;
class SwapChain;
class Texture;

struct DeviceDesc {
    void* window_handle = nullptr;   // Native window supplied by the host application
    bool enable_validation = false;  // Enable debug/validation layers
    bool vsync = true;
    uint32_t width = 0;  // Initial surface size
    uint32_t height = 0;
};

// Backend-neutral GPU device. Creation calls may throw std::runtime_error on
// backend failure; callers in the rendering layer convert that to RenderError.
class GraphicsDevice {
public:
    virtual ~GraphicsDevice() = default;

    // Non-copyable, non-movable
    GraphicsDevice(const GraphicsDevice&) = delete;
    GraphicsDevice& operator=(const GraphicsDevice&) = delete;
    GraphicsDevice(GraphicsDevice&&) = delete;
    GraphicsDevice& operator=(GraphicsDevice&&) = delete;

    // ========================================================================
    // Resource Creation
    // ========================================================================

    [[nodiscard]] virtual std::unique_ptr<Buffer> create_buffer(const BufferDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Texture> create_texture(const TextureDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Sampler> create_sampler(const SamplerDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Shader> create_shader(const ShaderDesc& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<Pipeline> create_pipeline(const PipelineDesc& desc) = 0;

    // ========================================================================
    // Command Buffers
    // ========================================================================

    [[nodiscard]] virtual std::unique_ptr<CommandBuffer> create_command_buffer() = 0;
    virtual void submit(CommandBuffer* cmd, bool wait_for_completion = false) = 0;
    virtual void wait_idle() = 0;

    // ========================================================================
    // Swap Chain
    // ========================================================================

    // nullptr for headless devices
    [[nodiscard]] virtual SwapChain* get_swap_chain() = 0;
    virtual void resize_swap_chain(uint32_t width, uint32_t height) = 0;

    // ========================================================================
    // Frame Management
    // ========================================================================

    // Acquire the next drawable
    virtual void begin_frame() = 0;

    // Present. Every begin_frame() must be paired with exactly one end_frame().
    virtual void end_frame() = 0;

    // ========================================================================
    // Device Info
    // ========================================================================

    [[nodiscard]] virtual DeviceCapabilities get_capabilities() const = 0;
    [[nodiscard]] virtual const char* get_backend_name() const = 0;

protected:
    GraphicsDevice() = default;
};

// Creates the backend for the current platform
[[nodiscard]] std::unique_ptr<GraphicsDevice> create_graphics_device(const DeviceDesc& desc);

}  // namespace tessera::graphics
