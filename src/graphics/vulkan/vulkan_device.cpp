// Tessera Graphics Abstraction Layer
// vulkan_device.cpp - Vulkan graphics device stub (not yet implemented)

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <tessera/graphics/device.hpp>

namespace tessera::graphics {

namespace {

[[noreturn]] void not_implemented(const char* function) {
    throw std::runtime_error(std::string("VulkanDevice::") + function + " not implemented");
}

}  // namespace

// ============================================================================
// VulkanDevice Stub Implementation
// ============================================================================

class VulkanDevice : public GraphicsDevice {
public:
    explicit VulkanDevice(const DeviceDesc& desc) : width_(desc.width), height_(desc.height) {}
    ~VulkanDevice() override = default;

    std::unique_ptr<Buffer> create_buffer(const BufferDesc& /*desc*/) override { not_implemented("create_buffer"); }

    std::unique_ptr<Texture> create_texture(const TextureDesc& /*desc*/) override {
        not_implemented("create_texture");
    }

    std::unique_ptr<Sampler> create_sampler(const SamplerDesc& /*desc*/) override {
        not_implemented("create_sampler");
    }

    std::unique_ptr<Shader> create_shader(const ShaderDesc& /*desc*/) override { not_implemented("create_shader"); }

    std::unique_ptr<Pipeline> create_pipeline(const PipelineDesc& /*desc*/) override {
        not_implemented("create_pipeline");
    }

    std::unique_ptr<CommandBuffer> create_command_buffer() override { not_implemented("create_command_buffer"); }

    void submit(CommandBuffer* /*cmd*/, bool /*wait_for_completion*/) override { not_implemented("submit"); }

    void wait_idle() override { not_implemented("wait_idle"); }

    SwapChain* get_swap_chain() override { return nullptr; }

    void resize_swap_chain(uint32_t width, uint32_t height) override {
        width_ = width;
        height_ = height;
    }

    void begin_frame() override { not_implemented("begin_frame"); }

    void end_frame() override { not_implemented("end_frame"); }

    DeviceCapabilities get_capabilities() const override {
        DeviceCapabilities caps;
        caps.device_name = "Vulkan (Not Implemented)";
        caps.api_name = "Vulkan";
        return caps;
    }

    const char* get_backend_name() const override { return "Vulkan (Stub)"; }

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
};

std::unique_ptr<GraphicsDevice> create_vulkan_device(const DeviceDesc& desc) {
    spdlog::warn("Vulkan backend is not yet implemented. Returning stub device.");
    return std::make_unique<VulkanDevice>(desc);
}

}  // namespace tessera::graphics
