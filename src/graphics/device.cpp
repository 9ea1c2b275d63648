// Tessera Graphics Abstraction Layer
// device.cpp - Graphics device factory function

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <tessera/graphics/device.hpp>

namespace tessera::graphics {

std::unique_ptr<GraphicsDevice> create_vulkan_device(const DeviceDesc& desc);

std::unique_ptr<GraphicsDevice> create_graphics_device(const DeviceDesc& desc) {
#if defined(TESSERA_PLATFORM_LINUX)
    spdlog::info("Creating Vulkan graphics device (Linux)");
    return create_vulkan_device(desc);
#elif defined(TESSERA_PLATFORM_WINDOWS)
    spdlog::info("Creating Vulkan graphics device (Windows)");
    return create_vulkan_device(desc);
#elif defined(TESSERA_PLATFORM_MACOS)
    spdlog::info("Creating Vulkan graphics device (macOS, portability)");
    return create_vulkan_device(desc);
#else
    (void)desc;
    spdlog::error("No graphics backend available for this platform");
    throw std::runtime_error("No graphics backend available for this platform");
#endif
}

}  // namespace tessera::graphics
