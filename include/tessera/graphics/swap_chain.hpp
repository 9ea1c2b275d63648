// Tessera Graphics Abstraction Layer
// swap_chain.hpp - Presentation surface interface

#pragma once

#include "types.hpp"

namespace tessera::graphics {

class Texture;

// Window surface images; the final target of the screen pass
class SwapChain {
public:
    virtual ~SwapChain() = default;

    // Non-copyable
    SwapChain(const SwapChain&) = delete;
    SwapChain& operator=(const SwapChain&) = delete;

    [[nodiscard]] virtual uint32_t get_width() const = 0;
    [[nodiscard]] virtual uint32_t get_height() const = 0;
    [[nodiscard]] virtual TextureFormat get_format() const = 0;
    [[nodiscard]] virtual uint32_t get_image_count() const = 0;

    // Only valid between begin_frame() and end_frame() on the device
    [[nodiscard]] virtual Texture* get_current_texture() = 0;

    [[nodiscard]] virtual uint32_t get_current_frame_index() const = 0;

protected:
    SwapChain() = default;
};

}  // namespace tessera::graphics
