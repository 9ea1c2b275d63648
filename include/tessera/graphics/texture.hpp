// Tessera Graphics Abstraction Layer
// texture.hpp - GPU texture interface

#pragma once

#include "types.hpp"

namespace tessera::graphics {

// 1D/2D/3D image resource; render targets, the sprite atlas and palette volumes
class Texture {
public:
    virtual ~Texture() = default;

    // Non-copyable
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    [[nodiscard]] virtual TextureType get_type() const = 0;
    [[nodiscard]] virtual TextureFormat get_format() const = 0;
    [[nodiscard]] virtual uint32_t get_width() const = 0;
    [[nodiscard]] virtual uint32_t get_height() const = 0;
    [[nodiscard]] virtual uint32_t get_depth() const = 0;
    [[nodiscard]] virtual TextureUsage get_usage() const = 0;

    // Tightly packed size; texel copies never pad rows
    [[nodiscard]] size_t get_byte_size() const {
        return static_cast<size_t>(get_width()) * get_height() * get_depth() * texture_format_size(get_format());
    }

protected:
    Texture() = default;
};

}  // namespace tessera::graphics
