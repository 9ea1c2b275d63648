// Tessera Rendering Core
// sprite_sheet.cpp - Sprite sheet validation and packing

#include <algorithm>
#include <cmath>
#include <tessera/core/logger.hpp>
#include <tessera/rendering/sprite_sheet.hpp>

namespace tessera::rendering {

std::optional<SpriteSheet> SpriteSheet::from_pixels(std::vector<uint8_t> pixels, uint32_t width, uint32_t height,
                                                    uint32_t sprite_width, uint32_t sprite_height,
                                                    uint32_t sprite_count) {
    if (sprite_width == 0 || sprite_height == 0 || width == 0 || height == 0) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Sprite sheet dimensions must be non-zero");
        return std::nullopt;
    }
    if (width % sprite_width != 0) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Sprite width {} must divide image width {}", sprite_width,
                          width);
        return std::nullopt;
    }
    if (height % sprite_height != 0) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Sprite height {} must divide image height {}",
                          sprite_height, height);
        return std::nullopt;
    }
    if (width > MAX_TEXTURE_SIZE || height > MAX_TEXTURE_SIZE) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Sprite sheet {}x{} exceeds {}x{}", width, height,
                          MAX_TEXTURE_SIZE, MAX_TEXTURE_SIZE);
        return std::nullopt;
    }
    if (pixels.size() != static_cast<size_t>(width) * height) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Sprite sheet has {} pixels, expected {}", pixels.size(),
                          static_cast<size_t>(width) * height);
        return std::nullopt;
    }

    const uint32_t capacity = (width / sprite_width) * (height / sprite_height);
    if (sprite_count > capacity) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Too many sprites ({}) for a {}-tile sheet", sprite_count,
                          capacity);
        return std::nullopt;
    }

    SpriteSheet sheet;
    sheet.width_ = width;
    sheet.height_ = height;
    sheet.sprite_width_ = sprite_width;
    sheet.sprite_height_ = sprite_height;
    sheet.sprite_count_ = sprite_count == 0 ? capacity : sprite_count;
    sheet.pixels_ = std::move(pixels);
    for (uint32_t i = 0; i < sheet.sprite_count_; ++i) {
        sheet.id_map_.emplace(i, i);
    }
    return sheet;
}

std::optional<SpriteSheet> SpriteSheet::pack(std::span<const Sprite> sprites, uint32_t sprite_width,
                                             uint32_t sprite_height) {
    if (sprites.empty() || sprite_width == 0 || sprite_height == 0) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cannot pack an empty sprite set");
        return std::nullopt;
    }

    const auto count = static_cast<uint32_t>(sprites.size());
    const auto sprites_wide = static_cast<uint32_t>(std::ceil(std::sqrt(static_cast<double>(count))));
    const uint32_t sprites_high = (count + sprites_wide - 1) / sprites_wide;
    const uint32_t texture_width = sprites_wide * sprite_width;
    const uint32_t texture_height = sprites_high * sprite_height;

    if (texture_width > MAX_TEXTURE_SIZE || texture_height > MAX_TEXTURE_SIZE) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Packed sprite sheet {}x{} exceeds {}x{}", texture_width,
                          texture_height, MAX_TEXTURE_SIZE, MAX_TEXTURE_SIZE);
        return std::nullopt;
    }

    const size_t sprite_size = static_cast<size_t>(sprite_width) * sprite_height;
    for (const Sprite& sprite : sprites) {
        if (sprite.pixels.size() != sprite_size) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Sprite {} has {} pixels, expected {}", sprite.id,
                              sprite.pixels.size(), sprite_size);
            return std::nullopt;
        }
    }

    SpriteSheet sheet;
    sheet.width_ = texture_width;
    sheet.height_ = texture_height;
    sheet.sprite_width_ = sprite_width;
    sheet.sprite_height_ = sprite_height;
    sheet.sprite_count_ = count;
    sheet.pixels_.assign(static_cast<size_t>(texture_width) * texture_height, 0);
    sheet.id_map_.reserve(count);

    for (uint32_t slot = 0; slot < count; ++slot) {
        const Sprite& sprite = sprites[slot];
        sheet.id_map_[sprite.id] = slot;

        const uint32_t base_x = (slot % sprites_wide) * sprite_width;
        const uint32_t base_y = (slot / sprites_wide) * sprite_height;
        for (uint32_t y = 0; y < sprite_height; ++y) {
            auto src = sprite.pixels.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(y) * sprite_width);
            auto dst = sheet.pixels_.begin() +
                       static_cast<std::ptrdiff_t>(static_cast<size_t>(base_y + y) * texture_width + base_x);
            std::copy(src, src + sprite_width, dst);
        }
    }

    return sheet;
}

uint8_t SpriteSheet::get_max_pixel_value() const {
    if (pixels_.empty()) {
        return 0;
    }
    return *std::max_element(pixels_.begin(), pixels_.end());
}

std::optional<uint32_t> SpriteSheet::slot_for(uint32_t sprite_id) const {
    auto it = id_map_.find(sprite_id);
    if (it == id_map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace tessera::rendering
