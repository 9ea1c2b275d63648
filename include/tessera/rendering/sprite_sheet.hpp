// Tessera Rendering Core
// sprite_sheet.hpp - CPU-side glyph image: one byte per pixel, uniform tiles

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace tessera::rendering {

// Single glyph image, sprite_width * sprite_height bytes
struct Sprite {
    uint32_t id = 0;
    std::vector<uint8_t> pixels;
};

// Decoded sprite image laid out as columns x rows of equally sized tiles.
// Pixel values are glyph masks (direct mode) or palette indices (palette mode).
class SpriteSheet {
public:
    // Upper bound on either texture dimension
    static constexpr uint32_t MAX_TEXTURE_SIZE = 8192;

    // Wrap pre-laid-out pixels. sprite_count == 0 means every tile is a sprite.
    // Fails (logged) when the tile size does not divide the image or the count
    // exceeds the tile capacity.
    [[nodiscard]] static std::optional<SpriteSheet> from_pixels(std::vector<uint8_t> pixels, uint32_t width,
                                                                uint32_t height, uint32_t sprite_width,
                                                                uint32_t sprite_height, uint32_t sprite_count = 0);

    // Pack individual sprites into a near-square sheet: ceil(sqrt(n)) columns,
    // rows filled left to right, the short final row zero-padded
    [[nodiscard]] static std::optional<SpriteSheet> pack(std::span<const Sprite> sprites, uint32_t sprite_width,
                                                         uint32_t sprite_height);

    [[nodiscard]] uint32_t get_width() const { return width_; }
    [[nodiscard]] uint32_t get_height() const { return height_; }
    [[nodiscard]] uint32_t get_sprite_width() const { return sprite_width_; }
    [[nodiscard]] uint32_t get_sprite_height() const { return sprite_height_; }
    [[nodiscard]] uint32_t get_columns() const { return width_ / sprite_width_; }
    [[nodiscard]] uint32_t get_rows() const { return height_ / sprite_height_; }
    [[nodiscard]] uint32_t get_sprite_count() const { return sprite_count_; }
    [[nodiscard]] const std::vector<uint8_t>& get_pixels() const { return pixels_; }

    // Largest pixel value; > 15 cannot be a palette index
    [[nodiscard]] uint8_t get_max_pixel_value() const;

    // Tile position assigned to a sprite id by pack(); nullopt for unknown ids
    [[nodiscard]] std::optional<uint32_t> slot_for(uint32_t sprite_id) const;
    [[nodiscard]] const std::unordered_map<uint32_t, uint32_t>& get_id_map() const { return id_map_; }

    [[nodiscard]] uint8_t pixel_at(uint32_t x, uint32_t y) const {
        return pixels_[static_cast<size_t>(y) * width_ + x];
    }

private:
    SpriteSheet() = default;

    uint32_t width_ = 0;
    uint32_t height_ = 0;
    uint32_t sprite_width_ = 0;
    uint32_t sprite_height_ = 0;
    uint32_t sprite_count_ = 0;
    std::vector<uint8_t> pixels_;
    std::unordered_map<uint32_t, uint32_t> id_map_;
};

}  // namespace tessera::rendering
