// Tessera Rendering Core
// sprite_atlas.cpp - GPU glyph atlas creation and upload

#include <exception>
#include <tessera/core/logger.hpp>
#include <tessera/graphics/buffer.hpp>
#include <tessera/graphics/command_buffer.hpp>
#include <tessera/rendering/color.hpp>
#include <tessera/rendering/sprite_atlas.hpp>

namespace tessera::rendering {

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::Direct:
            return "direct";
        case ColorMode::Palette:
            return "palette";
    }
    return "unknown";
}

AtlasLayout AtlasLayout::from_sheet(const SpriteSheet& sheet) {
    AtlasLayout layout;
    layout.columns = sheet.get_columns();
    layout.rows = sheet.get_rows();
    layout.cell_pixel_size = glm::uvec2(sheet.get_sprite_width(), sheet.get_sprite_height());
    layout.texture_size = glm::uvec2(sheet.get_width(), sheet.get_height());
    return layout;
}

SpriteAtlas::SpriteAtlas() = default;

SpriteAtlas::~SpriteAtlas() {
    shutdown();
}

bool SpriteAtlas::initialize(graphics::GraphicsDevice* device, const SpriteSheet& sheet, ColorMode mode) {
    if (!device) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "SpriteAtlas requires a graphics device");
        return false;
    }

    shutdown();
    layout_ = AtlasLayout::from_sheet(sheet);
    color_mode_ = mode;

    if (mode == ColorMode::Palette && sheet.get_max_pixel_value() >= Palette::SIZE) {
        TESSERA_LOG_WARN(core::log_category::RENDERING,
                         "Sprite sheet holds pixel value {} but palette mode only indexes 0-15; values are clamped",
                         sheet.get_max_pixel_value());
    }

    try {
        if (!upload(device, sheet)) {
            shutdown();
            return false;
        }

        graphics::SamplerDesc sampler_desc;
        sampler_desc.min_filter = graphics::FilterMode::Nearest;
        sampler_desc.mag_filter = graphics::FilterMode::Nearest;
        sampler_desc.mip_filter = graphics::FilterMode::Nearest;
        sampler_desc.address_u = graphics::AddressMode::ClampToEdge;
        sampler_desc.address_v = graphics::AddressMode::ClampToEdge;
        sampler_desc.address_w = graphics::AddressMode::ClampToEdge;
        sampler_desc.max_lod = 0.0f;
        sampler_desc.debug_name = "SpriteAtlasSampler";

        sampler_ = device->create_sampler(sampler_desc);
        if (!sampler_) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create sprite atlas sampler");
            shutdown();
            return false;
        }
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Sprite atlas creation failed: {}", e.what());
        shutdown();
        return false;
    }

    TESSERA_LOG_INFO(core::log_category::RENDERING, "Sprite atlas {}x{} ({}x{} tiles of {}x{}px, {} mode)",
                     layout_.texture_size.x, layout_.texture_size.y, layout_.columns, layout_.rows,
                     layout_.cell_pixel_size.x, layout_.cell_pixel_size.y, color_mode_name(color_mode_));
    return true;
}

void SpriteAtlas::shutdown() {
    sampler_.reset();
    texture_.reset();
}

bool SpriteAtlas::upload(graphics::GraphicsDevice* device, const SpriteSheet& sheet) {
    graphics::TextureDesc tex_desc;
    tex_desc.type = graphics::TextureType::Texture2D;
    tex_desc.format = graphics::TextureFormat::R8Uint;
    tex_desc.width = sheet.get_width();
    tex_desc.height = sheet.get_height();
    tex_desc.usage = graphics::TextureUsage::Sampled | graphics::TextureUsage::TransferDst;
    tex_desc.debug_name = "SpriteAtlas";

    texture_ = device->create_texture(tex_desc);
    if (!texture_) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create sprite atlas texture");
        return false;
    }

    const auto& pixels = sheet.get_pixels();

    graphics::BufferDesc staging_desc;
    staging_desc.size = pixels.size();
    staging_desc.usage = graphics::BufferUsage::TransferSrc;
    staging_desc.host_visible = true;
    staging_desc.debug_name = "SpriteAtlasStaging";

    auto staging_buffer = device->create_buffer(staging_desc);
    if (!staging_buffer) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create sprite atlas staging buffer");
        return false;
    }
    staging_buffer->write(pixels.data(), pixels.size());

    auto cmd = device->create_command_buffer();
    if (!cmd) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create command buffer for atlas upload");
        return false;
    }
    cmd->begin();

    graphics::BufferImageCopy region;
    region.texture_width = sheet.get_width();
    region.texture_height = sheet.get_height();
    region.texture_depth = 1;
    cmd->copy_buffer_to_texture(staging_buffer.get(), texture_.get(), region);

    cmd->end();

    // The staging buffer dies at scope exit, so the copy must finish first
    device->submit(cmd.get(), true);
    return true;
}

}  // namespace tessera::rendering
