// Tessera Rendering Core
// palette_texture.cpp - Palette volume creation and per-frame upload

#include <exception>
#include <tessera/core/logger.hpp>
#include <tessera/rendering/palette_texture.hpp>

namespace tessera::rendering {

namespace {
constexpr uint32_t BYTES_PER_ENTRY = 4;
}

CellPaletteTexture::CellPaletteTexture() = default;

CellPaletteTexture::~CellPaletteTexture() {
    shutdown();
}

bool CellPaletteTexture::initialize(graphics::GraphicsDevice* device, uint32_t frames_in_flight) {
    if (!device) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "CellPaletteTexture requires a graphics device");
        return false;
    }
    device_ = device;
    frames_in_flight_ = frames_in_flight == 0 ? 1 : frames_in_flight;
    return true;
}

void CellPaletteTexture::shutdown() {
    staging_.clear();
    previous_.reset();
    texture_.reset();
    texels_.clear();
    dimensions_ = glm::uvec3(0);
    device_ = nullptr;
}

core::RenderError CellPaletteTexture::resize(uint32_t grid_width, uint32_t grid_height) {
    if (!device_) {
        return core::RenderError::ResourceCreationFailed;
    }
    if (grid_width == 0 || grid_height == 0) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Palette texture needs a non-empty grid ({}x{})", grid_width,
                          grid_height);
        return core::RenderError::ResourceCreationFailed;
    }

    const glm::uvec3 dimensions(static_cast<uint32_t>(Palette::SIZE), grid_width, grid_height);
    const size_t byte_size = static_cast<size_t>(dimensions.x) * dimensions.y * dimensions.z * BYTES_PER_ENTRY;

    graphics::TextureDesc desc;
    desc.type = graphics::TextureType::Texture3D;
    desc.format = graphics::TextureFormat::RGBA8Unorm;
    desc.width = dimensions.x;
    desc.height = dimensions.y;
    desc.depth = dimensions.z;
    desc.usage = graphics::TextureUsage::Sampled | graphics::TextureUsage::TransferDst;
    desc.debug_name = "CellPalettes";

    std::unique_ptr<graphics::Texture> texture;
    std::vector<std::unique_ptr<graphics::Buffer>> staging;
    try {
        texture = device_->create_texture(desc);
        if (!texture) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create {}x{}x{} palette texture", dimensions.x,
                              dimensions.y, dimensions.z);
            return core::RenderError::ResourceCreationFailed;
        }

        for (uint32_t i = 0; i < frames_in_flight_; ++i) {
            graphics::BufferDesc staging_desc;
            staging_desc.size = byte_size;
            staging_desc.usage = graphics::BufferUsage::TransferSrc;
            staging_desc.host_visible = true;
            staging_desc.debug_name = "CellPaletteStaging";

            auto buffer = device_->create_buffer(staging_desc);
            if (!buffer) {
                TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create palette staging buffer");
                return core::RenderError::ResourceCreationFailed;
            }
            staging.push_back(std::move(buffer));
        }
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Palette texture creation threw: {}", e.what());
        return core::RenderError::ResourceCreationFailed;
    }

    // Staging buffers of the old size may still be read by in-flight copies;
    // the caller idles the device before a resize reaches this point.
    previous_ = std::move(texture_);
    texture_ = std::move(texture);
    staging_ = std::move(staging);
    dimensions_ = dimensions;
    texels_.assign(byte_size, 0);

    TESSERA_LOG_DEBUG(core::log_category::RENDERING, "Palette texture recreated at {}x{}x{}", dimensions.x,
                      dimensions.y, dimensions.z);
    return core::RenderError::None;
}

core::RenderError CellPaletteTexture::upload(const CellGrid& grid, graphics::CommandBuffer* cmd,
                                             uint64_t frame_index) {
    if (!texture_ || !cmd) {
        return core::RenderError::ResourceCreationFailed;
    }
    if (grid.get_width() != dimensions_.y || grid.get_height() != dimensions_.z) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Grid {}x{} does not match palette texture {}x{}",
                          grid.get_width(), grid.get_height(), dimensions_.y, dimensions_.z);
        return core::RenderError::OutOfBounds;
    }

    const size_t stride = Palette::SIZE * BYTES_PER_ENTRY;
    for (const auto& entry : grid.cells()) {
        const size_t index = static_cast<size_t>(entry.y) * grid.get_width() + entry.x;
        entry.cell.palette.write_rgba8(texels_.data() + index * stride);
    }

    graphics::Buffer* staging = staging_[frame_index % staging_.size()].get();
    staging->write(texels_.data(), texels_.size());

    graphics::BufferImageCopy region;
    region.texture_width = dimensions_.x;
    region.texture_height = dimensions_.y;
    region.texture_depth = dimensions_.z;
    cmd->copy_buffer_to_texture(staging, texture_.get(), region);

    ++upload_count_;
    return core::RenderError::None;
}

}  // namespace tessera::rendering
