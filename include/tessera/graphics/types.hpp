// Tessera Graphics Abstraction Layer
// types.hpp - Common types, enums, and descriptors

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tessera::graphics {

// ============================================================================
// Texture Formats
// ============================================================================

enum class TextureFormat : uint32_t {
    Unknown = 0,

    // Sprite atlas (one mask or palette index per texel)
    R8Uint,

    // Color targets and palette texels
    RGBA8Unorm,
    BGRA8Unorm,

    // Vertex attribute formats
    R32Uint,
    RG32Float,
    RG32Uint,
};

// Bytes per texel (or per vertex element when used as a vertex format)
[[nodiscard]] constexpr uint32_t texture_format_size(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8Uint:
            return 1;
        case TextureFormat::RGBA8Unorm:
        case TextureFormat::BGRA8Unorm:
        case TextureFormat::R32Uint:
            return 4;
        case TextureFormat::RG32Float:
        case TextureFormat::RG32Uint:
            return 8;
        case TextureFormat::Unknown:
            return 0;
    }
    return 0;
}

// ============================================================================
// Buffer Usage Flags
// ============================================================================

enum class BufferUsage : uint32_t {
    None = 0,
    Vertex = 1 << 0,
    Index = 1 << 1,
    Uniform = 1 << 2,
    TransferSrc = 1 << 3,
    TransferDst = 1 << 4,
};

inline BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool has_flag(BufferUsage flags, BufferUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// ============================================================================
// Texture Usage Flags
// ============================================================================

enum class TextureUsage : uint32_t {
    None = 0,
    Sampled = 1 << 0,
    RenderTarget = 1 << 1,
    TransferSrc = 1 << 2,
    TransferDst = 1 << 3,
};

inline TextureUsage operator|(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool has_flag(TextureUsage flags, TextureUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// ============================================================================
// Texture Types / Shader Stages
// ============================================================================

enum class TextureType : uint8_t {
    Texture1D,
    Texture2D,
    Texture3D,
    Texture2DArray,
};

enum class ShaderStage : uint8_t {
    Vertex,
    Fragment,
};

// ============================================================================
// Rendering State Enums
// ============================================================================

enum class PrimitiveTopology : uint8_t {
    TriangleList,
};

enum class CullMode : uint8_t {
    None,
    Front,
    Back,
};

// Both passes clear their target; Load keeps the previous contents
enum class LoadOp : uint8_t {
    Load,
    Clear,
};

enum class StoreOp : uint8_t {
    Store,
};

// Quad indices are 16-bit
enum class IndexType : uint8_t {
    Uint16,
};

enum class FilterMode : uint8_t {
    Nearest,
    Linear,
};

// Atlas and intermediate lookups never wrap
enum class AddressMode : uint8_t {
    ClampToEdge,
};

// ============================================================================
// Descriptors / Configuration Structs
// ============================================================================

struct BufferDesc {
    size_t size = 0;
    BufferUsage usage = BufferUsage::None;
    bool host_visible = false;
    const void* initial_data = nullptr;
    std::string debug_name;
};

struct TextureDesc {
    TextureType type = TextureType::Texture2D;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    uint32_t width = 1;
    uint32_t height = 1;
    uint32_t depth = 1;
    TextureUsage usage = TextureUsage::Sampled;
    std::string debug_name;
};

struct SamplerDesc {
    FilterMode min_filter = FilterMode::Linear;
    FilterMode mag_filter = FilterMode::Linear;
    FilterMode mip_filter = FilterMode::Nearest;
    AddressMode address_u = AddressMode::ClampToEdge;
    AddressMode address_v = AddressMode::ClampToEdge;
    AddressMode address_w = AddressMode::ClampToEdge;
    float min_lod = 0.0f;
    float max_lod = 1000.0f;
    std::string debug_name;
};

struct ShaderDesc {
    ShaderStage stage = ShaderStage::Vertex;
    std::span<const uint8_t> bytecode;
    std::string entry_point = "main";
    std::string debug_name;
};

// ============================================================================
// Vertex Input
// ============================================================================

struct VertexAttribute {
    uint32_t location = 0;
    uint32_t binding = 0;
    TextureFormat format = TextureFormat::Unknown;  // Reuse format enum
    uint32_t offset = 0;
};

struct VertexBinding {
    uint32_t binding = 0;
    uint32_t stride = 0;
    bool per_instance = false;
};

// ============================================================================
// Pipeline State
// ============================================================================

struct RasterizerState {
    CullMode cull_mode = CullMode::None;
};

// Passes overwrite their target; enable selects standard source-alpha blending
struct BlendState {
    bool enable = false;
};

// ============================================================================
// Render Pass
// ============================================================================

struct AttachmentDesc {
    TextureFormat format = TextureFormat::BGRA8Unorm;
    LoadOp load_op = LoadOp::Clear;
    StoreOp store_op = StoreOp::Store;
};

struct RenderPassDesc {
    std::vector<AttachmentDesc> color_attachments;
    std::string debug_name;
};

// ============================================================================
// Pipeline Descriptors
// ============================================================================

class Shader;

struct PipelineDesc {
    Shader* vertex_shader = nullptr;
    Shader* fragment_shader = nullptr;
    std::vector<VertexAttribute> vertex_attributes;
    std::vector<VertexBinding> vertex_bindings;
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    RasterizerState rasterizer;
    std::vector<BlendState> color_blend;
    std::vector<TextureFormat> color_formats;
    std::string debug_name;
};

// ============================================================================
// Geometry / Viewport Types
// ============================================================================

struct Viewport {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
};

// Normalized RGBA written to the color attachment by LoadOp::Clear
struct ClearColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;
};

// ============================================================================
// Copy / Transfer Types
// ============================================================================

struct BufferImageCopy {
    size_t buffer_offset = 0;
    uint32_t texture_offset_x = 0;
    uint32_t texture_offset_y = 0;
    uint32_t texture_offset_z = 0;
    uint32_t texture_width = 0;
    uint32_t texture_height = 0;
    uint32_t texture_depth = 1;
};

// ============================================================================
// Device Capabilities
// ============================================================================

struct DeviceCapabilities {
    std::string device_name;
    std::string api_name;  // "Metal", "Vulkan"
    uint64_t max_buffer_size = 0;
    uint32_t max_texture_size_2d = 0;
    uint32_t max_texture_size_3d = 0;
    uint32_t max_uniform_buffer_size = 0;
};

// ============================================================================
// Shader Reflection Types
// ============================================================================

struct ShaderUniformMember {
    std::string name;
    std::string type_name;  // "uvec2", "vec2", "float", etc.
    size_t offset = 0;
    size_t size = 0;
    uint32_t array_size = 1;  // 1 for non-arrays
};

struct ShaderUniformBuffer {
    std::string name;
    uint32_t set = 0;
    uint32_t binding = 0;
    size_t size = 0;
    std::vector<ShaderUniformMember> members;
};

struct ShaderSampledImage {
    std::string name;
    uint32_t set = 0;
    uint32_t binding = 0;
    TextureType dimension = TextureType::Texture2D;
    bool is_array = false;
};

struct ShaderStageInput {
    std::string name;
    uint32_t location = 0;
    std::string type_name;
};

struct ShaderReflection {
    ShaderStage stage = ShaderStage::Vertex;
    std::string entry_point;
    std::vector<ShaderUniformBuffer> uniform_buffers;
    std::vector<ShaderSampledImage> sampled_images;
    std::vector<ShaderStageInput> inputs;
    std::vector<ShaderStageInput> outputs;
};

}  // namespace tessera::graphics
