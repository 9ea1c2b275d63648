// Tessera Rendering Core
// cell_pass.cpp - Cell shaders, pipeline and instanced draw recording

#include <exception>
#include <tessera/core/logger.hpp>
#include <tessera/rendering/cell_pass.hpp>
#include <tessera/rendering/cell_vertex.hpp>
#include <vector>

namespace tessera::rendering {

// ============================================================================
// Shader Source Code
// ============================================================================

static const char* CELL_VERTEX_SHADER = R"(
#version 450

// Unit quad
layout(location = 0) in vec2 in_position;
layout(location = 1) in vec2 in_uv;

// Per-instance cell record
layout(location = 2) in vec2 in_translate;
layout(location = 3) in vec2 in_uv_base;
layout(location = 4) in uvec2 in_cell_coords;
layout(location = 5) in uint in_sprite;
layout(location = 6) in uint in_index;
layout(location = 7) in vec4 in_fg_color;
layout(location = 8) in vec4 in_bg_color;

layout(set = 0, binding = 0) uniform CellGlobals {
    uvec2 screen_size_in_sprites;
    uvec2 sprite_map_dimensions;
    uvec2 sprite_texture_dimensions;
    uvec2 sprite_dimensions;
    uvec2 palette_texture_dimensions;
    uvec2 reserved;
} globals;

layout(location = 0) out vec2 frag_uv;
layout(location = 1) flat out uvec2 frag_cell_coords;
layout(location = 2) flat out vec4 frag_fg_color;
layout(location = 3) flat out vec4 frag_bg_color;

void main() {
    vec2 cell_size = vec2(2.0) / vec2(globals.screen_size_in_sprites);
    gl_Position = vec4(in_translate + in_position * cell_size, 0.0, 1.0);

    frag_uv = in_uv_base + in_uv / vec2(globals.sprite_map_dimensions);
    frag_cell_coords = in_cell_coords;
    frag_fg_color = in_fg_color;
    frag_bg_color = in_bg_color;
}
)";

static const char* CELL_FRAGMENT_SHADER = R"(
#version 450

layout(location = 0) in vec2 frag_uv;
layout(location = 1) flat in uvec2 frag_cell_coords;
layout(location = 2) flat in vec4 frag_fg_color;
layout(location = 3) flat in vec4 frag_bg_color;

layout(location = 0) out vec4 out_color;

layout(set = 0, binding = 0) uniform CellGlobals {
    uvec2 screen_size_in_sprites;
    uvec2 sprite_map_dimensions;
    uvec2 sprite_texture_dimensions;
    uvec2 sprite_dimensions;
    uvec2 palette_texture_dimensions;
    uvec2 reserved;
} globals;

layout(set = 0, binding = 1) uniform usampler2D sprite_atlas;

#ifdef COLOR_MODE_PALETTE
layout(set = 0, binding = 2) uniform sampler3D palette;
#endif

void main() {
    ivec2 atlas_size = ivec2(globals.sprite_texture_dimensions);
    ivec2 texel_coord = clamp(ivec2(frag_uv * vec2(atlas_size)), ivec2(0), atlas_size - ivec2(1));
    uint texel = texelFetch(sprite_atlas, texel_coord, 0).r;

#ifdef COLOR_MODE_PALETTE
    int index = int(clamp(texel, 0u, 15u));
    out_color = texelFetch(palette, ivec3(index, int(frag_cell_coords.x), int(frag_cell_coords.y)), 0);
#else
    out_color = texel != 0u ? frag_fg_color : frag_bg_color;
#endif
}
)";

const char* CellPass::vertex_source() {
    return CELL_VERTEX_SHADER;
}

const char* CellPass::fragment_source() {
    return CELL_FRAGMENT_SHADER;
}

const char* pass_state_name(PassState state) {
    switch (state) {
        case PassState::Idle:
            return "idle";
        case PassState::Building:
            return "building";
        case PassState::Submitted:
            return "submitted";
    }
    return "unknown";
}

// ============================================================================
// Lifecycle
// ============================================================================

CellPass::CellPass() = default;

CellPass::~CellPass() {
    shutdown();
}

core::RenderError CellPass::initialize(graphics::GraphicsDevice* device, const SpriteAtlas* atlas,
                                       graphics::TextureFormat color_format) {
    if (!device) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "CellPass requires a graphics device");
        return core::RenderError::ResourceCreationFailed;
    }
    if (!atlas || !atlas->get_texture() || !atlas->get_sampler()) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "CellPass needs an initialized sprite atlas");
        return core::RenderError::MissingBinding;
    }

    shutdown();
    device_ = device;
    atlas_ = atlas;
    color_mode_ = atlas->get_color_mode();
    color_format_ = color_format;

    std::vector<std::string> defines;
    if (color_mode_ == ColorMode::Palette) {
        defines.emplace_back("COLOR_MODE_PALETTE");
    }

    graphics::ShaderCompiler compiler;
    auto vertex = load_shader(device_, compiler, CELL_VERTEX_SHADER, graphics::ShaderStage::Vertex, defines,
                              "cell_vertex");
    auto fragment = load_shader(device_, compiler, CELL_FRAGMENT_SHADER, graphics::ShaderStage::Fragment, defines,
                                "cell_fragment");
    if (!vertex || !fragment) {
        shutdown();
        return core::RenderError::ResourceCreationFailed;
    }

    core::RenderError bindings = validate_bindings(vertex->reflection, fragment->reflection, color_mode_);
    if (bindings != core::RenderError::None) {
        shutdown();
        return bindings;
    }

    vertex_shader_ = std::move(vertex->shader);
    fragment_shader_ = std::move(fragment->shader);

    try {
        if (color_mode_ == ColorMode::Palette) {
            graphics::SamplerDesc sampler_desc;
            sampler_desc.min_filter = graphics::FilterMode::Nearest;
            sampler_desc.mag_filter = graphics::FilterMode::Nearest;
            sampler_desc.address_u = graphics::AddressMode::ClampToEdge;
            sampler_desc.address_v = graphics::AddressMode::ClampToEdge;
            sampler_desc.address_w = graphics::AddressMode::ClampToEdge;
            sampler_desc.debug_name = "CellPaletteSampler";
            palette_sampler_ = device_->create_sampler(sampler_desc);
            if (!palette_sampler_) {
                TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create palette sampler");
                shutdown();
                return core::RenderError::ResourceCreationFailed;
            }
        }

        if (!create_pipeline()) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create cell pipeline");
            shutdown();
            return core::RenderError::ResourceCreationFailed;
        }
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell pass creation threw: {}", e.what());
        shutdown();
        return core::RenderError::ResourceCreationFailed;
    }

    TESSERA_LOG_INFO(core::log_category::RENDERING, "Cell pass initialized ({} color mode)",
                     color_mode_name(color_mode_));
    return core::RenderError::None;
}

void CellPass::shutdown() {
    pipeline_.reset();
    palette_sampler_.reset();
    fragment_shader_.reset();
    vertex_shader_.reset();
    atlas_ = nullptr;
    device_ = nullptr;
    state_ = PassState::Idle;
}

core::RenderError CellPass::validate_bindings(const graphics::ShaderReflection& vertex,
                                              const graphics::ShaderReflection& fragment, ColorMode mode) {
    if (!has_uniform_buffer(vertex, cell_binding::GLOBALS) && !has_uniform_buffer(fragment, cell_binding::GLOBALS)) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell shaders lack the CellGlobals block at binding {}",
                          cell_binding::GLOBALS);
        return core::RenderError::MissingBinding;
    }
    if (!has_sampled_image(fragment, cell_binding::SPRITE_ATLAS, graphics::TextureType::Texture2D)) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell fragment shader lacks the sprite atlas at binding {}",
                          cell_binding::SPRITE_ATLAS);
        return core::RenderError::MissingBinding;
    }
    if (mode == ColorMode::Palette &&
        !has_sampled_image(fragment, cell_binding::PALETTE, graphics::TextureType::Texture3D)) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell fragment shader lacks the palette volume at binding {}",
                          cell_binding::PALETTE);
        return core::RenderError::MissingBinding;
    }
    return core::RenderError::None;
}

bool CellPass::create_pipeline() {
    graphics::PipelineDesc desc;
    desc.vertex_shader = vertex_shader_.get();
    desc.fragment_shader = fragment_shader_.get();

    desc.vertex_attributes = QuadVertex::get_attributes();
    auto instance_attributes = CellInstance::get_attributes();
    desc.vertex_attributes.insert(desc.vertex_attributes.end(), instance_attributes.begin(),
                                  instance_attributes.end());
    desc.vertex_bindings = {QuadVertex::get_binding(), CellInstance::get_binding()};

    desc.topology = graphics::PrimitiveTopology::TriangleList;
    desc.rasterizer.cull_mode = graphics::CullMode::None;

    // Cells overwrite the target; background alpha is kept for compositing
    graphics::BlendState blend;
    blend.enable = false;
    desc.color_blend.push_back(blend);

    desc.color_formats = {color_format_};
    desc.debug_name = "cell_pipeline";

    pipeline_ = device_->create_pipeline(desc);
    return pipeline_ != nullptr;
}

// ============================================================================
// Recording
// ============================================================================

core::RenderError CellPass::validate(const CellPassInputs& inputs) const {
    if (!pipeline_ || !atlas_ || !atlas_->get_texture() || !atlas_->get_sampler()) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell pass used before initialize");
        return core::RenderError::MissingBinding;
    }
    if (!inputs.target) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell pass has no render target");
        return core::RenderError::MissingBinding;
    }
    if (!inputs.quad_vertices || !inputs.quad_indices) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell pass has no quad geometry");
        return core::RenderError::MissingBinding;
    }
    if (!inputs.instances && inputs.instance_count > 0) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell pass has no instance buffer");
        return core::RenderError::MissingBinding;
    }
    if (!inputs.globals) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Cell pass has no CellGlobals buffer");
        return core::RenderError::MissingBinding;
    }
    if (color_mode_ == ColorMode::Palette && !inputs.palette) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Palette-mode cell pass has no palette texture");
        return core::RenderError::MissingBinding;
    }
    return core::RenderError::None;
}

core::RenderError CellPass::record(graphics::CommandBuffer* cmd, const CellPassInputs& inputs) {
    if (!cmd) {
        return core::RenderError::MissingBinding;
    }
    core::RenderError error = validate(inputs);
    if (error != core::RenderError::None) {
        return error;
    }
    if (state_ != PassState::Idle) {
        TESSERA_LOG_WARN(core::log_category::RENDERING, "Cell pass recorded while {}", pass_state_name(state_));
    }
    state_ = PassState::Building;

    graphics::RenderPassDesc pass_desc;
    pass_desc.color_attachments.push_back({color_format_, graphics::LoadOp::Clear, graphics::StoreOp::Store});
    pass_desc.debug_name = "cell_pass";

    const glm::vec4 clear = inputs.clear_color.to_vec4();
    const graphics::ClearColor clear_value{clear.r, clear.g, clear.b, clear.a};
    cmd->begin_render_pass(pass_desc, inputs.target, clear_value);

    const uint32_t width = inputs.target->get_width();
    const uint32_t height = inputs.target->get_height();

    graphics::Viewport viewport;
    viewport.width = static_cast<float>(width);
    viewport.height = static_cast<float>(height);
    cmd->set_viewport(viewport);

    graphics::Rect scissor;
    scissor.width = width;
    scissor.height = height;
    cmd->set_scissor(scissor);

    if (inputs.instance_count > 0) {
        cmd->bind_pipeline(pipeline_.get());
        cmd->bind_uniform_buffer(cell_binding::GLOBALS, inputs.globals);
        cmd->bind_texture(cell_binding::SPRITE_ATLAS, atlas_->get_texture(), atlas_->get_sampler());
        if (color_mode_ == ColorMode::Palette) {
            cmd->bind_texture(cell_binding::PALETTE, inputs.palette, palette_sampler_.get());
        }

        cmd->bind_vertex_buffer(QUAD_VERTEX_BINDING, inputs.quad_vertices);
        cmd->bind_vertex_buffer(CELL_INSTANCE_BINDING, inputs.instances);
        cmd->bind_index_buffer(inputs.quad_indices, graphics::IndexType::Uint16);

        cmd->draw_indexed(static_cast<uint32_t>(QUAD_INDICES.size()), inputs.instance_count);
        ++draw_count_;
    }

    cmd->end_render_pass();
    return core::RenderError::None;
}

void CellPass::mark_submitted() {
    if (state_ != PassState::Building) {
        TESSERA_LOG_WARN(core::log_category::RENDERING, "Cell pass submitted while {}", pass_state_name(state_));
    }
    state_ = PassState::Submitted;
}

void CellPass::mark_complete() {
    state_ = PassState::Idle;
}

}  // namespace tessera::rendering
