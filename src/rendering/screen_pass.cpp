// Tessera Rendering Core
// screen_pass.cpp - Screen shaders, intermediate sampling and post effects

#include <exception>
#include <tessera/core/logger.hpp>
#include <tessera/rendering/cell_vertex.hpp>
#include <tessera/rendering/screen_pass.hpp>
#include <tessera/rendering/shader_loader.hpp>

namespace tessera::rendering {

// ============================================================================
// Shader Source Code
// ============================================================================

static const char* SCREEN_VERTEX_SHADER = R"(
#version 450

layout(location = 0) in vec2 in_position;
layout(location = 1) in vec2 in_uv;

layout(set = 0, binding = 1) uniform ScreenGlobals {
    vec2 screen_size_in_pixels;
    vec2 scale_factor;
    uint frame_counter;
    float elapsed_time;
    uint effect_flags;
    uint reserved;
} globals;

layout(location = 0) out vec2 frag_uv;

void main() {
    gl_Position = vec4(in_position * globals.scale_factor, 0.0, 1.0);
    frag_uv = in_uv;
}
)";

static const char* SCREEN_FRAGMENT_SHADER = R"(
#version 450

#define EFFECT_SCANLINES 1u
#define EFFECT_VIGNETTE 2u

layout(location = 0) in vec2 frag_uv;

layout(location = 0) out vec4 out_color;

layout(set = 0, binding = 0) uniform sampler2D intermediate;

layout(set = 0, binding = 1) uniform ScreenGlobals {
    vec2 screen_size_in_pixels;
    vec2 scale_factor;
    uint frame_counter;
    float elapsed_time;
    uint effect_flags;
    uint reserved;
} globals;

void main() {
    vec4 color = texture(intermediate, frag_uv);

    if ((globals.effect_flags & EFFECT_SCANLINES) != 0u) {
        vec2 target_size = globals.screen_size_in_pixels * globals.scale_factor;
        float line = mod(floor(frag_uv.y * target_size.y), 2.0);
        color.rgb *= mix(1.0, 0.8, line);
    }

    if ((globals.effect_flags & EFFECT_VIGNETTE) != 0u) {
        vec2 centered = frag_uv - vec2(0.5);
        float falloff = smoothstep(0.8, 0.25, length(centered));
        color.rgb *= mix(0.6, 1.0, falloff);
    }

    out_color = color;
}
)";

// ============================================================================
// Lifecycle
// ============================================================================

ScreenPass::ScreenPass() = default;

ScreenPass::~ScreenPass() {
    shutdown();
}

core::RenderError ScreenPass::initialize(graphics::GraphicsDevice* device, graphics::TextureFormat output_format,
                                         const ScreenPassConfig& config) {
    if (!device) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "ScreenPass requires a graphics device");
        return core::RenderError::ResourceCreationFailed;
    }

    shutdown();
    device_ = device;
    config_ = config;
    output_format_ = output_format;

    graphics::ShaderCompiler compiler;
    auto vertex = load_shader(device_, compiler, SCREEN_VERTEX_SHADER, graphics::ShaderStage::Vertex, {},
                              "screen_vertex");
    auto fragment = load_shader(device_, compiler, SCREEN_FRAGMENT_SHADER, graphics::ShaderStage::Fragment, {},
                                "screen_fragment");
    if (!vertex || !fragment) {
        shutdown();
        return core::RenderError::ResourceCreationFailed;
    }

    core::RenderError bindings = validate_bindings(vertex->reflection, fragment->reflection);
    if (bindings != core::RenderError::None) {
        shutdown();
        return bindings;
    }

    vertex_shader_ = std::move(vertex->shader);
    fragment_shader_ = std::move(fragment->shader);

    try {
        graphics::SamplerDesc sampler_desc;
        sampler_desc.min_filter = config_.filter;
        sampler_desc.mag_filter = config_.filter;
        sampler_desc.address_u = graphics::AddressMode::ClampToEdge;
        sampler_desc.address_v = graphics::AddressMode::ClampToEdge;
        sampler_desc.address_w = graphics::AddressMode::ClampToEdge;
        sampler_desc.max_lod = 0.0f;
        sampler_desc.debug_name = "IntermediateSampler";

        sampler_ = device_->create_sampler(sampler_desc);
        if (!sampler_) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create intermediate sampler");
            shutdown();
            return core::RenderError::ResourceCreationFailed;
        }

        if (!create_pipeline()) {
            TESSERA_LOG_ERROR(core::log_category::RENDERING, "Failed to create screen pipeline");
            shutdown();
            return core::RenderError::ResourceCreationFailed;
        }
    } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Screen pass creation threw: {}", e.what());
        shutdown();
        return core::RenderError::ResourceCreationFailed;
    }

    TESSERA_LOG_INFO(core::log_category::RENDERING, "Screen pass initialized ({} filtering)",
                     config_.filter == graphics::FilterMode::Linear ? "linear" : "nearest");
    return core::RenderError::None;
}

void ScreenPass::shutdown() {
    pipeline_.reset();
    sampler_.reset();
    fragment_shader_.reset();
    vertex_shader_.reset();
    source_ = nullptr;
    device_ = nullptr;
}

core::RenderError ScreenPass::validate_bindings(const graphics::ShaderReflection& vertex,
                                                const graphics::ShaderReflection& fragment) {
    if (!has_sampled_image(fragment, screen_binding::INTERMEDIATE, graphics::TextureType::Texture2D)) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Screen fragment shader lacks the intermediate at binding {}",
                          screen_binding::INTERMEDIATE);
        return core::RenderError::MissingBinding;
    }
    const bool has_globals = has_uniform_buffer(vertex, screen_binding::GLOBALS) ||
                             has_uniform_buffer(fragment, screen_binding::GLOBALS);
    if (!has_globals) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Screen shaders lack the ScreenGlobals block at binding {}",
                          screen_binding::GLOBALS);
        return core::RenderError::MissingBinding;
    }
    return core::RenderError::None;
}

bool ScreenPass::create_pipeline() {
    graphics::PipelineDesc desc;
    desc.vertex_shader = vertex_shader_.get();
    desc.fragment_shader = fragment_shader_.get();

    desc.vertex_attributes = QuadVertex::get_attributes();
    desc.vertex_bindings = {QuadVertex::get_binding()};

    desc.topology = graphics::PrimitiveTopology::TriangleList;
    desc.rasterizer.cull_mode = graphics::CullMode::None;

    graphics::BlendState blend;
    blend.enable = false;
    desc.color_blend.push_back(blend);

    desc.color_formats = {output_format_};
    desc.debug_name = "screen_pipeline";

    pipeline_ = device_->create_pipeline(desc);
    return pipeline_ != nullptr;
}

// ============================================================================
// Recording
// ============================================================================

void ScreenPass::set_source(const graphics::Texture* texture) {
    source_ = texture;
    ++source_bind_count_;
}

core::RenderError ScreenPass::validate(const ScreenPassInputs& inputs) const {
    if (!pipeline_ || !sampler_) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Screen pass used before initialize");
        return core::RenderError::MissingBinding;
    }
    if (!source_) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Screen pass has no intermediate source");
        return core::RenderError::MissingBinding;
    }
    if (!inputs.output || !inputs.quad_vertices || !inputs.quad_indices || !inputs.globals) {
        TESSERA_LOG_ERROR(core::log_category::RENDERING, "Screen pass inputs incomplete");
        return core::RenderError::MissingBinding;
    }
    return core::RenderError::None;
}

core::RenderError ScreenPass::record(graphics::CommandBuffer* cmd, const ScreenPassInputs& inputs) {
    if (!cmd) {
        return core::RenderError::MissingBinding;
    }
    core::RenderError error = validate(inputs);
    if (error != core::RenderError::None) {
        return error;
    }

    graphics::RenderPassDesc pass_desc;
    pass_desc.color_attachments.push_back({output_format_, graphics::LoadOp::Clear, graphics::StoreOp::Store});
    pass_desc.debug_name = "screen_pass";

    const glm::vec4 clear = config_.clear_color.to_vec4();
    const graphics::ClearColor clear_value{clear.r, clear.g, clear.b, clear.a};
    cmd->begin_render_pass(pass_desc, inputs.output, clear_value);

    const uint32_t width = inputs.output->get_width();
    const uint32_t height = inputs.output->get_height();

    graphics::Viewport viewport;
    viewport.width = static_cast<float>(width);
    viewport.height = static_cast<float>(height);
    cmd->set_viewport(viewport);

    graphics::Rect scissor;
    scissor.width = width;
    scissor.height = height;
    cmd->set_scissor(scissor);

    cmd->bind_pipeline(pipeline_.get());
    cmd->bind_texture(screen_binding::INTERMEDIATE, source_, sampler_.get());
    cmd->bind_uniform_buffer(screen_binding::GLOBALS, inputs.globals);
    cmd->bind_vertex_buffer(QUAD_VERTEX_BINDING, inputs.quad_vertices);
    cmd->bind_index_buffer(inputs.quad_indices, graphics::IndexType::Uint16);
    cmd->draw_indexed(static_cast<uint32_t>(QUAD_INDICES.size()), 1);
    ++draw_count_;

    cmd->end_render_pass();
    return core::RenderError::None;
}

core::RenderError ScreenPass::record_clear(graphics::CommandBuffer* cmd, graphics::Texture* output) {
    if (!cmd || !output) {
        return core::RenderError::MissingBinding;
    }

    graphics::RenderPassDesc pass_desc;
    pass_desc.color_attachments.push_back({output_format_, graphics::LoadOp::Clear, graphics::StoreOp::Store});
    pass_desc.debug_name = "screen_clear";

    const glm::vec4 clear = config_.clear_color.to_vec4();
    cmd->begin_render_pass(pass_desc, output, graphics::ClearColor{clear.r, clear.g, clear.b, clear.a});
    cmd->end_render_pass();
    ++clear_count_;
    return core::RenderError::None;
}

}  // namespace tessera::rendering
