// Tessera Rendering Core
// rendering.hpp - Convenience include-all header

#pragma once

#include "builtin_font.hpp"
#include "cell_grid.hpp"
#include "cell_pass.hpp"
#include "cell_vertex.hpp"
#include "color.hpp"
#include "frame_orchestrator.hpp"
#include "instance_buffer.hpp"
#include "palette_texture.hpp"
#include "retirement_queue.hpp"
#include "screen_pass.hpp"
#include "shader_loader.hpp"
#include "sprite_atlas.hpp"
#include "sprite_sheet.hpp"
#include "uniform_blocks.hpp"
