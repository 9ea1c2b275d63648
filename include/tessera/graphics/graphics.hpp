// Tessera Graphics Abstraction Layer
// graphics.hpp - Main include with forward declarations

#pragma once

#include "buffer.hpp"
#include "command_buffer.hpp"
#include "device.hpp"
#include "pipeline.hpp"
#include "sampler.hpp"
#include "shader.hpp"
#include "shader_compiler.hpp"
#include "swap_chain.hpp"
#include "texture.hpp"
#include "types.hpp"
