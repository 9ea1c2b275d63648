// Tessera Graphics Abstraction Layer
// pipeline.hpp - GPU render pipeline interface

#pragma once

#include "types.hpp"

namespace tessera::graphics {

// Compiled shaders + fixed-function state + vertex layout
class Pipeline {
public:
    virtual ~Pipeline() = default;

    // Non-copyable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    [[nodiscard]] virtual PrimitiveTopology get_topology() const = 0;

protected:
    Pipeline() = default;
};

}  // namespace tessera::graphics
