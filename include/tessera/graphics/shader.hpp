// Tessera Graphics Abstraction Layer
// shader.hpp - GPU shader interface

#pragma once

#include "types.hpp"

#include <string>

namespace tessera::graphics {

class Shader {
public:
    virtual ~Shader() = default;

    // Non-copyable
    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    [[nodiscard]] virtual ShaderStage get_stage() const = 0;
    [[nodiscard]] virtual const std::string& get_entry_point() const = 0;

    // Reflection data (null if the backend did not keep it)
    [[nodiscard]] virtual const ShaderReflection* get_reflection() const = 0;

protected:
    Shader() = default;
};

}  // namespace tessera::graphics
