#ifndef HERMES_INITIALIZATION_HPP
#define HERMES_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Hermes::Initialization {
    enum class Type {
        Default,        // libtorch's own Linear initialization
        XavierUniform,  // saturating activations (Tanh, Sigmoid)
        HeNormal,       // ReLU
    };

    struct Descriptor {
        Type type{Type::Default};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor XavierUniform{Type::XavierUniform};
    inline constexpr Descriptor HeNormal{Type::HeNormal};
}

#endif //HERMES_INITIALIZATION_HPP
