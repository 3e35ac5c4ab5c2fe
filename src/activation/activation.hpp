#ifndef HERMES_ACTIVATION_HPP
#define HERMES_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Hermes::Activation {
    // Elementwise or row-wise maps applied after a layer; none of them carries parameters.
    enum class Type {
        Identity,
        ReLU,
        Tanh,
        Sigmoid,
        LogSoftmax,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor LogSoftmax{Type::LogSoftmax};
}

#endif //HERMES_ACTIVATION_HPP
