#ifndef HERMES_LAYER_HPP
#define HERMES_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/fc.hpp"
#include "details/flatten.hpp"

#include "registry.hpp"

namespace Hermes::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using FlattenOptions = Details::FlattenOptions;
    using FlattenDescriptor = Details::FlattenDescriptor;

    using Descriptor = std::variant<FCDescriptor, FlattenDescriptor>;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Hermes::Activation::Descriptor activation = ::Hermes::Activation::Identity,
                                 ::Hermes::Initialization::Descriptor initialization = ::Hermes::Initialization::Default) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Flatten(const FlattenOptions& options = {},
                                      ::Hermes::Activation::Descriptor activation = ::Hermes::Activation::Identity) -> FlattenDescriptor {
        return {options, activation};
    }
}

#endif //HERMES_LAYER_HPP
