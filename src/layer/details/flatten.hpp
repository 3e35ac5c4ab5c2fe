#ifndef HERMES_FLATTEN_HPP
#define HERMES_FLATTEN_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Hermes::Layer::Details {
    struct FlattenOptions {
        std::int64_t start_dim{1};
        std::int64_t end_dim{-1};
    };

    struct FlattenDescriptor {
        FlattenOptions options{};
        ::Hermes::Activation::Descriptor activation{::Hermes::Activation::Identity};
    };

    // Reshapes only; contributes nothing to the flat vector.
    template <class Owner>
    [[nodiscard]] RegisteredLayer register_layer(Owner& owner, const FlattenDescriptor& descriptor, std::size_t index)
    {
        const auto name = "flatten_" + std::to_string(index);
        auto flatten = owner.register_module(
            name, torch::nn::Flatten(torch::nn::FlattenOptions().start_dim(descriptor.options.start_dim).end_dim(descriptor.options.end_dim)));
        return {torch::nn::AnyModule(flatten), descriptor.activation, name};
    }
}

#endif //HERMES_FLATTEN_HPP
