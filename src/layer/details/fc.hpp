#ifndef HERMES_FC_HPP
#define HERMES_FC_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../registry.hpp"

namespace Hermes::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Hermes::Activation::Descriptor activation{::Hermes::Activation::Identity};
        ::Hermes::Initialization::Descriptor initialization{::Hermes::Initialization::Default};
    };

    // "fc_<index>.weight" [out, in] is registered before "fc_<index>.bias" [out]; the flat vector follows that order.
    template <class Owner>
    [[nodiscard]] RegisteredLayer register_layer(Owner& owner, const FCDescriptor& descriptor, std::size_t index)
    {
        const auto& options = descriptor.options;
        if (options.in_features <= 0 || options.out_features <= 0) {
            throw std::invalid_argument("Layer " + std::to_string(index) + ": fully connected layers need positive sizes, got "
                                        + std::to_string(options.in_features) + " -> " + std::to_string(options.out_features) + ".");
        }

        const auto name = "fc_" + std::to_string(index);
        auto linear = owner.register_module(
            name, torch::nn::Linear(torch::nn::LinearOptions(options.in_features, options.out_features).bias(options.bias)));
        ::Hermes::Initialization::Details::apply(linear, descriptor.initialization);
        return {torch::nn::AnyModule(linear), descriptor.activation, name};
    }
}

#endif //HERMES_FC_HPP
