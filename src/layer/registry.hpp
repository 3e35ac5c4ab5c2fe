#ifndef HERMES_LAYER_REGISTRY_HPP
#define HERMES_LAYER_REGISTRY_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../activation/apply.hpp"

namespace Hermes::Layer::Details {
    /*
     * One materialised entry of a chain. The module is registered on the
     * owning chain under `name`; `AnyModule` only holds a second handle to it
     * and dispatches its forward.
     */
    struct RegisteredLayer {
        torch::nn::AnyModule module{};
        ::Hermes::Activation::Descriptor activation{};
        std::string name{};

        [[nodiscard]] torch::Tensor forward(const torch::Tensor& input)
        {
            return ::Hermes::Activation::Details::apply(activation, module.forward(input));
        }
    };

    // Every descriptor header provides `register_layer(owner, descriptor, index)`; this picks the one held by the variant.
    template <class Owner, class... Descriptors>
    [[nodiscard]] RegisteredLayer register_layer(Owner& owner, const std::variant<Descriptors...>& descriptor, std::size_t index)
    {
        return std::visit([&](const auto& concrete) { return register_layer(owner, concrete, index); }, descriptor);
    }
}
#endif // HERMES_LAYER_REGISTRY_HPP
