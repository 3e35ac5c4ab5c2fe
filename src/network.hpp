#ifndef HERMES_NETWORK_HPP
#define HERMES_NETWORK_HPP
/*
 * Structured model consumed by the codec and the evaluator.
 * ---------------------------------------------------------------------------
 * Implemented responsibilities:
 *  - `Chain` stores the layer descriptors and materialises them as registered
 *    torch modules, in order. Parameters are therefore enumerated layer by
 *    layer, weight before bias, which fixes the flat-vector traversal.
 *  - `reset()` rebuilds every layer from the descriptors so `clone()` yields
 *    an independent chain whose `AnyModule` handles target its own modules.
 *  - `forward` runs each layer then its activation.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "layer/layer.hpp"


namespace Hermes::Network {
    class ChainImpl : public torch::nn::Cloneable<ChainImpl> {
    public:
        ChainImpl() = default;

        explicit ChainImpl(std::vector<Layer::Descriptor> descriptors)
            : descriptors_(std::move(descriptors))
        {
            reset();
        }

        void reset() override
        {
            layers_.clear();
            layers_.reserve(descriptors_.size());
            for (std::size_t index = 0; index < descriptors_.size(); ++index) {
                layers_.push_back(Layer::Details::register_layer(*this, descriptors_[index], index));
            }
        }

        void add(Layer::Descriptor descriptor)
        {
            const auto index = descriptors_.size();
            descriptors_.push_back(std::move(descriptor));
            layers_.push_back(Layer::Details::register_layer(*this, descriptors_.back(), index));
        }

        [[nodiscard]] torch::Tensor forward(torch::Tensor input)
        {
            for (auto& layer : layers_) {
                input = layer.forward(input);
            }
            return input;
        }

        [[nodiscard]] const std::vector<Layer::Details::RegisteredLayer>& layers() const noexcept { return layers_; }
        [[nodiscard]] const std::vector<Layer::Descriptor>& descriptors() const noexcept { return descriptors_; }
        [[nodiscard]] std::size_t size() const noexcept { return layers_.size(); }

        [[nodiscard]] std::int64_t parameter_count() const
        {
            std::int64_t total = 0;
            for (const auto& parameter : parameters()) {
                total += parameter.numel();
            }
            return total;
        }

    private:
        std::vector<Layer::Descriptor> descriptors_{};
        std::vector<Layer::Details::RegisteredLayer> layers_{};
    };

    TORCH_MODULE(Chain);

    [[nodiscard]] inline Chain make_chain(std::vector<Layer::Descriptor> descriptors)
    {
        return Chain(std::move(descriptors));
    }
}


#endif //HERMES_NETWORK_HPP
