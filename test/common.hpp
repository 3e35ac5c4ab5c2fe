#ifndef HERMES_TEST_COMMON_HPP
#define HERMES_TEST_COMMON_HPP

#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "Hermes.h"

namespace Hermes::Tests {
    inline constexpr std::int64_t kFeatures = 4;
    inline constexpr std::int64_t kHidden = 5;
    inline constexpr std::int64_t kClasses = 2;
    // 4*5 + 5 + 5*2 + 2
    inline constexpr std::int64_t kDimension = 37;

    // Two Gaussian blobs shifted along every feature; labels are class indices.
    inline Data::Dataset make_blobs(std::int64_t count, torch::ScalarType dtype = torch::kFloat32)
    {
        auto targets = torch::arange(count, torch::kLong).remainder(kClasses);
        auto shift = targets.to(torch::kFloat64).mul(2.0).sub(1.0).unsqueeze(1).expand({count, kFeatures});
        auto inputs = torch::randn({count, kFeatures}, torch::kFloat64).add(shift).to(dtype);
        return {inputs, targets};
    }

    inline Data::Dataset to_one_hot(const Data::Dataset& dataset)
    {
        auto one_hot = torch::one_hot(dataset.targets, kClasses).to(dataset.inputs.scalar_type());
        return {dataset.inputs, one_hot};
    }

    inline Network::Chain make_classifier(torch::ScalarType dtype = torch::kFloat32)
    {
        auto chain = Network::make_chain({
            Layer::FC({kFeatures, kHidden, true}, Activation::Tanh, Initialization::XavierUniform),
            Layer::FC({kHidden, kClasses, true}, Activation::Identity, Initialization::XavierUniform),
        });
        chain->to(dtype);
        return chain;
    }

    inline Options quiet_options(std::int64_t size_minibatch = 4)
    {
        Options options{};
        options.name = "Blobs";
        options.size_minibatch = size_minibatch;
        options.seed = 1234;
        options.stream = nullptr;
        return options;
    }

    // 120 training and 40 test samples; 4 batches per split by default.
    inline Model make_model(torch::ScalarType dtype = torch::kFloat32, std::int64_t size_minibatch = 4)
    {
        torch::manual_seed(7);
        auto train = make_blobs(120, dtype);
        auto test = make_blobs(40, dtype);
        return Model(make_classifier(dtype), std::move(train), std::move(test), quiet_options(size_minibatch));
    }
}

#endif // HERMES_TEST_COMMON_HPP
