#ifndef HERMES_NLL_HPP
#define HERMES_NLL_HPP

#include <cstdint>
#include <optional>
#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Hermes::Loss::Details {
    struct NegativeLogLikelihoodOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        std::optional<std::int64_t> ignore_index{};
    };

    struct NegativeLogLikelihoodDescriptor {
        NegativeLogLikelihoodOptions options{};
    };

    // Expects log-probabilities, i.e. a chain ending with LogSoftmax.
    inline torch::Tensor compute(const NegativeLogLikelihoodDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target)
    {
        auto opts = with_reduction(torch::nn::functional::NLLLossFuncOptions{}, descriptor.options.reduction);
        if (!descriptor.options.weight.empty()) {
            opts = opts.weight(class_weight(descriptor.options.weight, prediction));
        }
        if (descriptor.options.ignore_index.has_value()) {
            opts = opts.ignore_index(descriptor.options.ignore_index.value());
        }

        auto indices = target;
        if (indices.dim() == prediction.dim() && indices.dim() > 1) {
            indices = indices.argmax(1);
        }
        return torch::nn::functional::nll_loss(prediction, indices.to(torch::kLong), opts);
    }

}

#endif // HERMES_NLL_HPP
