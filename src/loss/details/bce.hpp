#ifndef HERMES_BCE_HPP
#define HERMES_BCE_HPP

#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Hermes::Loss::Details {

    struct BCEWithLogitsOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> pos_weight{};
    };

    struct BCEWithLogitsDescriptor {
        BCEWithLogitsOptions options{};
    };

    inline torch::Tensor compute(const BCEWithLogitsDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        auto opts = with_reduction(torch::nn::functional::BinaryCrossEntropyWithLogitsFuncOptions{}, descriptor.options.reduction);
        if (!descriptor.options.pos_weight.empty()) {
            opts = opts.pos_weight(class_weight(descriptor.options.pos_weight, prediction));
        }
        auto aligned = target.to(prediction.scalar_type());
        if (aligned.sizes() != prediction.sizes() && aligned.numel() == prediction.numel()) {
            aligned = aligned.reshape(prediction.sizes());
        }
        return torch::nn::functional::binary_cross_entropy_with_logits(prediction, aligned, opts);
    }

}

#endif // HERMES_BCE_HPP
