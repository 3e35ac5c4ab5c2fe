#ifndef HERMES_CE_HPP
#define HERMES_CE_HPP
#include <torch/torch.h>
#include <vector>

#include "reduction.hpp"

namespace Hermes::Loss::Details {
    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double label_smoothing{0.0};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    // Prediction holds logits [batch, classes]; target is either class indices [batch]
    // or one-hot / probability rows [batch, classes] of the prediction's dtype.
    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target) {
        auto opts = with_reduction(torch::nn::functional::CrossEntropyFuncOptions{}, descriptor.options.reduction);
        opts = opts.label_smoothing(descriptor.options.label_smoothing);
        if (!descriptor.options.weight.empty()) {
            opts = opts.weight(class_weight(descriptor.options.weight, prediction));
        }
        return torch::nn::functional::cross_entropy(prediction, target, opts);
    }
}
#endif //HERMES_CE_HPP
