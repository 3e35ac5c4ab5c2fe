#ifndef HERMES_MSE_HPP
#define HERMES_MSE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Hermes::Loss::Details {

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        auto aligned = target;
        if (aligned.sizes() != prediction.sizes() && aligned.numel() == prediction.numel()) {
            aligned = aligned.reshape(prediction.sizes());
        }
        return torch::nn::functional::mse_loss(
            prediction,
            aligned,
            with_reduction(torch::nn::functional::MSELossFuncOptions{}, descriptor.options.reduction));
    }
}

#endif // HERMES_MSE_HPP
