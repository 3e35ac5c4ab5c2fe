#ifndef HERMES_LOSS_REDUCTION_HPP
#define HERMES_LOSS_REDUCTION_HPP

#include <torch/torch.h>
#include <type_traits>
#include <vector>

namespace Hermes::Loss::Details {

    // No per-sample mode: the objective handed to the optimizer must be a scalar.
    enum class Reduction { Mean, Sum };

    // Use: to_torch_reduction<torch::nn::functional::MSELossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

    template <typename Options>
    inline Options with_reduction(Options options, Reduction r) {
        return options.reduction(to_torch_reduction<Options>(r));
    }

    inline torch::Tensor class_weight(const std::vector<double>& weight, const torch::Tensor& prediction) {
        return torch::tensor(weight, torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device()));
    }
}

#endif // HERMES_LOSS_REDUCTION_HPP
