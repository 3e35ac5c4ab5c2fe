#ifndef HERMES_LOSS_HPP
#define HERMES_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <functional>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "details/reduction.hpp"
#include "details/ce.hpp"
#include "details/mse.hpp"
#include "details/bce.hpp"
#include "details/nll.hpp"

namespace Hermes::Loss {
    using Reduction = Details::Reduction;

    using Descriptor = std::variant<
        Details::CrossEntropyDescriptor,
        Details::MSEDescriptor,
        Details::BCEWithLogitsDescriptor,
        Details::NegativeLogLikelihoodDescriptor>;

    // (predictions, labels) -> scalar tensor. Any callable of that shape can stand in for a descriptor.
    using Function = std::function<torch::Tensor(const torch::Tensor&, const torch::Tensor&)>;

    [[nodiscard]] inline auto CrossEntropy(const Details::CrossEntropyOptions& options = {}) -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto BCEWithLogits(const Details::BCEWithLogitsOptions& options = {}) -> Details::BCEWithLogitsDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto NegativeLogLikelihood(const Details::NegativeLogLikelihoodOptions& options = {}) -> Details::NegativeLogLikelihoodDescriptor {
        return {options};
    }

    [[nodiscard]] inline Function make_function(Descriptor descriptor) {
        return [descriptor = std::move(descriptor)](const torch::Tensor& prediction, const torch::Tensor& target) {
            return std::visit(
                [&](const auto& concrete) {
                    return Details::compute(concrete, prediction, target);
                }, descriptor);
        };
    }
}

#endif //HERMES_LOSS_HPP
