#ifndef HERMES_PARAMETER_CODEC_HPP
#define HERMES_PARAMETER_CODEC_HPP
/*
 * Bidirectional mapping between a module's parameter tensors and one flat vector.
 * ---------------------------------------------------------------------------
 * Traversal order: registration order of the parameters (layer order, then
 * tensor order inside the layer), each tensor read row-major.
 *  - Flatten : module -> detached 1-D copy.
 *  - Unflatten : vector + layout -> fresh tensors shaped like the template.
 *  - Apply : vector -> existing parameter tensors, in place (identity kept
 *    for autograd).
 *  - Rebuild : deep clone of the module with the vector applied.
 */

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "details/layout.hpp"

namespace Hermes::Parameter {
    using Layout = Details::Layout;

    namespace Details {
        inline void check_vector(const torch::Tensor& vector, std::int64_t expected)
        {
            if (!vector.defined()) {
                throw ::Hermes::ShapeMismatch("Flat parameter vector is undefined.");
            }
            if (vector.dim() != 1) {
                throw ::Hermes::ShapeMismatch("Flat parameter vector must be one-dimensional, got "
                                              + std::to_string(vector.dim()) + " dimensions.");
            }
            if (vector.numel() != expected) {
                throw ::Hermes::ShapeMismatch("Flat parameter vector has " + std::to_string(vector.numel())
                                              + " elements but the parameter layout holds "
                                              + std::to_string(expected) + ".");
            }
        }
    }

    [[nodiscard]] inline torch::Tensor Flatten(const torch::nn::Module& module)
    {
        std::vector<torch::Tensor> pieces;
        for (const auto& parameter : module.parameters(/*recurse=*/true)) {
            pieces.push_back(parameter.detach().contiguous().view({-1}));
        }
        if (pieces.empty()) {
            return torch::empty({0});
        }
        return torch::cat(pieces).clone();
    }

    [[nodiscard]] inline std::vector<torch::Tensor> Unflatten(const torch::Tensor& vector, const Layout& layout)
    {
        Details::check_vector(vector, layout.total());
        std::vector<torch::Tensor> tensors;
        tensors.reserve(layout.size());
        const auto source = vector.detach().contiguous();
        for (const auto& entry : layout.entries()) {
            tensors.push_back(source.narrow(0, entry.offset, entry.numel).view(entry.shape).clone());
        }
        return tensors;
    }

    inline void Apply(const torch::Tensor& vector, torch::nn::Module& module)
    {
        auto parameters = module.parameters(/*recurse=*/true);
        std::int64_t total = 0;
        for (const auto& parameter : parameters) {
            total += parameter.numel();
        }
        Details::check_vector(vector, total);

        torch::NoGradGuard no_grad;
        const auto source = vector.detach().contiguous();
        std::int64_t offset = 0;
        for (auto& parameter : parameters) {
            const auto numel = parameter.numel();
            parameter.copy_(source.narrow(0, offset, numel).view(parameter.sizes()));
            offset += numel;
        }
    }

    // Holder is a TORCH_MODULE handle whose implementation derives from torch::nn::Cloneable.
    template <class Holder>
    [[nodiscard]] Holder Rebuild(const torch::Tensor& vector, const Holder& module)
    {
        using Impl = typename Holder::ContainedType;
        Details::check_vector(vector, Layout::of(*module).total());
        auto copy = std::dynamic_pointer_cast<Impl>(module->clone());
        if (!copy) {
            throw std::logic_error("Module clone did not preserve its implementation type.");
        }
        Apply(vector, *copy);
        return Holder(std::move(copy));
    }
}

#endif // HERMES_PARAMETER_CODEC_HPP
