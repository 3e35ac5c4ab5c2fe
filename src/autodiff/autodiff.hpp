#ifndef HERMES_AUTODIFF_HPP
#define HERMES_AUTODIFF_HPP
/*
 * Thin layer over libtorch autograd, expressed on flat vectors.
 * The objective is evaluated at whatever values the parameters currently
 * hold; callers write the point in first (Parameter::Apply) and never touch
 * the parameters while these routines run.
 */

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Hermes::Autodiff {
    using Objective = std::function<torch::Tensor()>;

    struct ValueAndGradient {
        torch::Tensor value{};
        torch::Tensor gradient{};
    };

    namespace Details {
        // Parameters the objective does not depend on get zero blocks.
        [[nodiscard]] inline torch::Tensor flatten_grads(const std::vector<torch::Tensor>& grads,
                                                         const std::vector<torch::Tensor>& parameters)
        {
            std::vector<torch::Tensor> pieces;
            pieces.reserve(grads.size());
            for (std::size_t i = 0; i < grads.size(); ++i) {
                if (grads[i].defined()) {
                    pieces.push_back(grads[i].contiguous().view({-1}));
                } else {
                    pieces.push_back(torch::zeros({parameters[i].numel()}, parameters[i].options()));
                }
            }
            if (pieces.empty()) {
                return torch::zeros({0});
            }
            return torch::cat(pieces);
        }

        [[nodiscard]] inline torch::Tensor scalar(const Objective& objective)
        {
            auto value = objective();
            if (!value.defined() || value.numel() != 1) {
                throw std::logic_error("Objective must produce a single scalar; check the loss reduction.");
            }
            return value.reshape({});
        }

        [[nodiscard]] inline std::int64_t dimension(const std::vector<torch::Tensor>& parameters)
        {
            std::int64_t n = 0;
            for (const auto& p : parameters) {
                n += p.numel();
            }
            return n;
        }
    }

    [[nodiscard]] inline ValueAndGradient ValueGradient(const Objective& objective, const std::vector<torch::Tensor>& parameters)
    {
        torch::AutoGradMode enable_grad(true);
        auto value = Details::scalar(objective);
        ValueAndGradient result{};
        if (!value.requires_grad()) {
            result.gradient = torch::zeros({Details::dimension(parameters)}, value.options());
        } else {
            auto grads = torch::autograd::grad({value}, parameters, /*grad_outputs=*/{},
                                               /*retain_graph=*/false, /*create_graph=*/false, /*allow_unused=*/true);
            result.gradient = Details::flatten_grads(grads, parameters).detach();
        }
        result.value = value.detach();
        return result;
    }

    [[nodiscard]] inline torch::Tensor Gradient(const Objective& objective, const std::vector<torch::Tensor>& parameters)
    {
        return ValueGradient(objective, parameters).gradient;
    }

    // Row i is the gradient of the i-th first-derivative entry: n extra backward passes.
    [[nodiscard]] inline torch::Tensor Hessian(const Objective& objective, const std::vector<torch::Tensor>& parameters)
    {
        torch::AutoGradMode enable_grad(true);
        const auto n = Details::dimension(parameters);
        auto value = Details::scalar(objective);
        auto hessian = torch::zeros({n, n}, value.options().requires_grad(false));
        if (!value.requires_grad()) {
            return hessian;
        }

        auto grads = torch::autograd::grad({value}, parameters, {}, /*retain_graph=*/true, /*create_graph=*/true, /*allow_unused=*/true);
        auto flat = Details::flatten_grads(grads, parameters);
        if (!flat.requires_grad()) {
            return hessian;
        }

        for (std::int64_t i = 0; i < n; ++i) {
            auto row = torch::autograd::grad({flat[i]}, parameters, {}, /*retain_graph=*/true, /*create_graph=*/false, /*allow_unused=*/true);
            hessian[i].copy_(Details::flatten_grads(row, parameters).detach());
        }
        return hessian;
    }

    [[nodiscard]] inline torch::Tensor HessianVectorProduct(const Objective& objective,
                                                            const std::vector<torch::Tensor>& parameters,
                                                            const torch::Tensor& direction)
    {
        torch::AutoGradMode enable_grad(true);
        auto value = Details::scalar(objective);
        const auto n = Details::dimension(parameters);
        if (!value.requires_grad()) {
            return torch::zeros({n}, value.options());
        }

        auto grads = torch::autograd::grad({value}, parameters, {}, /*retain_graph=*/true, /*create_graph=*/true, /*allow_unused=*/true);
        auto flat = Details::flatten_grads(grads, parameters);
        if (!flat.requires_grad()) {
            return torch::zeros({n}, value.options());
        }
        auto projected = (flat * direction.detach().to(flat.options())).sum();
        auto product = torch::autograd::grad({projected}, parameters, {}, /*retain_graph=*/false, /*create_graph=*/false, /*allow_unused=*/true);
        return Details::flatten_grads(product, parameters).detach();
    }
}

#endif // HERMES_AUTODIFF_HPP
