#ifndef HERMES_EVALUATION_HPP
#define HERMES_EVALUATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <utility>

#include <torch/torch.h>

#include "details/classification.hpp"
#include "details/evaluator.hpp"

namespace Hermes::Evaluation {
    template <class Model>
    [[nodiscard]] inline double Objective(Model& model, const torch::Tensor& w) {
        return Details::objective(model, ::Hermes::Data::Split::Train, w);
    }

    template <class Model>
    inline torch::Tensor& Gradient(Model& model, const torch::Tensor& w, torch::Tensor& g) {
        return Details::gradient(model, w, g);
    }

    template <class Model>
    [[nodiscard]] inline torch::Tensor Gradient(Model& model, const torch::Tensor& w) {
        auto g = torch::empty_like(w);
        Details::gradient(model, w, g);
        return g;
    }

    template <class Model>
    inline std::pair<double, torch::Tensor> ObjectiveGradient(Model& model, const torch::Tensor& w, torch::Tensor& g) {
        const double f = Details::objective_and_gradient(model, w, g);
        return {f, g};
    }

    template <class Model>
    inline torch::Tensor& Hessian(Model& model, const torch::Tensor& w, torch::Tensor& h) {
        return Details::hessian(model, w, h);
    }

    template <class Model>
    [[nodiscard]] inline torch::Tensor Hessian(Model& model, const torch::Tensor& w) {
        auto h = torch::empty({w.numel(), w.numel()}, w.options());
        Details::hessian(model, w, h);
        return h;
    }

    template <class Model>
    inline torch::Tensor& HessianVectorProduct(Model& model, const torch::Tensor& w, const torch::Tensor& v, torch::Tensor& hv) {
        return Details::hessian_vector_product(model, w, v, hv);
    }

    template <class Model>
    [[nodiscard]] inline double Accuracy(Model& model, ::Hermes::Data::Split split = ::Hermes::Data::Split::Test) {
        return Details::Classification::accuracy(model, model.cursor(split).dataset());
    }

    template <class Model>
    [[nodiscard]] inline double Accuracy(Model& model, const ::Hermes::Data::Dataset& dataset) {
        return Details::Classification::accuracy(model, dataset);
    }
}

#endif //HERMES_EVALUATION_HPP
