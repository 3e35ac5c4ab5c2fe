#ifndef HERMES_EVALUATION_EVALUATOR_HPP
#define HERMES_EVALUATION_EVALUATOR_HPP
/*
 * Objective / gradient / Hessian evaluation against a model state.
 * ---------------------------------------------------------------------------
 * Every entry point runs the same pre-step (synchronize):
 *  1. if the incoming vector's element type differs from the stored
 *     precision, the model state converts itself to it;
 *  2. the vector is written into the structured model (Parameter::Apply);
 *  3. the counters of the operation are incremented.
 * Caller buffers of another element type are rebound to the type of w.
 * Length checks run before synchronize, so a rejected call leaves the state
 * untouched. The minibatch is read once per call and never advanced here.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../autodiff/autodiff.hpp"
#include "../../common/error.hpp"
#include "../../common/precision.hpp"
#include "../../data/data.hpp"

namespace Hermes::Evaluation::Details {
    enum class Operation { Objective, Gradient, ObjectiveGradient, Hessian, HessianVector };

    inline void check_vector(const char* what, const torch::Tensor& tensor, std::int64_t n)
    {
        if (!tensor.defined()) {
            throw ::Hermes::LengthMismatch(std::string(what) + " is undefined.");
        }
        if (tensor.dim() != 1) {
            throw ::Hermes::LengthMismatch(std::string(what) + " must be one-dimensional, got "
                                           + std::to_string(tensor.dim()) + " dimensions.");
        }
        ::Hermes::Details::check_length(what, n, tensor.numel());
    }

    inline void check_matrix(const char* what, const torch::Tensor& tensor, std::int64_t n)
    {
        if (!tensor.defined() || tensor.dim() != 2 || tensor.size(0) != n || tensor.size(1) != n) {
            std::string shape = "undefined";
            if (tensor.defined()) {
                shape = "(";
                for (std::int64_t d = 0; d < tensor.dim(); ++d) {
                    shape += (d > 0 ? ", " : "") + std::to_string(tensor.size(d));
                }
                shape += ")";
            }
            throw ::Hermes::LengthMismatch(std::string(what) + " has shape " + shape + " but must be ("
                                           + std::to_string(n) + ", " + std::to_string(n) + ").");
        }
    }

    template <class Model>
    void synchronize(Model& model, const torch::Tensor& w, Operation operation)
    {
        const auto incoming = ::Hermes::to_precision(w.scalar_type());
        if (incoming != model.precision()) {
            model.convert_precision(incoming);
        }
        model.write_parameters(w);
        model.record(operation);
    }

    // Output buffers follow the precision of w: a buffer of another type is rebound, never narrowed into.
    inline void follow_precision(torch::Tensor& buffer, const torch::Tensor& w)
    {
        if (buffer.scalar_type() != w.scalar_type()) {
            buffer = torch::empty(buffer.sizes(), buffer.options().dtype(w.scalar_type()));
        }
    }

    // loss_f(chain(x), y) at whatever the parameters hold when it is invoked.
    template <class Model>
    [[nodiscard]] ::Hermes::Autodiff::Objective loss_at(Model& model, ::Hermes::Data::Batch batch)
    {
        return [&model, batch = std::move(batch)]() {
            return model.loss()(model.chain()->forward(batch.inputs), batch.targets);
        };
    }

    template <class Model>
    [[nodiscard]] double objective(Model& model, ::Hermes::Data::Split split, const torch::Tensor& w)
    {
        check_vector("Parameter vector", w, model.dimension());
        synchronize(model, w, Operation::Objective);
        torch::NoGradGuard no_grad;
        auto value = loss_at(model, model.current_minibatch(split))();
        if (!value.defined() || value.numel() != 1) {
            throw std::logic_error("Objective must produce a single scalar; check the loss reduction.");
        }
        return value.template item<double>();
    }

    template <class Model>
    torch::Tensor& gradient(Model& model, const torch::Tensor& w, torch::Tensor& g)
    {
        check_vector("Parameter vector", w, model.dimension());
        check_vector("Gradient buffer", g, model.dimension());
        synchronize(model, w, Operation::Gradient);
        follow_precision(g, w);
        auto parameters = model.chain()->parameters();
        const auto grad = ::Hermes::Autodiff::Gradient(loss_at(model, model.current_minibatch(::Hermes::Data::Split::Train)), parameters);
        g.copy_(grad);
        return g;
    }

    template <class Model>
    [[nodiscard]] double objective_and_gradient(Model& model, const torch::Tensor& w, torch::Tensor& g)
    {
        check_vector("Parameter vector", w, model.dimension());
        check_vector("Gradient buffer", g, model.dimension());
        synchronize(model, w, Operation::ObjectiveGradient);
        follow_precision(g, w);
        auto parameters = model.chain()->parameters();
        auto result = ::Hermes::Autodiff::ValueGradient(loss_at(model, model.current_minibatch(::Hermes::Data::Split::Train)), parameters);
        g.copy_(result.gradient);
        return result.value.template item<double>();
    }

    template <class Model>
    torch::Tensor& hessian(Model& model, const torch::Tensor& w, torch::Tensor& h)
    {
        check_vector("Parameter vector", w, model.dimension());
        check_matrix("Hessian buffer", h, model.dimension());
        synchronize(model, w, Operation::Hessian);
        follow_precision(h, w);
        auto parameters = model.chain()->parameters();
        h.copy_(::Hermes::Autodiff::Hessian(loss_at(model, model.current_minibatch(::Hermes::Data::Split::Train)), parameters));
        return h;
    }

    template <class Model>
    torch::Tensor& hessian_vector_product(Model& model, const torch::Tensor& w, const torch::Tensor& v, torch::Tensor& hv)
    {
        check_vector("Parameter vector", w, model.dimension());
        check_vector("Direction", v, model.dimension());
        check_vector("Hessian-vector buffer", hv, model.dimension());
        synchronize(model, w, Operation::HessianVector);
        follow_precision(hv, w);
        auto parameters = model.chain()->parameters();
        hv.copy_(::Hermes::Autodiff::HessianVectorProduct(loss_at(model, model.current_minibatch(::Hermes::Data::Split::Train)), parameters, v));
        return hv;
    }
}

#endif // HERMES_EVALUATION_EVALUATOR_HPP
