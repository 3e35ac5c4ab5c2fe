#ifndef HERMES_EVALUATION_CLASSIFICATION_HPP
#define HERMES_EVALUATION_CLASSIFICATION_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../common/precision.hpp"
#include "../../data/data.hpp"

namespace Hermes::Evaluation::Details::Classification {
    // [batch, classes] -> argmax over classes; a single output column is read as a binary logit.
    [[nodiscard]] inline torch::Tensor predicted_classes(const torch::Tensor& logits)
    {
        if (logits.dim() == 1 || (logits.dim() == 2 && logits.size(1) == 1)) {
            return logits.reshape({-1}).gt(0).to(torch::kLong);
        }
        return logits.argmax(1).to(torch::kLong);
    }

    [[nodiscard]] inline torch::Tensor target_classes(const torch::Tensor& targets)
    {
        if (targets.dim() > 1 && targets.size(1) > 1) {
            return targets.argmax(1).to(torch::kLong);
        }
        if (targets.is_floating_point()) {
            return targets.reshape({-1}).round().to(torch::kLong);
        }
        return targets.reshape({-1}).to(torch::kLong);
    }

    /*
     * One full, unshuffled pass over `dataset` in batches of the model's
     * minibatch divisor. Reads the parameters as they are; touches neither
     * cursors nor counters.
     */
    template <class Model>
    [[nodiscard]] double accuracy(Model& model, const ::Hermes::Data::Dataset& dataset)
    {
        ::Hermes::Data::Details::validate(dataset, ::Hermes::Data::Split::Test);
        const ::Hermes::Data::Details::Partition pass(dataset, std::min<std::int64_t>(model.size_minibatch(), dataset.size()));
        const auto dtype = ::Hermes::to_scalar_type(model.precision());

        torch::NoGradGuard no_grad;
        std::int64_t correct = 0;
        std::int64_t total = 0;
        for (std::size_t index = 0; index < pass.size(); ++index) {
            const auto batch = pass.batch(index, dtype);
            const auto logits = model.chain()->forward(batch.inputs);
            const auto predicted = predicted_classes(logits);
            const auto expected = target_classes(batch.targets).to(predicted.device());
            if (predicted.numel() != expected.numel()) {
                throw std::invalid_argument("Accuracy requires one label per prediction; got "
                                            + std::to_string(predicted.numel()) + " predictions and "
                                            + std::to_string(expected.numel()) + " labels.");
            }
            correct += predicted.eq(expected).sum().template item<std::int64_t>();
            total += predicted.numel();
        }
        return total > 0 ? static_cast<double>(correct) / static_cast<double>(total) : 0.0;
    }
}

#endif // HERMES_EVALUATION_CLASSIFICATION_HPP
