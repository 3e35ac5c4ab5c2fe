#ifndef HERMES_DATA_DATASET_HPP
#define HERMES_DATA_DATASET_HPP

#include <cstdint>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Hermes::Data {
    enum class Split { Train, Test };

    [[nodiscard]] inline std::string to_string(Split split)
    {
        return split == Split::Train ? "train" : "test";
    }

    // Features and labels share the leading (sample) dimension.
    struct Dataset {
        torch::Tensor inputs{};
        torch::Tensor targets{};

        [[nodiscard]] std::int64_t size() const
        {
            return inputs.defined() && inputs.dim() > 0 ? inputs.size(0) : 0;
        }

        [[nodiscard]] bool empty() const { return size() == 0; }
    };

    struct Batch {
        torch::Tensor inputs{};
        torch::Tensor targets{};
    };

    namespace Details {
        inline void validate(const Dataset& dataset, Split split)
        {
            const auto label = to_string(split);
            if (dataset.empty() || !dataset.targets.defined() || dataset.targets.dim() == 0 || dataset.targets.size(0) == 0) {
                throw ::Hermes::ConfigurationError("The " + label + " split is empty; both train and test data must hold at least one sample.");
            }
            if (dataset.targets.size(0) != dataset.inputs.size(0)) {
                throw ::Hermes::ConfigurationError("The " + label + " split has " + std::to_string(dataset.inputs.size(0))
                                                   + " inputs but " + std::to_string(dataset.targets.size(0)) + " targets.");
            }
        }

        // Integer labels (class indices) keep their type; only floating tensors follow the model precision.
        [[nodiscard]] inline torch::Tensor cast_floating(torch::Tensor tensor, torch::ScalarType dtype)
        {
            if (tensor.defined() && tensor.is_floating_point() && tensor.scalar_type() != dtype) {
                return tensor.to(dtype);
            }
            return tensor;
        }

        [[nodiscard]] inline Batch cast_floating(Batch batch, torch::ScalarType dtype)
        {
            batch.inputs = cast_floating(std::move(batch.inputs), dtype);
            batch.targets = cast_floating(std::move(batch.targets), dtype);
            return batch;
        }
    }
}

#endif // HERMES_DATA_DATASET_HPP
