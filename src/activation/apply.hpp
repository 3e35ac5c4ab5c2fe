#ifndef HERMES_ACTIVATION_APPLY_HPP
#define HERMES_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include "activation.hpp"

namespace Hermes::Activation::Details {
    // LogSoftmax normalises the class axis, i.e. dimension 1 of a [batch, classes] output.
    [[nodiscard]] inline torch::Tensor apply(const Descriptor& descriptor, const torch::Tensor& input)
    {
        switch (descriptor.type) {
            case Type::ReLU:
                return torch::relu(input);
            case Type::Tanh:
                return torch::tanh(input);
            case Type::Sigmoid:
                return torch::sigmoid(input);
            case Type::LogSoftmax:
                return input.dim() < 2 ? torch::log_softmax(input, 0) : torch::log_softmax(input, 1);
            case Type::Identity:
                break;
        }
        return input;
    }
}
#endif // HERMES_ACTIVATION_APPLY_HPP
