#ifndef HERMES_INITIALIZATION_APPLY_HPP
#define HERMES_INITIALIZATION_APPLY_HPP

#include <torch/torch.h>

#include "initialization.hpp"

namespace Hermes::Initialization::Details {
    // Runs while the chain is built, so the initial flat vector (x0) already reflects it.
    // Non-default schemes zero the bias.
    inline void apply(torch::nn::Linear& linear, const Descriptor& descriptor)
    {
        if (descriptor.type == Type::Default) {
            return;
        }
        torch::NoGradGuard no_grad;
        if (descriptor.type == Type::XavierUniform) {
            torch::nn::init::xavier_uniform_(linear->weight);
        } else {
            torch::nn::init::kaiming_normal_(linear->weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
        }
        if (linear->bias.defined()) {
            linear->bias.zero_();
        }
    }
}
#endif // HERMES_INITIALIZATION_APPLY_HPP
