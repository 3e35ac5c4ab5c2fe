#ifndef HERMES_COMMON_PRECISION_HPP
#define HERMES_COMMON_PRECISION_HPP

#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Hermes {
    enum class Precision {
        Float16,
        BFloat16,
        Float32,
        Float64,
    };

    [[nodiscard]] inline torch::ScalarType to_scalar_type(Precision precision)
    {
        switch (precision) {
            case Precision::Float16: return torch::kFloat16;
            case Precision::BFloat16: return torch::kBFloat16;
            case Precision::Float64: return torch::kFloat64;
            case Precision::Float32:
            default: return torch::kFloat32;
        }
    }

    [[nodiscard]] inline Precision to_precision(torch::ScalarType type)
    {
        switch (type) {
            case torch::kFloat16: return Precision::Float16;
            case torch::kBFloat16: return Precision::BFloat16;
            case torch::kFloat32: return Precision::Float32;
            case torch::kFloat64: return Precision::Float64;
            default:
                throw std::invalid_argument(std::string("Unsupported parameter element type '")
                                            + c10::toString(type) + "'; expected a floating point type.");
        }
    }

    [[nodiscard]] inline std::string to_string(Precision precision)
    {
        switch (precision) {
            case Precision::Float16: return "Float16";
            case Precision::BFloat16: return "BFloat16";
            case Precision::Float32: return "Float32";
            case Precision::Float64: return "Float64";
        }
        return "UnknownPrecision";
    }
}

#endif // HERMES_COMMON_PRECISION_HPP
