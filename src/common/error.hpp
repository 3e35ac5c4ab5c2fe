#ifndef HERMES_COMMON_ERROR_HPP
#define HERMES_COMMON_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Hermes {
    // Empty split, bad minibatch divisor, model without trainable parameters.
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // A flat vector that cannot be laid out over a parameter template.
    class ShapeMismatch : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // A caller buffer whose length disagrees with the problem dimension.
    class LengthMismatch : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    namespace Details {
        inline void check_length(const char* what, std::int64_t expected, std::int64_t actual)
        {
            if (expected != actual) {
                throw LengthMismatch(std::string(what) + " has length " + std::to_string(actual)
                                     + " but the problem dimension is " + std::to_string(expected) + ".");
            }
        }
    }
}

#endif // HERMES_COMMON_ERROR_HPP
