#ifndef HERMES_TRAINING_CALLBACK_HPP
#define HERMES_TRAINING_CALLBACK_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include "../data/data.hpp"

namespace Hermes::Training {
    /*
     * Hook for an external optimizer loop, invoked once per iteration.
     * Moves the training cursor to the next minibatch; when the split is
     * exhausted the cursor is reset (new epoch, reshuffled when enabled) and
     * advanced again. Returns true when the call closed an epoch.
     */
    template <class Model>
    class MinibatchCallback {
    public:
        explicit MinibatchCallback(Model& model, ::Hermes::Data::Split split = ::Hermes::Data::Split::Train)
            : model_(&model), split_(split) {}

        bool operator()()
        {
            ++iterations_;
            if (model_->minibatch_next(split_)) {
                return false;
            }
            ++epochs_;
            model_->reset_minibatch(split_);
            if (!model_->minibatch_next(split_)) {
                throw std::logic_error("A freshly reset cursor produced no minibatch.");
            }
            return true;
        }

        [[nodiscard]] std::size_t epochs() const noexcept { return epochs_; }
        [[nodiscard]] std::size_t iterations() const noexcept { return iterations_; }

    private:
        Model* model_;
        ::Hermes::Data::Split split_;
        std::size_t epochs_{0};
        std::size_t iterations_{0};
    };
}

#endif // HERMES_TRAINING_CALLBACK_HPP
