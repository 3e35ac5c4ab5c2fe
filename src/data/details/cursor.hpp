#ifndef HERMES_DATA_CURSOR_HPP
#define HERMES_DATA_CURSOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/random.hpp"
#include "../../utils/log.hpp"
#include "dataset.hpp"
#include "partition.hpp"

namespace Hermes::Data {
    enum class CursorState { Ready, Exhausted };

    struct CursorOptions {
        std::int64_t size_minibatch{100};
        bool shuffle{false};
        torch::ScalarType dtype{torch::kFloat32};
        std::optional<Batch> initial{};
    };

    /*
     * Walks one split batch by batch.
     *  - status() is the index of the batch last delivered by advance(); it is
     *    unset after construction and after reset(), so the next advance()
     *    delivers batch 0.
     *  - current() is only replaced by advance() and random_select().
     *  - Once advance() has returned false it keeps returning false until reset().
     */
    class Cursor {
    public:
        Cursor(Dataset dataset, CursorOptions options, ::Hermes::Random::Source source, ::Hermes::Utils::Log::Sink log = {})
            : dataset_(std::move(dataset))
            , size_minibatch_(options.size_minibatch)
            , shuffle_(options.shuffle)
            , dtype_(options.dtype)
            , source_(std::move(source))
            , log_(std::move(log))
        {
            partition_ = Details::Partition(dataset_, size_minibatch_, shuffle_, source_);
            if (options.initial.has_value()) {
                current_ = Details::cast_floating(std::move(*options.initial), dtype_);
            } else {
                random_select();
            }
        }

        void reset()
        {
            partition_ = Details::Partition(dataset_, size_minibatch_, shuffle_, source_);
            state_ = CursorState::Ready;
            status_.reset();
            log_.info("reset: " + std::to_string(partition_.size()) + " batches of up to "
                      + std::to_string(partition_.batch_size()) + " samples"
                      + (partition_.shuffled() ? " (shuffled)" : ""));
        }

        [[nodiscard]] bool advance()
        {
            if (state_ == CursorState::Exhausted) {
                return false;
            }
            const std::size_t next = status_.has_value() ? *status_ + 1 : 0;
            if (next >= partition_.size()) {
                state_ = CursorState::Exhausted;
                log_.info("exhausted after " + std::to_string(partition_.size()) + " batches");
                return false;
            }
            current_ = partition_.batch(next, dtype_);
            status_ = next;
            return true;
        }

        void random_select() { random_select(source_); }

        void random_select(::Hermes::Random::Source& source)
        {
            current_ = partition_.batch(source.uniform_index(partition_.size()), dtype_);
        }

        // New divisor: the partition is rebuilt, the cursor reset and the current batch redrawn.
        void resize(std::int64_t size_minibatch)
        {
            (void)Details::Partition::batch_size_for(dataset_.size(), size_minibatch);
            size_minibatch_ = size_minibatch;
            reset();
            random_select();
        }

        // Same partition, position and current batch, drawing from `source` from now on.
        [[nodiscard]] Cursor with_source(::Hermes::Random::Source source) const
        {
            Cursor copy(*this);
            copy.source_ = std::move(source);
            return copy;
        }

        // Casts the current batch and every batch materialised afterwards.
        void convert(torch::ScalarType dtype)
        {
            dtype_ = dtype;
            current_ = Details::cast_floating(std::move(current_), dtype_);
        }

        [[nodiscard]] const Batch& current() const noexcept { return current_; }
        [[nodiscard]] std::optional<std::size_t> status() const noexcept { return status_; }
        [[nodiscard]] CursorState state() const noexcept { return state_; }
        [[nodiscard]] bool exhausted() const noexcept { return state_ == CursorState::Exhausted; }
        [[nodiscard]] std::size_t batch_count() const noexcept { return partition_.size(); }
        [[nodiscard]] std::int64_t batch_size() const noexcept { return partition_.batch_size(); }
        [[nodiscard]] std::int64_t size_minibatch() const noexcept { return size_minibatch_; }
        [[nodiscard]] torch::ScalarType dtype() const noexcept { return dtype_; }
        [[nodiscard]] const Dataset& dataset() const noexcept { return dataset_; }
        [[nodiscard]] const Details::Partition& partition() const noexcept { return partition_; }

    private:
        Dataset dataset_{};
        std::int64_t size_minibatch_{100};
        bool shuffle_{false};
        torch::ScalarType dtype_{torch::kFloat32};
        ::Hermes::Random::Source source_;
        ::Hermes::Utils::Log::Sink log_{};
        Details::Partition partition_{};
        CursorState state_{CursorState::Ready};
        std::optional<std::size_t> status_{};
        Batch current_{};
    };
}

#endif // HERMES_DATA_CURSOR_HPP
