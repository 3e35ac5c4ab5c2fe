#ifndef HERMES_DATA_PARTITION_HPP
#define HERMES_DATA_PARTITION_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../common/random.hpp"
#include "dataset.hpp"

namespace Hermes::Data::Details {
    // Splits the sample axis into batches of ceil(count / size_minibatch) samples; the last one takes the remainder.
    class Partition {
    public:
        Partition() = default;

        // File order; no random source involved.
        Partition(Dataset dataset, std::int64_t size_minibatch)
            : dataset_(std::move(dataset))
        {
            const auto count = dataset_.size();
            batch_size_ = batch_size_for(count, size_minibatch);
            batch_count_ = static_cast<std::size_t>((count + batch_size_ - 1) / batch_size_);
        }

        Partition(Dataset dataset, std::int64_t size_minibatch, bool shuffle, ::Hermes::Random::Source& source)
            : Partition(std::move(dataset), size_minibatch)
        {
            const auto count = dataset_.size();
            if (shuffle && count > 1) {
                order_ = torch::tensor(source.permutation(count), torch::TensorOptions().dtype(torch::kLong));
            }
        }

        [[nodiscard]] static std::int64_t batch_size_for(std::int64_t count, std::int64_t size_minibatch)
        {
            if (size_minibatch <= 0) {
                throw ::Hermes::ConfigurationError("size_minibatch must be a positive integer, got "
                                                   + std::to_string(size_minibatch) + ".");
            }
            if (count <= 0) {
                throw ::Hermes::ConfigurationError("Cannot partition an empty split into minibatches.");
            }
            if (size_minibatch > count) {
                throw ::Hermes::ConfigurationError("size_minibatch (" + std::to_string(size_minibatch)
                                                   + ") exceeds the number of samples (" + std::to_string(count) + ").");
            }
            return (count + size_minibatch - 1) / size_minibatch;
        }

        [[nodiscard]] Batch batch(std::size_t index, torch::ScalarType dtype) const
        {
            if (index >= batch_count_) {
                throw std::out_of_range("Minibatch index " + std::to_string(index) + " is out of range (partition holds "
                                        + std::to_string(batch_count_) + " batches).");
            }
            const auto offset = static_cast<std::int64_t>(index) * batch_size_;
            const auto current = std::min<std::int64_t>(batch_size_, dataset_.size() - offset);

            Batch result{};
            if (order_.defined()) {
                auto indices = order_.narrow(0, offset, current);
                result.inputs = dataset_.inputs.index_select(0, indices.to(dataset_.inputs.device()));
                result.targets = dataset_.targets.index_select(0, indices.to(dataset_.targets.device()));
            } else {
                result.inputs = dataset_.inputs.narrow(0, offset, current);
                result.targets = dataset_.targets.narrow(0, offset, current);
            }
            return cast_floating(std::move(result), dtype);
        }

        [[nodiscard]] std::size_t size() const noexcept { return batch_count_; }
        [[nodiscard]] std::int64_t batch_size() const noexcept { return batch_size_; }
        [[nodiscard]] bool shuffled() const noexcept { return order_.defined(); }
        [[nodiscard]] const Dataset& dataset() const noexcept { return dataset_; }

    private:
        Dataset dataset_{};
        torch::Tensor order_{};
        std::int64_t batch_size_{0};
        std::size_t batch_count_{0};
    };
}

#endif // HERMES_DATA_PARTITION_HPP
