#ifndef HERMES_COMMON_RANDOM_HPP
#define HERMES_COMMON_RANDOM_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

namespace Hermes::Random {
    // Shared handle over one engine: the model and both cursors draw from the same sequence.
    class Source {
    public:
        using Engine = std::mt19937_64;

        Source() : engine_(std::make_shared<Engine>(std::random_device{}())) {}

        explicit Source(std::uint64_t seed) : engine_(std::make_shared<Engine>(seed)) {}

        [[nodiscard]] static Source from(std::optional<std::uint64_t> seed)
        {
            return seed.has_value() ? Source(*seed) : Source();
        }

        // Independent engine seeded from this one; the two sequences no longer interact.
        [[nodiscard]] Source fork()
        {
            return Source(static_cast<std::uint64_t>((*engine_)()));
        }

        [[nodiscard]] std::size_t uniform_index(std::size_t count)
        {
            if (count == 0) {
                throw std::invalid_argument("Cannot draw an index from an empty range.");
            }
            std::uniform_int_distribution<std::size_t> distribution(0, count - 1);
            return distribution(*engine_);
        }

        [[nodiscard]] std::vector<std::int64_t> permutation(std::int64_t count)
        {
            std::vector<std::int64_t> order(static_cast<std::size_t>(count));
            for (std::int64_t i = 0; i < count; ++i) {
                order[static_cast<std::size_t>(i)] = i;
            }
            std::shuffle(order.begin(), order.end(), *engine_);
            return order;
        }

    private:
        std::shared_ptr<Engine> engine_;
    };
}

#endif // HERMES_COMMON_RANDOM_HPP
