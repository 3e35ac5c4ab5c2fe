#ifndef HERMES_PARAMETER_LAYOUT_HPP
#define HERMES_PARAMETER_LAYOUT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Hermes::Parameter::Details {
    struct Entry {
        std::string name{};
        std::vector<std::int64_t> shape{};
        std::int64_t offset{0};
        std::int64_t numel{0};
    };

    // Shape template of a structured model: where each parameter tensor lives inside the flat vector.
    class Layout {
    public:
        Layout() = default;

        [[nodiscard]] static Layout of(const torch::nn::Module& module)
        {
            Layout layout{};
            for (const auto& item : module.named_parameters(/*recurse=*/true)) {
                const auto& tensor = item.value();
                Entry entry{};
                entry.name = item.key();
                entry.shape = tensor.sizes().vec();
                entry.offset = layout.total_;
                entry.numel = tensor.numel();
                layout.total_ += entry.numel;
                layout.entries_.push_back(std::move(entry));
            }
            return layout;
        }

        [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }
        [[nodiscard]] std::int64_t total() const noexcept { return total_; }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    private:
        std::vector<Entry> entries_{};
        std::int64_t total_{0};
    };
}

#endif // HERMES_PARAMETER_LAYOUT_HPP
