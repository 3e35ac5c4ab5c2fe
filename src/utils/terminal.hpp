#ifndef HERMES_TERMINAL_HPP
#define HERMES_TERMINAL_HPP

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Hermes::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset       = "\033[0m";
        inline constexpr std::string_view kBrightBlack = "\033[90m";
        inline constexpr std::string_view kTurquoise   = "\033[38;5;49m";
        inline constexpr std::string_view kOrange      = "\033[38;5;208m";
        inline constexpr std::string_view kGoldenrod   = "\033[38;5;221m";
    }

    namespace Symbols {
        inline constexpr std::string_view kInfo = "ℹ";
        inline constexpr std::string_view kWarn = "⚠";
    }

    [[nodiscard]] inline std::string Paint(std::string_view text, std::string_view color)
    {
        std::string out;
        out.reserve(color.size() + text.size() + Colors::kReset.size());
        out.append(color).append(text).append(Colors::kReset);
        return out;
    }

    /*
     * Two-column key/value box used by `Model::describe`. Column widths grow
     * to fit the longest cell; `section()` inserts a horizontal rule before
     * the next row.
     */
    class Table {
    public:
        explicit Table(std::string_view color) : color_(color) {}

        Table& row(std::string key, std::string value)
        {
            rows_.push_back({std::move(key), std::move(value), false});
            return *this;
        }

        Table& section()
        {
            rows_.push_back({{}, {}, true});
            return *this;
        }

        void print(std::ostream& stream) const
        {
            std::size_t key_width = 0;
            std::size_t value_width = 0;
            for (const auto& entry : rows_) {
                key_width = std::max(key_width, entry.key.size());
                value_width = std::max(value_width, entry.value.size());
            }

            stream << rule("┏", "┳", "┓", key_width, value_width) << '\n';
            const auto bar = Paint("┃", color_);
            for (const auto& entry : rows_) {
                if (entry.rule) {
                    stream << rule("┣", "╋", "┫", key_width, value_width) << '\n';
                    continue;
                }
                stream << bar << ' ' << pad(entry.key, key_width) << ' '
                       << bar << ' ' << pad(entry.value, value_width) << ' ' << bar << '\n';
            }
            stream << rule("┗", "┻", "┛", key_width, value_width) << '\n';
        }

    private:
        struct Entry {
            std::string key;
            std::string value;
            bool rule;
        };

        [[nodiscard]] static std::string pad(const std::string& text, std::size_t width)
        {
            std::string out(text);
            out.append(width - text.size(), ' ');
            return out;
        }

        [[nodiscard]] std::string rule(std::string_view left, std::string_view junction, std::string_view right,
                                       std::size_t key_width, std::size_t value_width) const
        {
            std::string line(left);
            for (std::size_t i = 0; i < key_width + 2; ++i) line.append("━");
            line.append(junction);
            for (std::size_t i = 0; i < value_width + 2; ++i) line.append("━");
            line.append(right);
            return Paint(line, color_);
        }

        std::string_view color_;
        std::vector<Entry> rows_{};
    };
}

#endif // HERMES_TERMINAL_HPP
