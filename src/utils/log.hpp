#ifndef HERMES_LOG_HPP
#define HERMES_LOG_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "terminal.hpp"

namespace Hermes::Utils::Log {
    enum class Level { Info, Warning };

    // Writes "[Hermes:<scope>] message" lines to a borrowed stream; a null stream or a disabled sink is silent.
    class Sink {
    public:
        Sink() = default;

        Sink(std::ostream* stream, bool enabled, std::string scope = {})
            : stream_(stream), enabled_(enabled), scope_(std::move(scope)) {}

        [[nodiscard]] Sink scoped(std::string scope) const { return Sink(stream_, enabled_, std::move(scope)); }

        [[nodiscard]] bool enabled() const noexcept { return enabled_ && stream_ != nullptr; }

        void info(std::string_view message) const { write(Level::Info, message); }
        void warn(std::string_view message) const { write(Level::Warning, message); }

    private:
        void write(Level level, std::string_view message) const
        {
            if (!enabled()) {
                return;
            }
            using namespace Terminal;
            const auto symbol = level == Level::Warning
                ? Paint(Symbols::kWarn, Colors::kOrange)
                : Paint(Symbols::kInfo, Colors::kTurquoise);
            std::string tag = "[Hermes";
            if (!scope_.empty()) {
                tag.append(":").append(scope_);
            }
            tag.append("]");
            (*stream_) << symbol << ' ' << Paint(tag, Colors::kBrightBlack) << ' ' << message << '\n';
        }

        std::ostream* stream_{nullptr};
        bool enabled_{false};
        std::string scope_{};
    };
}

#endif // HERMES_LOG_HPP
