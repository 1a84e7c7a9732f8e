#ifndef SEQFLOW_UTILS_MONITOR_HPP
#define SEQFLOW_UTILS_MONITOR_HPP

#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include "terminal.hpp"

namespace Seqflow {
    struct MonitorOptions {
        bool enabled{false};
        std::ostream* stream{&std::clog};
    };

    namespace Utils {
        // Line-oriented progress reporting shared by the streaming engine.
        // Lines from concurrent tasks never interleave.
        class Monitor {
        public:
            Monitor() = default;
            explicit Monitor(MonitorOptions options) : options_(options) {}

            [[nodiscard]] bool enabled() const noexcept { return options_.enabled && options_.stream != nullptr; }

            void info(std::string_view component, std::string_view message) const
            {
                emit_(Terminal::Symbols::kInfo, Terminal::Colors::kBrightBlue, component, message);
            }

            void done(std::string_view component, std::string_view message) const
            {
                emit_(Terminal::Symbols::kCheck, Terminal::Colors::kBrightGreen, component, message);
            }

            void warn(std::string_view component, std::string_view message) const
            {
                emit_(Terminal::Symbols::kWarn, Terminal::Colors::kBrightYellow, component, message);
            }

        private:
            void emit_(std::string_view symbol,
                       std::string_view color,
                       std::string_view component,
                       std::string_view message) const
            {
                if (!enabled()) {
                    return;
                }
                using Terminal::ApplyColor;
                using Terminal::Colors::kBrightBlack;

                std::ostringstream line;
                line << ApplyColor("[Seqflow]", kBrightBlack) << ' '
                     << ApplyColor(symbol, color) << ' '
                     << ApplyColor(component, color) << ": " << message << '\n';

                static std::mutex output_mutex;
                std::lock_guard<std::mutex> lock(output_mutex);
                *options_.stream << line.str() << std::flush;
            }

            MonitorOptions options_{};
        };
    }
}

#endif // SEQFLOW_UTILS_MONITOR_HPP
