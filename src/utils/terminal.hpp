#ifndef SEQFLOW_UTILS_TERMINAL_HPP
#define SEQFLOW_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Seqflow::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset         = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck = "✔";
        inline constexpr std::string_view kInfo  = "ℹ";
        inline constexpr std::string_view kWarn  = "⚠";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Comma separated list, e.g. JoinValues({2, 1}) -> "2,1".
    template <class Container>
    inline std::string JoinValues(const Container& values) {
        std::string out;
        bool first = true;
        for (const auto& value : values) {
            if (!first) out.push_back(',');
            out.append(std::to_string(value));
            first = false;
        }
        return out;
    }
}

#endif // SEQFLOW_UTILS_TERMINAL_HPP
