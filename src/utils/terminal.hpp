#ifndef STITCH_UTILS_TERMINAL_HPP
#define STITCH_UTILS_TERMINAL_HPP

#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>

namespace Stitch::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";
        inline constexpr std::string_view kRed = "\033[31m";
        inline constexpr std::string_view kGreen = "\033[32m";
        inline constexpr std::string_view kYellow = "\033[33m";
        inline constexpr std::string_view kBrightBlack = "\033[90m";
    }

    namespace Symbols {
        inline constexpr std::string_view kArrowUp = "\xE2\x96\xB2";
    }

    // Sinks writing to a file or a pipe pass enabled = false.
    inline std::string ApplyColor(std::string_view text, std::string_view color, bool enabled = true) {
        std::string out;
        if (enabled) {
            out.append(color);
        }
        out.append(text);
        if (enabled) {
            out.append(Colors::kReset);
        }
        return out;
    }

    // Epoch wall time: "3.21s" under a minute, "4m05s" under an hour, then "1h02m".
    inline std::string FormatDuration(double seconds) {
        char buffer[32];
        if (seconds < 60.0) {
            std::snprintf(buffer, sizeof(buffer), "%.2fs", seconds);
            return buffer;
        }
        const auto whole = static_cast<long long>(std::floor(seconds));
        if (whole < 3600) {
            std::snprintf(buffer, sizeof(buffer), "%lldm%02llds", whole / 60, whole % 60);
        } else {
            std::snprintf(buffer, sizeof(buffer), "%lldh%02lldm", whole / 3600, (whole % 3600) / 60);
        }
        return buffer;
    }
}

#endif // STITCH_UTILS_TERMINAL_HPP
