#ifndef STITCH_UTILS_PROGRESSBAR_HPP
#define STITCH_UTILS_PROGRESSBAR_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace Stitch::Utils {
    // Single-line batch counter redrawn with '\r'. Redraws only when the filled width changes
    // or the suffix does, and ends the line once total is reached or the bar is destroyed.
    class ProgressBar {
    public:
        ProgressBar(std::int64_t total, std::string label, std::ostream& stream, std::size_t width = 30)
            : total_(std::max<std::int64_t>(total, 1)), label_(std::move(label)), stream_(stream),
              width_(std::max<std::size_t>(width, 1)) {}

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        ~ProgressBar() {
            if (drawn_ && !done_) {
                stream_ << '\n' << std::flush;
            }
        }

        void update(std::int64_t current, const std::string& suffix = {}) {
            if (done_) {
                return;
            }
            current = std::clamp<std::int64_t>(current, 0, total_);
            const auto filled = static_cast<std::size_t>(current * static_cast<std::int64_t>(width_) / total_);
            if (drawn_ && filled == filled_ && suffix == suffix_ && current != total_) {
                return;
            }
            drawn_ = true;
            filled_ = filled;
            suffix_ = suffix;

            std::string line = '\r' + label_ + " |";
            line.append(filled, '#').append(width_ - filled, '.');
            line += "| " + std::to_string(current) + '/' + std::to_string(total_);
            if (!suffix.empty()) {
                line += "  " + suffix;
            }
            stream_ << line << std::flush;

            if (current == total_) {
                done_ = true;
                stream_ << '\n' << std::flush;
            }
        }

    private:
        std::int64_t total_;
        std::string label_;
        std::ostream& stream_;
        std::size_t width_;
        std::size_t filled_{0};
        std::string suffix_{};
        bool drawn_{false};
        bool done_{false};
    };
}

#endif // STITCH_UTILS_PROGRESSBAR_HPP
