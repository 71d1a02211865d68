#ifndef STITCH_TELEMETRY_SINKS_HPP
#define STITCH_TELEMETRY_SINKS_HPP

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/terminal.hpp"
#include "record.hpp"

namespace Stitch::Telemetry::Details {
    // Receives one record per finished epoch.
    class Sink {
    public:
        virtual ~Sink() = default;
        virtual void record(const EpochRecord& record) = 0;
    };

    class StreamSink final : public Sink {
    public:
        explicit StreamSink(std::ostream* stream, bool color = true) : stream_(stream), color_(color) {}

        void record(const EpochRecord& record) override
        {
            if (!stream_) {
                return;
            }
            namespace Terminal = Utils::Terminal;
            std::ostringstream line;
            line << "[Stitch] epoch " << std::setw(4) << record.epoch_index
                 << " | loss " << std::fixed << std::setprecision(5) << record.train_loss;
            if (record.val_loss) {
                line << " | val loss " << *record.val_loss;
            }
            if (record.val_metric) {
                std::ostringstream metric;
                metric << std::fixed << std::setprecision(4) << *record.val_metric;
                line << " | metric "
                     << (record.improved ? Terminal::ApplyColor(metric.str(), Terminal::Colors::kGreen, color_) : metric.str());
                if (record.improved) {
                    line << ' ' << Terminal::ApplyColor(Terminal::Symbols::kArrowUp, Terminal::Colors::kGreen, color_);
                }
            }
            line << " | lr " << std::scientific << std::setprecision(3) << record.learning_rate
                 << " | " << Terminal::ApplyColor(Terminal::FormatDuration(record.duration_seconds),
                                                  Terminal::Colors::kBrightBlack, color_);
            *stream_ << line.str() << std::endl;
        }

    private:
        std::ostream* stream_;
        bool color_;
    };

    // Appends one row per epoch; the header is written when the file is new or empty.
    class CsvSink final : public Sink {
    public:
        explicit CsvSink(std::filesystem::path path) : path_(std::move(path)) {}

        void record(const EpochRecord& record) override
        {
            const bool fresh = !std::filesystem::exists(path_) || std::filesystem::file_size(path_) == 0;
            std::ofstream stream(path_, std::ios::app);
            if (!stream) {
                throw std::runtime_error("Failed to open metrics file '" + path_.string() + "'.");
            }
            if (fresh) {
                stream << "epoch,train_loss,val_metric,val_loss,learning_rate,improved,duration_seconds\n";
            }
            stream << std::setprecision(10) << record.epoch_index << ',' << record.train_loss << ',';
            if (record.val_metric) {
                stream << *record.val_metric;
            }
            stream << ',';
            if (record.val_loss) {
                stream << *record.val_loss;
            }
            stream << ',' << record.learning_rate << ',' << (record.improved ? 1 : 0) << ',' << record.duration_seconds << '\n';
            if (!stream) {
                throw std::runtime_error("Failed to append to metrics file '" + path_.string() + "'.");
            }
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    class HistorySink final : public Sink {
    public:
        void record(const EpochRecord& record) override { records_.push_back(record); }

        [[nodiscard]] const std::vector<EpochRecord>& records() const noexcept { return records_; }
        void clear() noexcept { records_.clear(); }

    private:
        std::vector<EpochRecord> records_{};
    };
}

#endif // STITCH_TELEMETRY_SINKS_HPP
