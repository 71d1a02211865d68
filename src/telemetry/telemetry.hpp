#ifndef STITCH_TELEMETRY_HPP
#define STITCH_TELEMETRY_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <filesystem>
#include <memory>
#include <ostream>

#include "details/record.hpp"
#include "details/sinks.hpp"

namespace Stitch::Telemetry {
    using EpochRecord = Details::EpochRecord;
    using Sink = Details::Sink;
    using SinkPtr = std::shared_ptr<Sink>;
    using StreamSink = Details::StreamSink;
    using CsvSink = Details::CsvSink;
    using HistorySink = Details::HistorySink;

    [[nodiscard]] inline auto Console(std::ostream* stream, bool color = true) -> SinkPtr {
        return std::make_shared<StreamSink>(stream, color);
    }

    [[nodiscard]] inline auto Csv(std::filesystem::path path) -> SinkPtr {
        return std::make_shared<CsvSink>(std::move(path));
    }
}

#endif // STITCH_TELEMETRY_HPP
