#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "support/fixtures.hpp"

namespace {
    std::vector<std::string> read_lines(const std::filesystem::path& path)
    {
        std::ifstream stream(path);
        std::vector<std::string> lines;
        for (std::string line; std::getline(stream, line);) {
            lines.push_back(line);
        }
        return lines;
    }
}

TEST(TelemetrySinks, CsvWritesHeaderOnce)
{
    StitchTest::TemporaryDirectory directory;
    const auto path = directory.path() / "metrics.csv";
    auto sink = Stitch::Telemetry::Csv(path);
    sink->record({.epoch_index = 1, .train_loss = 0.5, .val_metric = 0.25, .learning_rate = 0.01, .improved = true});
    sink->record({.epoch_index = 2, .train_loss = 0.4, .learning_rate = 0.01});

    const auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "epoch,train_loss,val_metric,val_loss,learning_rate,improved,duration_seconds");
    EXPECT_EQ(lines[1].rfind("1,0.5,0.25,,0.01,1,", 0), 0u) << lines[1];
    EXPECT_EQ(lines[2].rfind("2,0.4,,,0.01,0,", 0), 0u) << lines[2];

    auto reopened = Stitch::Telemetry::Csv(path);
    reopened->record({.epoch_index = 3});
    EXPECT_EQ(read_lines(path).size(), 4u);
}

TEST(TelemetrySinks, ConsoleLineNamesTheEpoch)
{
    std::ostringstream stream;
    auto sink = Stitch::Telemetry::Console(&stream, false);
    sink->record({.epoch_index = 7, .train_loss = 0.125, .val_metric = 0.5, .learning_rate = 1e-3, .improved = true});
    const auto line = stream.str();
    EXPECT_NE(line.find("[Stitch] epoch"), std::string::npos);
    EXPECT_NE(line.find("7"), std::string::npos);
    EXPECT_NE(line.find("metric 0.5000"), std::string::npos);
    EXPECT_EQ(line.find("\033["), std::string::npos);

    Stitch::Telemetry::StreamSink silent(nullptr);
    EXPECT_NO_THROW(silent.record({}));
}

TEST(TelemetrySinks, HistoryRoundTripsThroughJson)
{
    Stitch::Telemetry::HistorySink history;
    history.record({.epoch_index = 1, .train_loss = 0.9, .val_loss = 0.8, .learning_rate = 1e-2});
    history.record({.epoch_index = 2, .train_loss = 0.7, .val_metric = 0.6, .learning_rate = 5e-3, .improved = true});

    const auto text = Stitch::Common::SaveLoad::to_json_string(
        Stitch::Telemetry::Details::history_to_tree(history.records()));
    const auto restored = Stitch::Telemetry::Details::history_from_tree(
        Stitch::Common::SaveLoad::from_json_string(text, Stitch::Stage::CheckpointRead));

    ASSERT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored[0].val_loss, 0.8);
    EXPECT_FALSE(restored[0].val_metric.has_value());
    EXPECT_TRUE(restored[1].improved);
    EXPECT_DOUBLE_EQ(restored[1].learning_rate, 5e-3);
}
