#ifndef STITCH_METRIC_HPP
#define STITCH_METRIC_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>

#include "details/aggregator.hpp"
#include "details/dice.hpp"
#include "details/hausdorff.hpp"

namespace Stitch::Metric {
    using Aggregator = Details::Aggregator;
    using AggregatorPtr = std::unique_ptr<Aggregator>;

    using DiceOptions = Details::DiceOptions;
    using DiceMetric = Details::DiceMetric;
    using HausdorffOptions = Details::HausdorffOptions;
    using HausdorffMetric = Details::HausdorffMetric;

    [[nodiscard]] inline auto Dice(const DiceOptions& options = {}) -> std::unique_ptr<DiceMetric> {
        return std::make_unique<DiceMetric>(options);
    }

    [[nodiscard]] inline auto Hausdorff(const HausdorffOptions& options = {}) -> std::unique_ptr<HausdorffMetric> {
        return std::make_unique<HausdorffMetric>(options);
    }
}

#endif // STITCH_METRIC_HPP
