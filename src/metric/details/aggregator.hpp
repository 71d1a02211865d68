#ifndef STITCH_METRIC_AGGREGATOR_HPP
#define STITCH_METRIC_AGGREGATOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/shape.hpp"

namespace Stitch::Metric::Details {
    // Running per-sample statistic reduced to one scalar at the end of a pass.
    class Aggregator {
    public:
        virtual ~Aggregator() = default;

        virtual void reset() = 0;

        // prediction, ground_truth: integer label maps [B, *spatial].
        virtual void update(const torch::Tensor& prediction, const torch::Tensor& ground_truth) = 0;

        // std::nullopt until at least one sample has been counted.
        [[nodiscard]] virtual std::optional<double> aggregate() const = 0;

        [[nodiscard]] virtual std::size_t sample_count() const noexcept = 0;
    };

    inline void check_label_maps(const torch::Tensor& prediction,
                                 const torch::Tensor& ground_truth,
                                 std::int64_t num_classes)
    {
        if (!prediction.defined() || !ground_truth.defined()) {
            throw std::invalid_argument("Metric update requires defined prediction and ground truth.");
        }
        if (prediction.sizes() != ground_truth.sizes()) {
            throw ShapeMismatchError(Stage::MetricAggregation,
                                     "Prediction " + Common::format_shape(prediction.sizes())
                                         + " and ground truth " + Common::format_shape(ground_truth.sizes())
                                         + " differ in shape.");
        }
        if (prediction.dim() != 3 && prediction.dim() != 4) {
            throw ShapeMismatchError(Stage::MetricAggregation,
                                     "Expected label maps [B, *spatial] with 2 or 3 spatial axes, got "
                                         + Common::format_shape(prediction.sizes()) + '.');
        }
        for (const auto* labels : {&prediction, &ground_truth}) {
            if (labels->numel() == 0) {
                continue;
            }
            const auto low = labels->min().item<std::int64_t>();
            const auto high = labels->max().item<std::int64_t>();
            if (low < 0 || high >= num_classes) {
                throw std::invalid_argument("Label values must lie in [0, " + std::to_string(num_classes) + "), found ["
                                            + std::to_string(low) + ", " + std::to_string(high) + "].");
            }
        }
    }
}

#endif // STITCH_METRIC_AGGREGATOR_HPP
