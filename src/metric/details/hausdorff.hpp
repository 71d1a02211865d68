#ifndef STITCH_METRIC_HAUSDORFF_HPP
#define STITCH_METRIC_HAUSDORFF_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cmath>
#include <limits>
#include <optional>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "aggregator.hpp"

namespace Stitch::Metric::Details {
    struct HausdorffOptions {
        std::int64_t num_classes{2};
        bool include_background{false};
        double percentile{95.0};
        // Surface points per side of one distance block; memory is chunk_size^2 doubles.
        std::int64_t chunk_size{2048};
    };

    // Foreground voxels with at least one background (or out-of-volume) neighbour
    // in their 3^k neighbourhood. mask: bool [*spatial], k = 2 or 3.
    [[nodiscard]] inline torch::Tensor surface(const torch::Tensor& mask)
    {
        auto background = (~mask).to(torch::kFloat32).unsqueeze(0).unsqueeze(0);
        std::vector<std::int64_t> pads(static_cast<std::size_t>(mask.dim()) * 2, 1);
        background = torch::constant_pad_nd(background, pads, 1.0);
        torch::Tensor touches;
        if (mask.dim() == 3) {
            touches = torch::max_pool3d(background, {3, 3, 3}, {1, 1, 1});
        } else {
            touches = torch::max_pool2d(background, {3, 3}, {1, 1});
        }
        return mask & touches.squeeze(0).squeeze(0).gt(0.5);
    }

    // Distance from every row of `from` to its nearest row of `to`, evaluated in
    // chunk x chunk blocks. from: [P, k], to: [Q, k]; returns [P].
    [[nodiscard]] inline torch::Tensor nearest_distances(const torch::Tensor& from, const torch::Tensor& to, std::int64_t chunk)
    {
        std::vector<torch::Tensor> nearest;
        for (const auto& rows : from.split(chunk)) {
            torch::Tensor best;
            for (const auto& columns : to.split(chunk)) {
                auto block = std::get<0>(torch::cdist(rows, columns, 2).min(1));
                best = best.defined() ? torch::minimum(best, block) : block;
            }
            nearest.push_back(best);
        }
        return torch::cat(nearest);
    }

    // Symmetric percentile surface distance in voxel units. Both masks empty
    // gives 0, exactly one empty gives +inf.
    [[nodiscard]] inline double hausdorff_distance(const torch::Tensor& prediction,
                                                   const torch::Tensor& ground_truth,
                                                   double percentile,
                                                   std::int64_t chunk = 2048)
    {
        const bool predicted = prediction.any().item<bool>();
        const bool expected = ground_truth.any().item<bool>();
        if (!predicted && !expected) {
            return 0.0;
        }
        if (!predicted || !expected) {
            return std::numeric_limits<double>::infinity();
        }

        auto predicted_points = torch::nonzero(surface(prediction)).to(torch::kDouble);
        auto expected_points = torch::nonzero(surface(ground_truth)).to(torch::kDouble);

        const auto q = percentile / 100.0;
        const auto forward = torch::quantile(nearest_distances(predicted_points, expected_points, chunk), q).item<double>();
        const auto backward = torch::quantile(nearest_distances(expected_points, predicted_points, chunk), q).item<double>();
        return std::max(forward, backward);
    }

    class HausdorffMetric final : public Aggregator {
    public:
        explicit HausdorffMetric(HausdorffOptions options = {}) : options_(options)
        {
            if (options_.num_classes < 1 || first_class() >= options_.num_classes) {
                throw ConfigurationError("Hausdorff metric has no class to score.", Stage::MetricAggregation);
            }
            if (!(options_.percentile > 0.0) || options_.percentile > 100.0) {
                throw ConfigurationError("Hausdorff percentile must lie in (0, 100].", Stage::MetricAggregation);
            }
            if (options_.chunk_size < 1) {
                throw ConfigurationError("Hausdorff chunk_size must be at least 1.", Stage::MetricAggregation);
            }
        }

        void reset() override
        {
            sum_ = 0.0;
            count_ = 0;
            not_computable_ = 0;
        }

        void update(const torch::Tensor& prediction, const torch::Tensor& ground_truth) override
        {
            check_label_maps(prediction, ground_truth, options_.num_classes);
            const auto predicted = prediction.to(torch::kCPU, torch::kLong);
            const auto expected = ground_truth.to(torch::kCPU, torch::kLong);

            for (std::int64_t sample = 0; sample < predicted.size(0); ++sample) {
                double sample_sum = 0.0;
                std::size_t computed = 0;
                for (std::int64_t label = first_class(); label < options_.num_classes; ++label) {
                    const auto distance = hausdorff_distance(predicted[sample].eq(label),
                                                             expected[sample].eq(label),
                                                             options_.percentile,
                                                             options_.chunk_size);
                    if (std::isinf(distance)) {
                        ++not_computable_;
                        continue;
                    }
                    sample_sum += distance;
                    ++computed;
                }
                if (computed > 0) {
                    sum_ += sample_sum / static_cast<double>(computed);
                    ++count_;
                }
            }
        }

        [[nodiscard]] std::optional<double> aggregate() const override
        {
            if (count_ == 0) {
                return std::nullopt;
            }
            return sum_ / static_cast<double>(count_);
        }

        [[nodiscard]] std::size_t sample_count() const noexcept override { return count_; }

        // Class-sample pairs skipped because exactly one side was empty.
        [[nodiscard]] std::size_t not_computable() const noexcept { return not_computable_; }

    private:
        [[nodiscard]] std::int64_t first_class() const noexcept { return options_.include_background ? 0 : 1; }

        HausdorffOptions options_;
        double sum_{0.0};
        std::size_t count_{0};
        std::size_t not_computable_{0};
    };
}

#endif // STITCH_METRIC_HAUSDORFF_HPP
