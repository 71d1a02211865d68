#ifndef STITCH_METRIC_DICE_HPP
#define STITCH_METRIC_DICE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "aggregator.hpp"

namespace Stitch::Metric::Details {
    struct DiceOptions {
        std::int64_t num_classes{2};
        bool include_background{false};
    };

    // 2|A n B| / (|A| + |B|) per class, with 1.0 when the class is absent from both.
    [[nodiscard]] inline double dice_score(const torch::Tensor& prediction, const torch::Tensor& ground_truth, std::int64_t label)
    {
        const auto predicted = prediction.eq(label);
        const auto expected = ground_truth.eq(label);
        const auto intersection = (predicted & expected).sum().item<std::int64_t>();
        const auto total = predicted.sum().item<std::int64_t>() + expected.sum().item<std::int64_t>();
        if (total == 0) {
            return 1.0;
        }
        return 2.0 * static_cast<double>(intersection) / static_cast<double>(total);
    }

    class DiceMetric final : public Aggregator {
    public:
        explicit DiceMetric(DiceOptions options = {}) : options_(options)
        {
            if (options_.num_classes < 1) {
                throw ConfigurationError("Dice metric requires num_classes >= 1.", Stage::MetricAggregation);
            }
            if (first_class() >= options_.num_classes) {
                throw ConfigurationError("Dice metric has no foreground class to score; set include_background or raise num_classes.",
                                         Stage::MetricAggregation);
            }
            reset();
        }

        void reset() override
        {
            sum_ = 0.0;
            count_ = 0;
            class_sums_.assign(static_cast<std::size_t>(options_.num_classes - first_class()), 0.0);
        }

        void update(const torch::Tensor& prediction, const torch::Tensor& ground_truth) override
        {
            check_label_maps(prediction, ground_truth, options_.num_classes);
            const auto predicted = prediction.to(torch::kCPU, torch::kLong);
            const auto expected = ground_truth.to(torch::kCPU, torch::kLong);

            for (std::int64_t sample = 0; sample < predicted.size(0); ++sample) {
                const auto sample_prediction = predicted[sample];
                const auto sample_truth = expected[sample];
                double sample_sum = 0.0;
                for (std::int64_t label = first_class(); label < options_.num_classes; ++label) {
                    const auto score = dice_score(sample_prediction, sample_truth, label);
                    class_sums_[static_cast<std::size_t>(label - first_class())] += score;
                    sample_sum += score;
                }
                sum_ += sample_sum / static_cast<double>(class_sums_.size());
                ++count_;
            }
        }

        [[nodiscard]] std::optional<double> aggregate() const override
        {
            if (count_ == 0) {
                return std::nullopt;
            }
            return sum_ / static_cast<double>(count_);
        }

        // Mean score per scored class, background first when it is included.
        [[nodiscard]] std::vector<double> per_class() const
        {
            std::vector<double> means(class_sums_.size(), 0.0);
            if (count_ == 0) {
                return means;
            }
            for (std::size_t index = 0; index < class_sums_.size(); ++index) {
                means[index] = class_sums_[index] / static_cast<double>(count_);
            }
            return means;
        }

        [[nodiscard]] std::size_t sample_count() const noexcept override { return count_; }
        [[nodiscard]] const DiceOptions& options() const noexcept { return options_; }

    private:
        [[nodiscard]] std::int64_t first_class() const noexcept { return options_.include_background ? 0 : 1; }

        DiceOptions options_;
        double sum_{0.0};
        std::size_t count_{0};
        std::vector<double> class_sums_{};
    };
}

#endif // STITCH_METRIC_DICE_HPP
