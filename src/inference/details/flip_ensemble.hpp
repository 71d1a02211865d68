#ifndef STITCH_INFERENCE_FLIP_ENSEMBLE_HPP
#define STITCH_INFERENCE_FLIP_ENSEMBLE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/shape.hpp"
#include "../../network.hpp"

namespace Stitch::Inference::Details {
    enum class FlipPreset {
        Identity,
        SingleAxis,
        Exhaustive
    };

    [[nodiscard]] constexpr std::string_view to_string(FlipPreset preset) noexcept
    {
        switch (preset) {
            case FlipPreset::Identity: return "identity";
            case FlipPreset::SingleAxis: return "single_axis";
            case FlipPreset::Exhaustive: return "exhaustive";
        }
        return "exhaustive";
    }

    // Axes are spatial indices (0 = first spatial axis). A non-empty `flip_sets`
    // replaces the preset.
    struct FlipOptions {
        FlipPreset preset{FlipPreset::Exhaustive};
        std::vector<std::vector<std::int64_t>> flip_sets{};
    };

    [[nodiscard]] inline std::vector<std::vector<std::int64_t>> preset_flip_sets(FlipPreset preset, std::size_t spatial_dims)
    {
        std::vector<std::vector<std::int64_t>> sets{{}};
        if (preset == FlipPreset::Identity) {
            return sets;
        }
        if (preset == FlipPreset::SingleAxis) {
            for (std::size_t axis = 0; axis < spatial_dims; ++axis) {
                sets.push_back({static_cast<std::int64_t>(axis)});
            }
            return sets;
        }

        // Every subset, ordered by size then lexicographically.
        sets.clear();
        const std::size_t total = std::size_t{1} << spatial_dims;
        for (std::size_t mask = 0; mask < total; ++mask) {
            std::vector<std::int64_t> axes;
            for (std::size_t axis = 0; axis < spatial_dims; ++axis) {
                if (mask & (std::size_t{1} << axis)) {
                    axes.push_back(static_cast<std::int64_t>(axis));
                }
            }
            sets.push_back(std::move(axes));
        }
        std::stable_sort(sets.begin(), sets.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.size() < rhs.size();
        });
        return sets;
    }

    class FlipEnsembler {
    public:
        FlipEnsembler(std::size_t spatial_dims, FlipOptions options = {})
            : spatial_dims_(spatial_dims), options_(std::move(options))
        {
            if (spatial_dims_ == 0) {
                throw ConfigurationError("Flip ensembling requires at least one spatial axis.");
            }
            flip_sets_ = options_.flip_sets.empty() ? preset_flip_sets(options_.preset, spatial_dims_) : options_.flip_sets;
            validate();
        }

        [[nodiscard]] const std::vector<std::vector<std::int64_t>>& flip_sets() const noexcept { return flip_sets_; }
        [[nodiscard]] std::size_t size() const noexcept { return flip_sets_.size(); }
        [[nodiscard]] std::size_t spatial_dims() const noexcept { return spatial_dims_; }

        // input: [..., C, *S]; predictor: [..., C, *S] -> [..., K, *S]. Returns the
        // mean softmax over every flip set. Any predictor failure aborts the pass.
        [[nodiscard]] torch::Tensor probabilities(const torch::Tensor& input, const Predictor& predictor) const
        {
            const auto spatial = static_cast<std::int64_t>(spatial_dims_);
            if (!input.defined() || input.dim() < spatial + 1) {
                throw ShapeMismatchError(Stage::PredictorCall,
                                         "Flip ensembling expects [C, *spatial] input with " + std::to_string(spatial)
                                             + " spatial axes.");
            }

            torch::Tensor sum;
            for (const auto& axes : flip_sets_) {
                auto view = axes.empty() ? input : input.flip(tensor_dims(axes, input.dim()));
                auto scores = predictor(view);
                if (!scores.defined() || scores.dim() != input.dim()
                    || Common::spatial_extent(scores, spatial_dims_) != Common::spatial_extent(input, spatial_dims_)) {
                    throw ShapeMismatchError(Stage::PredictorCall,
                                             "Predictor returned "
                                                 + (scores.defined() ? Common::format_shape(scores.sizes()) : std::string{"undefined"})
                                                 + " for flipped input " + Common::format_shape(view.sizes()) + '.');
                }
                auto probabilities = torch::softmax(scores.to(torch::kFloat32), scores.dim() - spatial - 1);
                if (!axes.empty()) {
                    probabilities = probabilities.flip(tensor_dims(axes, probabilities.dim()));
                }
                sum = sum.defined() ? sum + probabilities : probabilities;
            }
            return sum / static_cast<double>(flip_sets_.size());
        }

        // Arg-max class per voxel of the ensemble mean: [..., *S] int64.
        [[nodiscard]] torch::Tensor predict(const torch::Tensor& input, const Predictor& predictor) const
        {
            auto mean = probabilities(input, predictor);
            return mean.argmax(mean.dim() - static_cast<std::int64_t>(spatial_dims_) - 1);
        }

    private:
        [[nodiscard]] std::vector<std::int64_t> tensor_dims(const std::vector<std::int64_t>& axes, std::int64_t rank) const
        {
            std::vector<std::int64_t> dims;
            dims.reserve(axes.size());
            for (const auto axis : axes) {
                dims.push_back(rank - static_cast<std::int64_t>(spatial_dims_) + axis);
            }
            return dims;
        }

        void validate() const
        {
            if (flip_sets_.empty()) {
                throw ConfigurationError("Flip ensembling requires at least one flip set.");
            }
            std::set<std::vector<std::int64_t>> seen;
            for (const auto& axes : flip_sets_) {
                auto sorted = axes;
                std::sort(sorted.begin(), sorted.end());
                if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
                    throw ConfigurationError("Flip set " + Common::format_shape(axes) + " repeats an axis.");
                }
                for (const auto axis : sorted) {
                    if (axis < 0 || axis >= static_cast<std::int64_t>(spatial_dims_)) {
                        throw ConfigurationError("Flip axis " + std::to_string(axis) + " is outside the "
                                                 + std::to_string(spatial_dims_) + " spatial axes.");
                    }
                }
                if (!seen.insert(sorted).second) {
                    throw ConfigurationError("Flip set " + Common::format_shape(axes) + " is listed twice.");
                }
            }
        }

        std::size_t spatial_dims_;
        FlipOptions options_;
        std::vector<std::vector<std::int64_t>> flip_sets_{};
    };
}

#endif // STITCH_INFERENCE_FLIP_ENSEMBLE_HPP
