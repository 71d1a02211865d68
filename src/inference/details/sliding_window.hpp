#ifndef STITCH_INFERENCE_SLIDING_WINDOW_HPP
#define STITCH_INFERENCE_SLIDING_WINDOW_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/cancellation.hpp"
#include "../../common/errors.hpp"
#include "../../common/shape.hpp"
#include "../../network.hpp"
#include "importance.hpp"
#include "invoke.hpp"
#include "window_plan.hpp"

namespace Stitch::Inference::Details {
    struct SlidingWindowOptions {
        std::vector<std::int64_t> roi_size{};
        double overlap{0.25};
        std::size_t batch_size{1};
        BlendMode mode{BlendMode::Constant};
        double sigma_scale{0.125};
        bool pad{true};
        double pad_value{0.0};
        std::optional<std::int64_t> num_classes{};
        std::optional<torch::Device> accumulation_device{};
        Common::CancellationToken cancellation{};
        std::ostream* stream{nullptr};
    };

    // Weighted sum of per-window scores plus the matching weight sum; one per
    // volume being inferred.
    class Accumulator {
    public:
        Accumulator(std::int64_t num_classes, const std::vector<std::int64_t>& extent, torch::Tensor importance)
            : importance_(std::move(importance))
        {
            std::vector<std::int64_t> shape{num_classes};
            shape.insert(shape.end(), extent.begin(), extent.end());
            scores_ = torch::zeros(shape, importance_.options());
            weights_ = torch::zeros(extent, importance_.options());
        }

        // scores: [K, *roi]
        void add(const Window& window, const torch::Tensor& scores)
        {
            auto score_region = region(scores_, window, 1);
            auto weight_region = region(weights_, window, 0);
            score_region.add_(scores.to(scores_.options()) * importance_);
            weight_region.add_(importance_);
        }

        [[nodiscard]] const torch::Tensor& weight_sum() const noexcept { return weights_; }

        [[nodiscard]] torch::Tensor finalize() const
        {
            if ((weights_ <= 0).any().item<bool>()) {
                throw std::logic_error("Window plan left voxels without accumulated weight.");
            }
            return scores_ / weights_.unsqueeze(0);
        }

    private:
        static torch::Tensor region(const torch::Tensor& buffer, const Window& window, std::int64_t leading)
        {
            auto view = buffer;
            for (std::size_t axis = 0; axis < window.offset.size(); ++axis) {
                view = view.narrow(leading + static_cast<std::int64_t>(axis), window.offset[axis], window.size[axis]);
            }
            return view;
        }

        torch::Tensor importance_;
        torch::Tensor scores_;
        torch::Tensor weights_;
    };

    struct InferenceReport {
        torch::Tensor scores{};
        torch::Tensor weight_sum{};
        WindowPlan plan{};
        std::size_t predictor_calls{0};
        std::size_t batch_size{0};
    };

    class SlidingWindowInferer {
    public:
        explicit SlidingWindowInferer(SlidingWindowOptions options) : options_(std::move(options))
        {
            validate_window_settings(options_.roi_size, options_.overlap);
            if (options_.roi_size.size() != 2 && options_.roi_size.size() != 3) {
                throw ConfigurationError("Sliding-window inference supports 2 or 3 spatial axes, got roi_size "
                                             + Common::format_shape(options_.roi_size) + '.',
                                         Stage::WindowConstruction);
            }
            if (options_.batch_size == 0) {
                throw ConfigurationError("Sliding-window batch_size must be at least 1.", Stage::WindowConstruction);
            }
            if (options_.num_classes && *options_.num_classes <= 0) {
                throw ConfigurationError("num_classes must be positive.", Stage::WindowConstruction);
            }
        }

        [[nodiscard]] const SlidingWindowOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::size_t spatial_dims() const noexcept { return options_.roi_size.size(); }

        [[nodiscard]] WindowPlan plan(const std::vector<std::int64_t>& volume_extent) const
        {
            return make_window_plan(volume_extent, options_.roi_size, options_.overlap, options_.pad);
        }

        // volume: [C, *S] -> [K, *S], or [B, C, *S] -> [B, K, *S].
        [[nodiscard]] torch::Tensor infer(const torch::Tensor& volume, const Predictor& predictor) const
        {
            const auto spatial = static_cast<std::int64_t>(spatial_dims());
            if (volume.defined() && volume.dim() == spatial + 2) {
                std::vector<torch::Tensor> outputs;
                outputs.reserve(static_cast<std::size_t>(volume.size(0)));
                for (std::int64_t index = 0; index < volume.size(0); ++index) {
                    outputs.push_back(infer_with_report(volume[index], predictor).scores);
                }
                return torch::stack(outputs);
            }
            return infer_with_report(volume, predictor).scores;
        }

        // Full-volume predictor over `predictor`, suitable for wrapping in a FlipEnsembler.
        [[nodiscard]] Predictor bind(Predictor predictor) const
        {
            return [inferer = *this, predictor = std::move(predictor)](const torch::Tensor& volume) {
                return inferer.infer(volume, predictor);
            };
        }

        // `order` optionally permutes the window plan; the normalised result does not depend on it.
        [[nodiscard]] InferenceReport infer_with_report(const torch::Tensor& volume,
                                                        const Predictor& predictor,
                                                        const std::vector<std::size_t>& order = {}) const
        {
            const auto spatial = spatial_dims();
            if (!volume.defined() || volume.dim() != static_cast<std::int64_t>(spatial) + 1) {
                throw ShapeMismatchError(Stage::WindowConstruction,
                                         "Expected a [C, *spatial] volume with " + std::to_string(spatial)
                                             + " spatial axes, got "
                                             + (volume.defined() ? Common::format_shape(volume.sizes()) : std::string{"undefined"})
                                             + '.');
            }

            InferenceReport report{};
            report.plan = plan(Common::spatial_extent(volume, spatial));
            const auto sequence = resolve_order(order, report.plan.size());
            const auto padded = pad_volume(volume, report.plan);
            const auto device = options_.accumulation_device.value_or(volume.device());
            auto importance = importance_map(options_.roi_size, options_.mode, options_.sigma_scale, device);

            std::optional<Accumulator> accumulator{};
            std::optional<std::int64_t> classes = options_.num_classes;

            auto accumulate = [&](const std::vector<std::size_t>& chunk, const torch::Tensor& scores) {
                validate_scores(scores, chunk.size(), classes);
                if (!classes) {
                    classes = scores.size(1);
                }
                if (!accumulator) {
                    accumulator.emplace(*classes, report.plan.extent, importance);
                }
                for (std::size_t index = 0; index < chunk.size(); ++index) {
                    accumulator->add(report.plan.windows[chunk[index]], scores[static_cast<std::int64_t>(index)]);
                }
            };

            std::size_t batch_size = options_.batch_size;
            std::size_t position = 0;
            while (position < sequence.size()) {
                options_.cancellation.throw_if_cancelled(Stage::WindowConstruction);
                const auto count = std::min(batch_size, sequence.size() - position);
                const std::vector<std::size_t> chunk(sequence.begin() + static_cast<std::ptrdiff_t>(position),
                                                     sequence.begin() + static_cast<std::ptrdiff_t>(position + count));
                auto result = run_chunk(padded, report.plan, chunk, predictor, report);
                if (result.ok()) {
                    accumulate(chunk, result.scores);
                    position += count;
                    continue;
                }

                if (batch_size <= 1) {
                    throw ResourceExhaustionError("Predictor exhausted device memory on a single window: " + result.message);
                }
                batch_size = std::max<std::size_t>(1, batch_size / 2);
                if (options_.stream) {
                    *options_.stream << "[Stitch] predictor exhausted device memory, retrying " << chunk.size()
                                     << " windows with batch size " << batch_size << std::endl;
                }

                for (std::size_t start = 0; start < chunk.size(); start += batch_size) {
                    const auto stop = std::min(start + batch_size, chunk.size());
                    const std::vector<std::size_t> retry_chunk(chunk.begin() + static_cast<std::ptrdiff_t>(start),
                                                               chunk.begin() + static_cast<std::ptrdiff_t>(stop));
                    auto retry = run_chunk(padded, report.plan, retry_chunk, predictor, report);
                    if (!retry.ok()) {
                        throw ResourceExhaustionError("Predictor exhausted device memory again at batch size "
                                                      + std::to_string(batch_size) + ": " + retry.message);
                    }
                    accumulate(retry_chunk, retry.scores);
                }
                position += count;
            }

            if (!accumulator) {
                throw std::logic_error("Window plan produced no windows.");
            }
            report.scores = crop(accumulator->finalize(), report.plan.volume_extent);
            report.weight_sum = accumulator->weight_sum();
            report.batch_size = batch_size;
            return report;
        }

    private:
        static std::vector<std::size_t> resolve_order(const std::vector<std::size_t>& order, std::size_t count)
        {
            std::vector<std::size_t> sequence(count);
            std::iota(sequence.begin(), sequence.end(), std::size_t{0});
            if (order.empty()) {
                return sequence;
            }
            auto sorted = order;
            std::sort(sorted.begin(), sorted.end());
            if (sorted != sequence) {
                throw std::invalid_argument("Window order must be a permutation of the window plan indices.");
            }
            return order;
        }

        torch::Tensor pad_volume(const torch::Tensor& volume, const WindowPlan& plan) const
        {
            if (!plan.requires_padding()) {
                return volume;
            }
            std::vector<std::int64_t> pads;
            pads.reserve(plan.extent.size() * 2);
            for (std::size_t axis = plan.extent.size(); axis-- > 0;) {
                pads.push_back(0);
                pads.push_back(plan.extent[axis] - plan.volume_extent[axis]);
            }
            return torch::constant_pad_nd(volume, pads, options_.pad_value);
        }

        static torch::Tensor crop(const torch::Tensor& scores, const std::vector<std::int64_t>& extent)
        {
            auto view = scores;
            for (std::size_t axis = 0; axis < extent.size(); ++axis) {
                view = view.narrow(static_cast<std::int64_t>(axis) + 1, 0, extent[axis]);
            }
            return view.contiguous();
        }

        PredictorResult run_chunk(const torch::Tensor& padded,
                                  const WindowPlan& plan,
                                  const std::vector<std::size_t>& chunk,
                                  const Predictor& predictor,
                                  InferenceReport& report) const
        {
            std::vector<torch::Tensor> crops;
            crops.reserve(chunk.size());
            for (const auto index : chunk) {
                const auto& window = plan.windows[index];
                auto view = padded;
                for (std::size_t axis = 0; axis < window.offset.size(); ++axis) {
                    view = view.narrow(static_cast<std::int64_t>(axis) + 1, window.offset[axis], window.size[axis]);
                }
                crops.push_back(view);
            }
            ++report.predictor_calls;
            return invoke(predictor, torch::stack(crops));
        }

        void validate_scores(const torch::Tensor& scores,
                             std::size_t windows,
                             const std::optional<std::int64_t>& classes) const
        {
            const auto spatial = static_cast<std::int64_t>(spatial_dims());
            if (!scores.defined() || scores.dim() != spatial + 2) {
                throw ShapeMismatchError(Stage::PredictorCall,
                                         "Predictor returned "
                                             + (scores.defined() ? Common::format_shape(scores.sizes()) : std::string{"undefined"})
                                             + ", expected [N, K, *roi_size].");
            }
            if (scores.size(0) != static_cast<std::int64_t>(windows)) {
                throw ShapeMismatchError(Stage::PredictorCall,
                                         "Predictor returned " + std::to_string(scores.size(0)) + " outputs for "
                                             + std::to_string(windows) + " windows.");
            }
            for (std::int64_t axis = 0; axis < spatial; ++axis) {
                if (scores.size(axis + 2) != options_.roi_size[static_cast<std::size_t>(axis)]) {
                    throw ShapeMismatchError(Stage::PredictorCall,
                                             "Predictor output " + Common::format_shape(scores.sizes())
                                                 + " does not match roi_size " + Common::format_shape(options_.roi_size) + '.');
                }
            }
            if (classes && scores.size(1) != *classes) {
                throw ShapeMismatchError(Stage::PredictorCall,
                                         "Predictor produced " + std::to_string(scores.size(1)) + " class channels, expected "
                                             + std::to_string(*classes) + '.');
            }
        }

        SlidingWindowOptions options_;
    };
}

#endif // STITCH_INFERENCE_SLIDING_WINDOW_HPP
