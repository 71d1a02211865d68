#ifndef STITCH_VALIDATION_VALIDATOR_HPP
#define STITCH_VALIDATION_VALIDATOR_HPP
/*
 * Validation driver.
 * ---------------------------------------------------------------------------
 *  - One call is one full pass: Idle -> Running (per-sample loop) ->
 *    Aggregating -> Idle. Nothing survives between calls; the aggregators are
 *    reset on entry.
 *  - Each sample goes through the sliding-window inferer, optionally wrapped by
 *    the flip ensembler, and is decoded with an arg-max over classes before it
 *    reaches the metric.
 *  - The network overload runs under NoGradGuard and EvalModeGuard so the
 *    parameters are only read.
 */
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/cancellation.hpp"
#include "../../common/context.hpp"
#include "../../common/errors.hpp"
#include "../../common/shape.hpp"
#include "../../data/data.hpp"
#include "../../inference/details/flip_ensemble.hpp"
#include "../../inference/details/sliding_window.hpp"
#include "../../loss/loss.hpp"
#include "../../metric/metric.hpp"
#include "../../network.hpp"
#include "../../utils/progressbar.hpp"

namespace Stitch::Validation::Details {
    enum class Phase {
        Idle,
        Running,
        Aggregating
    };

    [[nodiscard]] constexpr std::string_view to_string(Phase phase) noexcept
    {
        switch (phase) {
            case Phase::Running: return "running";
            case Phase::Aggregating: return "aggregating";
            case Phase::Idle:
            default: return "idle";
        }
    }

    // image [C, *S], label [*S], prediction [*S] (int64), all on the CPU.
    struct Artifact {
        std::size_t sample_index{0};
        torch::Tensor image{};
        torch::Tensor label{};
        torch::Tensor prediction{};
    };

    class ArtifactSink {
    public:
        virtual ~ArtifactSink() = default;
        virtual void consume(const Artifact& artifact) = 0;
    };

    struct ValidatorOptions {
        Inference::Details::SlidingWindowOptions sliding_window{};
        bool use_tta{false};
        Inference::Details::FlipOptions flip{};
        std::optional<std::size_t> max_batches{};
        Metric::DiceOptions dice{};
        std::optional<Metric::HausdorffOptions> hausdorff{};
        std::optional<Loss::Descriptor> loss{};
        std::shared_ptr<ArtifactSink> artifacts{};
        bool show_progress{false};
        std::ostream* stream{&std::cout};
        Common::CancellationToken cancellation{};
    };

    struct ValidationReport {
        std::optional<double> metric{};
        std::size_t sample_count{0};
        std::size_t batch_count{0};
        std::vector<double> per_class{};
        std::optional<double> loss{};
        std::optional<double> hausdorff{};
        std::size_t not_computable{0};
    };

    class Validator {
    public:
        explicit Validator(ValidatorOptions options)
            : options_(std::move(options)),
              inferer_(options_.sliding_window),
              dice_(options_.dice)
        {
            if (options_.max_batches && *options_.max_batches == 0) {
                throw ConfigurationError("val_max_batches must be at least 1 when set.", Stage::Validation);
            }
            if (options_.sliding_window.num_classes && *options_.sliding_window.num_classes != options_.dice.num_classes) {
                throw ConfigurationError("Sliding-window num_classes disagrees with the metric's num_classes.", Stage::Validation);
            }
            if (options_.use_tta) {
                ensembler_.emplace(inferer_.spatial_dims(), options_.flip);
            }
            if (options_.hausdorff) {
                hausdorff_.emplace(*options_.hausdorff);
            }
        }

        Validator(const Validator&) = delete;
        Validator& operator=(const Validator&) = delete;

        [[nodiscard]] Phase phase() const noexcept { return phase_; }
        [[nodiscard]] const ValidatorOptions& options() const noexcept { return options_; }

        ValidationReport run(Network& network, const ExecutionContext& context, Data::Stream& stream)
        {
            torch::NoGradGuard no_grad;
            EvalModeGuard eval(network);
            return run(as_predictor(network, context), stream);
        }

        // `predictor` maps [N, C, *roi] to [N, K, *roi].
        ValidationReport run(const Predictor& predictor, Data::Stream& stream)
        {
            PhaseScope scope(phase_);
            dice_.reset();
            if (hausdorff_) {
                hausdorff_->reset();
            }

            ValidationReport report{};
            double loss_sum = 0.0;
            std::size_t loss_count = 0;

            std::optional<Utils::ProgressBar> progress;
            const auto total = limited_total(stream.batches());
            if (options_.show_progress && options_.stream && total) {
                progress.emplace(static_cast<std::int64_t>(*total), "Validation", *options_.stream);
            }

            stream.reset(0);
            while (!options_.max_batches || report.batch_count < *options_.max_batches) {
                auto batch = stream.next();
                if (!batch) {
                    break;
                }
                check_batch(*batch);
                const auto labels = Common::squeeze_label_channel(batch->labels, inferer_.spatial_dims());

                for (std::int64_t item = 0; item < batch->images.size(0); ++item) {
                    options_.cancellation.throw_if_cancelled(Stage::Validation);
                    const auto image = batch->images[item];
                    const auto label = labels[item].to(torch::kCPU, torch::kLong);

                    const auto scores = sample_scores(image, predictor);
                    const auto prediction = scores.argmax(0).to(torch::kCPU, torch::kLong);
                    if (prediction.sizes() != label.sizes()) {
                        throw ShapeMismatchError(Stage::Validation,
                                                 "Prediction " + Common::format_shape(prediction.sizes())
                                                     + " does not match ground truth " + Common::format_shape(label.sizes()) + '.');
                    }

                    dice_.update(prediction.unsqueeze(0), label.unsqueeze(0));
                    if (hausdorff_) {
                        hausdorff_->update(prediction.unsqueeze(0), label.unsqueeze(0));
                    }
                    if (options_.loss) {
                        const auto value = Loss::compute(*options_.loss, scores.unsqueeze(0), label.unsqueeze(0).to(scores.device()));
                        loss_sum += value.dim() == 0 ? value.item<double>() : value.mean().item<double>();
                        ++loss_count;
                    }
                    if (options_.artifacts) {
                        options_.artifacts->consume(Artifact{report.sample_count, image.to(torch::kCPU), label, prediction});
                    }
                    ++report.sample_count;
                }

                ++report.batch_count;
                if (progress) {
                    progress->update(static_cast<std::int64_t>(report.batch_count));
                }
            }

            phase_ = Phase::Aggregating;
            report.metric = dice_.aggregate();
            report.per_class = dice_.per_class();
            if (hausdorff_) {
                report.hausdorff = hausdorff_->aggregate();
                report.not_computable = hausdorff_->not_computable();
            }
            if (loss_count > 0) {
                report.loss = loss_sum / static_cast<double>(loss_count);
            }
            return report;
        }

    private:
        class PhaseScope {
        public:
            explicit PhaseScope(Phase& phase) : phase_(phase) { phase_ = Phase::Running; }
            PhaseScope(const PhaseScope&) = delete;
            PhaseScope& operator=(const PhaseScope&) = delete;
            ~PhaseScope() { phase_ = Phase::Idle; }

        private:
            Phase& phase_;
        };

        // Class scores [K, *S]. With TTA these are log-probabilities of the
        // ensemble mean, so the arg-max and any loss see the ensembled result.
        torch::Tensor sample_scores(const torch::Tensor& image, const Predictor& predictor) const
        {
            if (!ensembler_) {
                return inferer_.infer(image, predictor);
            }
            const auto mean = ensembler_->probabilities(image, inferer_.bind(predictor));
            return mean.clamp_min(1e-12).log();
        }

        void check_batch(const Data::Batch& batch) const
        {
            const auto spatial = static_cast<std::int64_t>(inferer_.spatial_dims());
            if (batch.images.dim() != spatial + 2) {
                throw ShapeMismatchError(Stage::Validation,
                                         "Validation images must be [B, C, *spatial], got "
                                             + Common::format_shape(batch.images.sizes()) + '.');
            }
            const auto labels = Common::squeeze_label_channel(batch.labels, inferer_.spatial_dims());
            if (labels.dim() != spatial + 1 || labels.size(0) != batch.images.size(0)) {
                throw ShapeMismatchError(Stage::Validation,
                                         "Validation labels " + Common::format_shape(batch.labels.sizes())
                                             + " do not pair with images " + Common::format_shape(batch.images.sizes()) + '.');
            }
        }

        [[nodiscard]] std::optional<std::size_t> limited_total(std::optional<std::size_t> total) const
        {
            if (total && options_.max_batches) {
                return std::min(*total, *options_.max_batches);
            }
            return total;
        }

        ValidatorOptions options_;
        Inference::Details::SlidingWindowInferer inferer_;
        std::optional<Inference::Details::FlipEnsembler> ensembler_{};
        Metric::DiceMetric dice_;
        std::optional<Metric::HausdorffMetric> hausdorff_{};
        Phase phase_{Phase::Idle};
    };
}

#endif // STITCH_VALIDATION_VALIDATOR_HPP
