#ifndef STITCH_INFERENCE_SEGMENTATION_PREDICTOR_HPP
#define STITCH_INFERENCE_SEGMENTATION_PREDICTOR_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../checkpoint/checkpoint.hpp"
#include "../../common/context.hpp"
#include "../../common/errors.hpp"
#include "../../common/shape.hpp"
#include "../../network.hpp"
#include "flip_ensemble.hpp"
#include "sliding_window.hpp"

namespace Stitch::Inference::Details {
    struct SegmentationPredictorOptions {
        SlidingWindowOptions sliding_window{};
        std::optional<FlipOptions> flip{};
        // Channel count the network was trained on; volumes that differ are rejected.
        std::optional<std::int64_t> in_channels{};
        std::optional<std::filesystem::path> checkpoint_dir{};
        std::ostream* stream{&std::cout};
    };

    enum class PredictionStatus {
        Ok,
        Failed
    };

    struct PredictionOutcome {
        PredictionStatus status{PredictionStatus::Ok};
        torch::Tensor prediction{};
        std::string error{};

        [[nodiscard]] bool ok() const noexcept { return status == PredictionStatus::Ok; }
    };

    // Deployment-side entry point: a trained network plus the sliding-window and
    // flip settings it is evaluated with.
    class SegmentationPredictor {
    public:
        SegmentationPredictor(NetworkPtr network, ExecutionContext context, SegmentationPredictorOptions options = {})
            : network_(std::move(network)),
              context_(context),
              options_(std::move(options)),
              inferer_(options_.sliding_window)
        {
            if (!network_) {
                throw std::invalid_argument("SegmentationPredictor requires a network.");
            }
            if (options_.in_channels && *options_.in_channels < 1) {
                throw ConfigurationError("SegmentationPredictor in_channels must be at least 1.");
            }
            if (options_.flip) {
                ensembler_.emplace(inferer_.spatial_dims(), *options_.flip);
            }
            network_->to(context_.device);
        }

        // Restores parameters from the checkpoint directory; returns the epoch of
        // the loaded variant.
        std::size_t load(Checkpoint::Variant variant = Checkpoint::Variant::Best)
        {
            if (!options_.checkpoint_dir) {
                throw ConfigurationError("SegmentationPredictor has no checkpoint directory.", Stage::CheckpointRead);
            }
            Checkpoint::Store store(*options_.checkpoint_dir);
            auto metadata = store.load(variant, *network_);
            if (!metadata) {
                throw Error(Stage::CheckpointRead,
                            "No " + std::string(Checkpoint::Details::to_string(variant)) + " checkpoint in '"
                                + options_.checkpoint_dir->string() + "'.");
            }
            if (options_.stream) {
                *options_.stream << "[Stitch] loaded " << Checkpoint::Details::to_string(variant) << " checkpoint from epoch "
                                 << metadata->epoch << std::endl;
            }
            return metadata->epoch;
        }

        // volume [C, *S] -> label map [*S] (int64).
        [[nodiscard]] torch::Tensor predict(const torch::Tensor& volume)
        {
            check_channels(volume);
            torch::NoGradGuard no_grad;
            EvalModeGuard eval(*network_);
            const auto predictor = as_predictor(*network_, context_);
            if (ensembler_) {
                return ensembler_->predict(volume, inferer_.bind(predictor));
            }
            return inferer_.infer(volume, predictor).argmax(0);
        }

        // One outcome per volume. Bad input, memory exhaustion and tensor errors
        // raised by the network fail that item only; cancellation and anything
        // else propagate.
        [[nodiscard]] std::vector<PredictionOutcome> predict_batch(const std::vector<torch::Tensor>& volumes)
        {
            std::vector<PredictionOutcome> outcomes;
            outcomes.reserve(volumes.size());
            for (std::size_t index = 0; index < volumes.size(); ++index) {
                try {
                    outcomes.push_back({PredictionStatus::Ok, predict(volumes[index]), {}});
                } catch (const ConfigurationError& error) {
                    outcomes.push_back(failure(index, error.what()));
                } catch (const ShapeMismatchError& error) {
                    outcomes.push_back(failure(index, error.what()));
                } catch (const ResourceExhaustionError& error) {
                    outcomes.push_back(failure(index, error.what()));
                } catch (const c10::Error& error) {
                    outcomes.push_back(failure(index, error.what_without_backtrace()));
                }
            }
            return outcomes;
        }

        [[nodiscard]] Network& network() noexcept { return *network_; }
        [[nodiscard]] const ExecutionContext& context() const noexcept { return context_; }

    private:
        void check_channels(const torch::Tensor& volume) const
        {
            if (!options_.in_channels) {
                return;
            }
            if (!volume.defined() || volume.dim() == 0) {
                throw ShapeMismatchError(Stage::PredictorCall, "Volume has no channel dimension.");
            }
            if (volume.size(0) != *options_.in_channels) {
                throw ShapeMismatchError(Stage::PredictorCall,
                                         "Volume of shape " + Common::format_shape(volume.sizes()) + " has "
                                             + std::to_string(volume.size(0)) + " channel(s), expected "
                                             + std::to_string(*options_.in_channels) + ".");
            }
        }

        PredictionOutcome failure(std::size_t index, const std::string& message) const
        {
            if (options_.stream) {
                *options_.stream << "[Stitch] volume " << index << " failed: " << message << std::endl;
            }
            return {PredictionStatus::Failed, {}, message};
        }

        NetworkPtr network_;
        ExecutionContext context_;
        SegmentationPredictorOptions options_;
        SlidingWindowInferer inferer_;
        std::optional<FlipEnsembler> ensembler_{};
    };
}

#endif // STITCH_INFERENCE_SEGMENTATION_PREDICTOR_HPP
