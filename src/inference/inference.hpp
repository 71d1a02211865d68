#ifndef STITCH_INFERENCE_HPP
#define STITCH_INFERENCE_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstddef>

#include "details/flip_ensemble.hpp"
#include "details/importance.hpp"
#include "details/invoke.hpp"
#include "details/segmentation_predictor.hpp"
#include "details/sliding_window.hpp"
#include "details/window_plan.hpp"

namespace Stitch::Inference {
    using Window = Details::Window;
    using WindowPlan = Details::WindowPlan;
    using BlendMode = Details::BlendMode;

    using PredictorStatus = Details::PredictorStatus;
    using PredictorResult = Details::PredictorResult;

    using SlidingWindowOptions = Details::SlidingWindowOptions;
    using SlidingWindowInferer = Details::SlidingWindowInferer;
    using InferenceReport = Details::InferenceReport;

    using FlipPreset = Details::FlipPreset;
    using FlipOptions = Details::FlipOptions;
    using FlipEnsembler = Details::FlipEnsembler;

    using SegmentationPredictorOptions = Details::SegmentationPredictorOptions;
    using SegmentationPredictor = Details::SegmentationPredictor;
    using PredictionStatus = Details::PredictionStatus;
    using PredictionOutcome = Details::PredictionOutcome;

    using Details::importance_map;
    using Details::invoke;
    using Details::make_window_plan;
    using Details::preset_flip_sets;

    [[nodiscard]] inline auto SlidingWindow(const SlidingWindowOptions& options) -> SlidingWindowInferer {
        return SlidingWindowInferer(options);
    }

    [[nodiscard]] inline auto Flip(std::size_t spatial_dims, const FlipOptions& options = {}) -> FlipEnsembler {
        return FlipEnsembler(spatial_dims, options);
    }
}

#endif // STITCH_INFERENCE_HPP
