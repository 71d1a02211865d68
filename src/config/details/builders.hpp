#ifndef STITCH_CONFIG_BUILDERS_HPP
#define STITCH_CONFIG_BUILDERS_HPP
// Translates a validated RunConfig into the descriptors and option structs the
// rest of the library consumes. Callers are expected to run validate() first;
// an unknown kind still raises ConfigurationError here.
#include <optional>
#include <string>

#include "../../common/context.hpp"
#include "../../common/errors.hpp"
#include "../../inference/details/flip_ensemble.hpp"
#include "../../inference/details/sliding_window.hpp"
#include "../../loss/loss.hpp"
#include "../../lrscheduler/lrscheduler.hpp"
#include "../../metric/metric.hpp"
#include "../../optimizer/optimizer.hpp"
#include "run_config.hpp"

namespace Stitch::Config::Details {
    inline Optimizer::Descriptor optimizer_descriptor(const RunConfig& config)
    {
        if (config.optimizer_kind == "adam") {
            return Optimizer::Adam({.learning_rate = config.learning_rate, .weight_decay = config.weight_decay});
        }
        if (config.optimizer_kind == "adamw") {
            return Optimizer::AdamW({.learning_rate = config.learning_rate, .weight_decay = config.weight_decay});
        }
        if (config.optimizer_kind == "sgd") {
            return Optimizer::SGD({.learning_rate = config.learning_rate, .weight_decay = config.weight_decay});
        }
        throw ConfigurationError("Unknown optimizer_kind '" + config.optimizer_kind + "'.");
    }

    // std::nullopt for "none".
    inline std::optional<LrScheduler::Descriptor> scheduler_descriptor(const RunConfig& config)
    {
        const auto& kind = config.scheduler_kind;
        if (kind == "none") {
            return std::nullopt;
        }
        if (kind == "cosine") {
            return LrScheduler::CosineAnnealing({.T_max = config.max_epochs});
        }
        if (kind == "cosine_restart") {
            return LrScheduler::CosineRestart();
        }
        if (kind == "step") {
            return LrScheduler::Step();
        }
        if (kind == "exponential") {
            return LrScheduler::Exponential();
        }
        if (kind == "plateau") {
            return LrScheduler::Plateau({.mode = LrScheduler::PlateauMode::Max});
        }
        throw ConfigurationError("Unknown scheduler_kind '" + kind + "'.");
    }

    inline Loss::Descriptor loss_descriptor(const RunConfig& config)
    {
        const auto& kind = config.loss_kind;
        if (kind == "dice") {
            return Loss::Dice({.include_background = config.include_background});
        }
        if (kind == "focal") {
            return Loss::Focal();
        }
        if (kind == "cross_entropy") {
            return Loss::CrossEntropy();
        }
        if (kind == "dice_focal") {
            Loss::Details::DiceFocalOptions options{};
            options.dice.include_background = config.include_background;
            return Loss::DiceFocal(options);
        }
        throw ConfigurationError("Unknown loss_kind '" + kind + "'.");
    }

    inline Inference::Details::BlendMode blend_mode(const RunConfig& config)
    {
        if (config.importance == "constant") {
            return Inference::Details::BlendMode::Constant;
        }
        if (config.importance == "gaussian") {
            return Inference::Details::BlendMode::Gaussian;
        }
        throw ConfigurationError("Unknown importance '" + config.importance + "'.");
    }

    inline Inference::Details::SlidingWindowOptions sliding_window_options(const RunConfig& config)
    {
        Inference::Details::SlidingWindowOptions options{};
        options.roi_size = config.roi_size;
        options.overlap = config.overlap;
        options.batch_size = config.sw_batch_size;
        options.mode = blend_mode(config);
        options.num_classes = config.num_classes;
        return options;
    }

    inline Inference::Details::FlipOptions flip_options(const RunConfig& config)
    {
        using Inference::Details::FlipPreset;
        if (config.tta_flips == "identity") {
            return {.preset = FlipPreset::Identity};
        }
        if (config.tta_flips == "single_axis") {
            return {.preset = FlipPreset::SingleAxis};
        }
        if (config.tta_flips == "exhaustive") {
            return {.preset = FlipPreset::Exhaustive};
        }
        throw ConfigurationError("Unknown tta_flips '" + config.tta_flips + "'.");
    }

    inline Metric::DiceOptions dice_options(const RunConfig& config)
    {
        return {.num_classes = config.num_classes, .include_background = config.include_background};
    }

    inline ExecutionContext execution_context(const RunConfig& config)
    {
        return ExecutionContext::resolve(config.device, config.use_mixed_precision);
    }
}

#endif // STITCH_CONFIG_BUILDERS_HPP
