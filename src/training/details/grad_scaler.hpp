#ifndef STITCH_TRAINING_GRAD_SCALER_HPP
#define STITCH_TRAINING_GRAD_SCALER_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/save_load.hpp"

namespace Stitch::Training::Details {
    struct GradScalerOptions {
        bool enabled{true};
        double init_scale{65536.0};
        double growth_factor{2.0};
        double backoff_factor{0.5};
        std::size_t growth_interval{2000};
    };

    // Dynamic loss scaling for float16 training: the loss is multiplied by the
    // scale before backward, gradients are divided back before the optimizer
    // step, and a step with any non-finite gradient is skipped and halves the scale.
    // Disabled scalers pass everything through.
    class GradScaler {
    public:
        explicit GradScaler(GradScalerOptions options = {}) : options_(options), scale_(options.init_scale)
        {
            if (!(options_.init_scale > 0.0) || !(options_.growth_factor > 1.0)
                || !(options_.backoff_factor > 0.0) || options_.backoff_factor >= 1.0 || options_.growth_interval == 0) {
                throw ConfigurationError("GradScaler requires init_scale > 0, growth_factor > 1, backoff_factor in (0, 1) and growth_interval >= 1.");
            }
        }

        [[nodiscard]] bool enabled() const noexcept { return options_.enabled; }
        [[nodiscard]] double scale_value() const noexcept { return scale_; }
        [[nodiscard]] bool found_inf() const noexcept { return found_inf_; }

        [[nodiscard]] torch::Tensor scale(const torch::Tensor& loss) const
        {
            return options_.enabled ? loss * scale_ : loss;
        }

        // Divides every gradient by the scale in place; at most once per step.
        void unscale(torch::optim::Optimizer& optimizer)
        {
            if (!options_.enabled || unscaled_) {
                return;
            }
            const double inverse = 1.0 / scale_;
            for (auto& group : optimizer.param_groups()) {
                for (auto& parameter : group.params()) {
                    if (!parameter.grad().defined()) {
                        continue;
                    }
                    parameter.grad().mul_(inverse);
                    if (!torch::isfinite(parameter.grad()).all().item<bool>()) {
                        found_inf_ = true;
                    }
                }
            }
            unscaled_ = true;
        }

        // Returns false when the update was skipped because of an overflow.
        bool step(torch::optim::Optimizer& optimizer)
        {
            if (!options_.enabled) {
                optimizer.step();
                return true;
            }
            unscale(optimizer);
            if (found_inf_) {
                return false;
            }
            optimizer.step();
            return true;
        }

        void update()
        {
            if (!options_.enabled) {
                return;
            }
            if (found_inf_) {
                scale_ *= options_.backoff_factor;
                growth_tracker_ = 0;
            } else if (++growth_tracker_ >= options_.growth_interval) {
                scale_ *= options_.growth_factor;
                growth_tracker_ = 0;
            }
            found_inf_ = false;
            unscaled_ = false;
        }

        [[nodiscard]] Common::SaveLoad::PropertyTree state() const
        {
            Common::SaveLoad::PropertyTree tree;
            tree.put("scale", scale_);
            tree.put("growth_tracker", growth_tracker_);
            return tree;
        }

        void load_state(const Common::SaveLoad::PropertyTree& tree)
        {
            const std::string context = "grad scaler state";
            scale_ = Common::SaveLoad::Detail::get_numeric<double>(tree, "scale", context);
            growth_tracker_ = Common::SaveLoad::Detail::get_numeric<std::size_t>(tree, "growth_tracker", context);
            found_inf_ = false;
            unscaled_ = false;
        }

    private:
        GradScalerOptions options_;
        double scale_;
        std::size_t growth_tracker_{0};
        bool found_inf_{false};
        bool unscaled_{false};
    };
}

#endif // STITCH_TRAINING_GRAD_SCALER_HPP
