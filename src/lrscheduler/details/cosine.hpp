#ifndef STITCH_LRSCHEDULER_COSINE_HPP
#define STITCH_LRSCHEDULER_COSINE_HPP
// "SGDR: Stochastic Gradient Descent with Warm Restarts" https://arxiv.org/pdf/1608.03983
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"

namespace Stitch::LrScheduler::Details {
    // Half a cosine from base_lr (position 0) down to eta_min (position == period).
    inline double cosine_between(double base_lr, double eta_min, std::size_t position, std::size_t period)
    {
        constexpr double kPi = 3.14159265358979323846;
        const double phase = static_cast<double>(position) / static_cast<double>(period);
        return eta_min + 0.5 * (base_lr - eta_min) * (1.0 + std::cos(kPi * phase));
    }

    struct CosineAnnealingOptions {
        std::size_t T_max{100};
        double eta_min{0.0};
    };

    struct CosineAnnealingDescriptor {
        CosineAnnealingOptions options{};
    };

    // Holds eta_min once T_max epochs have elapsed.
    class CosineAnnealingScheduler final : public EpochScheduler {
    public:
        CosineAnnealingScheduler(torch::optim::Optimizer& optimizer, CosineAnnealingOptions options)
            : EpochScheduler(optimizer), options_(std::move(options))
        {
            if (options_.T_max == 0) {
                throw std::invalid_argument("cosine schedule needs T_max >= 1.");
            }
            apply();
        }

        [[nodiscard]] std::string_view name() const noexcept override { return "cosine"; }

    private:
        [[nodiscard]] double compute_lr(double base_lr, std::size_t step) const override
        {
            return cosine_between(base_lr, options_.eta_min, std::min(step, options_.T_max), options_.T_max);
        }

        CosineAnnealingOptions options_{};
    };

    struct CosineRestartOptions {
        std::size_t T_0{10};
        std::size_t T_mult{2};
        double eta_min{0.0};
    };

    struct CosineRestartDescriptor {
        CosineRestartOptions options{};
    };

    // Restarts every T_i epochs; T_i grows by T_mult per cycle.
    class CosineRestartScheduler final : public EpochScheduler {
    public:
        CosineRestartScheduler(torch::optim::Optimizer& optimizer, CosineRestartOptions options)
            : EpochScheduler(optimizer), options_(std::move(options))
        {
            if (options_.T_0 == 0 || options_.T_mult == 0) {
                throw std::invalid_argument("cosine_restart schedule needs T_0 >= 1 and T_mult >= 1.");
            }
            apply();
        }

        [[nodiscard]] std::string_view name() const noexcept override { return "cosine_restart"; }

    private:
        [[nodiscard]] double compute_lr(double base_lr, std::size_t step) const override
        {
            std::size_t period = options_.T_0;
            while (step >= period) {
                step -= period;
                period *= options_.T_mult;
            }
            return cosine_between(base_lr, options_.eta_min, step, period);
        }

        CosineRestartOptions options_{};
    };
}

#endif // STITCH_LRSCHEDULER_COSINE_HPP
