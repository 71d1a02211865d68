#ifndef STITCH_LRSCHEDULER_STEP_HPP
#define STITCH_LRSCHEDULER_STEP_HPP
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"

namespace Stitch::LrScheduler::Details {
    struct StepOptions {
        std::size_t step_size{30};
        double gamma{0.1};
    };

    struct StepDescriptor {
        StepOptions options{};
    };

    class StepScheduler final : public EpochScheduler {
    public:
        StepScheduler(torch::optim::Optimizer& optimizer, StepOptions options)
            : EpochScheduler(optimizer), options_(std::move(options)) {
            if (options_.step_size == 0) {
                throw std::invalid_argument("StepScheduler requires step_size to be greater than zero.");
            }
            apply();
        }

        [[nodiscard]] std::string_view name() const noexcept override { return "step"; }

    private:
        [[nodiscard]] double compute_lr(double base_lr, std::size_t step) const override {
            return base_lr * std::pow(options_.gamma, static_cast<double>(step / options_.step_size));
        }

        StepOptions options_{};
    };

    struct ExponentialOptions {
        double gamma{0.95};
    };

    struct ExponentialDescriptor {
        ExponentialOptions options{};
    };

    class ExponentialScheduler final : public EpochScheduler {
    public:
        ExponentialScheduler(torch::optim::Optimizer& optimizer, ExponentialOptions options)
            : EpochScheduler(optimizer), options_(std::move(options)) {
            if (!(options_.gamma > 0.0)) {
                throw std::invalid_argument("ExponentialScheduler requires a positive gamma.");
            }
            apply();
        }

        [[nodiscard]] std::string_view name() const noexcept override { return "exponential"; }

    private:
        [[nodiscard]] double compute_lr(double base_lr, std::size_t step) const override {
            return base_lr * std::pow(options_.gamma, static_cast<double>(step));
        }

        ExponentialOptions options_{};
    };
}

#endif // STITCH_LRSCHEDULER_STEP_HPP
