#ifndef STITCH_LRSCHEDULER_HPP
#define STITCH_LRSCHEDULER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <variant>

#include "details/common.hpp"
#include "details/cosine.hpp"
#include "details/plateau.hpp"
#include "details/step.hpp"
#include "registry.hpp"

namespace Stitch::LrScheduler {
    using Scheduler = Details::Scheduler;
    using SchedulerPtr = std::unique_ptr<Scheduler>;

    using CosineAnnealingOptions = Details::CosineAnnealingOptions;
    using CosineAnnealingDescriptor = Details::CosineAnnealingDescriptor;
    using CosineRestartOptions = Details::CosineRestartOptions;
    using CosineRestartDescriptor = Details::CosineRestartDescriptor;
    using StepOptions = Details::StepOptions;
    using StepDescriptor = Details::StepDescriptor;
    using ExponentialOptions = Details::ExponentialOptions;
    using ExponentialDescriptor = Details::ExponentialDescriptor;
    using PlateauMode = Details::PlateauMode;
    using PlateauOptions = Details::PlateauOptions;
    using PlateauDescriptor = Details::PlateauDescriptor;

    using Descriptor = std::variant<CosineAnnealingDescriptor,
                                    CosineRestartDescriptor,
                                    StepDescriptor,
                                    ExponentialDescriptor,
                                    PlateauDescriptor>;

    [[nodiscard]] constexpr auto CosineAnnealing(const CosineAnnealingOptions& options = {}) noexcept
        -> CosineAnnealingDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto CosineRestart(const CosineRestartOptions& options = {}) noexcept
        -> CosineRestartDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Step(const StepOptions& options = {}) noexcept -> StepDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Exponential(const ExponentialOptions& options = {}) noexcept -> ExponentialDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Plateau(const PlateauOptions& options = {}) noexcept -> PlateauDescriptor {
        return {options};
    }

    [[nodiscard]] inline SchedulerPtr build(torch::optim::Optimizer& optimizer, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) { return Details::build_scheduler(optimizer, concrete); }, descriptor);
    }
}

#endif // STITCH_LRSCHEDULER_HPP
