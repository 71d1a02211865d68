#ifndef STITCH_LRSCHEDULER_REGISTRY_HPP
#define STITCH_LRSCHEDULER_REGISTRY_HPP

#include <memory>
#include <type_traits>

#include <torch/torch.h>

#include "details/cosine.hpp"
#include "details/plateau.hpp"
#include "details/step.hpp"

namespace Stitch::LrScheduler::Details {
    template <class Descriptor>
    std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported scheduler descriptor provided to build_scheduler.");
        return nullptr;
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const CosineAnnealingDescriptor& descriptor) {
        return std::make_unique<CosineAnnealingScheduler>(optimizer, descriptor.options);
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const CosineRestartDescriptor& descriptor) {
        return std::make_unique<CosineRestartScheduler>(optimizer, descriptor.options);
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const StepDescriptor& descriptor) {
        return std::make_unique<StepScheduler>(optimizer, descriptor.options);
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const ExponentialDescriptor& descriptor) {
        return std::make_unique<ExponentialScheduler>(optimizer, descriptor.options);
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const PlateauDescriptor& descriptor) {
        return std::make_unique<PlateauScheduler>(optimizer, descriptor.options);
    }
}

#endif // STITCH_LRSCHEDULER_REGISTRY_HPP
