#ifndef STITCH_OPTIMIZER_REGISTRY_HPP
#define STITCH_OPTIMIZER_REGISTRY_HPP

#include <memory>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Stitch::Optimizer::Details {
    // Frozen parameters are left out so their moment buffers are never allocated.
    template <class Owner>
    std::vector<torch::Tensor> trainable_parameters(Owner& owner)
    {
        std::vector<torch::Tensor> trainable;
        for (auto& parameter : owner.parameters()) {
            if (parameter.requires_grad()) {
                trainable.push_back(parameter);
            }
        }
        if (trainable.empty()) {
            throw ConfigurationError("Network has no trainable parameters.");
        }
        return trainable;
    }

    template <class TorchOptimizer, class Owner, class Options>
    std::unique_ptr<torch::optim::Optimizer> make_optimizer(Owner& owner, const Options& options)
    {
        return std::make_unique<TorchOptimizer>(trainable_parameters(owner), to_torch_options(options));
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const SGDDescriptor& descriptor)
    {
        return make_optimizer<torch::optim::SGD>(owner, descriptor.options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor)
    {
        return make_optimizer<torch::optim::Adam>(owner, descriptor.options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamWDescriptor& descriptor)
    {
        return make_optimizer<torch::optim::AdamW>(owner, descriptor.options);
    }

    // Schedulers write every group; reading the first one is enough.
    inline double learning_rate(torch::optim::Optimizer& optimizer)
    {
        auto& groups = optimizer.param_groups();
        if (groups.empty()) {
            throw Error(Stage::TrainingStep, "Optimizer has no parameter groups.");
        }
        return groups.front().options().get_lr();
    }
}

#endif // STITCH_OPTIMIZER_REGISTRY_HPP
