#ifndef STITCH_OPTIMIZER_ADAM_HPP
#define STITCH_OPTIMIZER_ADAM_HPP

#include <string>
#include <tuple>

#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Stitch::Optimizer::Details {

    // Adam keeps decay inside the gradient; AdamW decouples it, so its default is non-zero.
    struct AdamOptions {
        double learning_rate{1e-4};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamWOptions {
        double learning_rate{1e-4};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-5};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    template <class Options>
    void check_moments(const Options& options, const char* name)
    {
        const std::string prefix = std::string(name) + ' ';
        if (!(options.learning_rate > 0.0)) {
            throw ConfigurationError(prefix + "learning_rate must be positive.");
        }
        if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0) {
            throw ConfigurationError(prefix + "betas must lie in [0, 1).");
        }
        if (!(options.eps > 0.0) || options.weight_decay < 0.0) {
            throw ConfigurationError(prefix + "eps must be positive and weight_decay non-negative.");
        }
    }

    // Shared by both variants: the torch option types expose the same fluent setters.
    template <class TorchOptions, class Options>
    TorchOptions moment_options(const Options& options, const char* name)
    {
        check_moments(options, name);
        return TorchOptions(options.learning_rate)
            .betas(std::make_tuple(options.beta1, options.beta2))
            .eps(options.eps)
            .weight_decay(options.weight_decay)
            .amsgrad(options.amsgrad);
    }

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options)
    {
        return moment_options<torch::optim::AdamOptions>(options, "adam");
    }

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options)
    {
        return moment_options<torch::optim::AdamWOptions>(options, "adamw");
    }
}

#endif // STITCH_OPTIMIZER_ADAM_HPP
