#ifndef STITCH_OPTIMIZER_SGD_HPP
#define STITCH_OPTIMIZER_SGD_HPP

#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Stitch::Optimizer::Details {

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.9};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options)
    {
        if (!(options.learning_rate > 0.0)) {
            throw ConfigurationError("sgd learning_rate must be positive.");
        }
        if (options.momentum < 0.0 || options.weight_decay < 0.0) {
            throw ConfigurationError("sgd momentum and weight_decay must be non-negative.");
        }
        // torch rejects nesterov without momentum or with dampening at step time; fail on construction instead.
        if (options.nesterov && (options.momentum == 0.0 || options.dampening != 0.0)) {
            throw ConfigurationError("sgd nesterov requires momentum and zero dampening.");
        }
        return torch::optim::SGDOptions(options.learning_rate)
            .momentum(options.momentum)
            .dampening(options.dampening)
            .weight_decay(options.weight_decay)
            .nesterov(options.nesterov);
    }
}

#endif // STITCH_OPTIMIZER_SGD_HPP
