#ifndef STITCH_LOSS_FOCAL_HPP
#define STITCH_LOSS_FOCAL_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Stitch::Loss::Details {

    struct FocalOptions {
        Reduction reduction{Reduction::Mean};
        double gamma{2.0};
    };

    struct FocalDescriptor {
        FocalOptions options{};
    };

    // -(1 - p_t)^gamma * log(p_t) per voxel, p_t the softmax probability of the true class.
    inline torch::Tensor compute(const FocalDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        const auto labels = class_targets(prediction, target).unsqueeze(1);
        auto log_probabilities = torch::log_softmax(prediction.to(torch::kFloat32), 1);
        auto log_pt = log_probabilities.gather(1, labels).squeeze(1);
        auto pt = log_pt.exp();
        auto loss = -(1.0 - pt).pow(descriptor.options.gamma) * log_pt;
        return reduce(loss, descriptor.options.reduction);
    }

}

#endif // STITCH_LOSS_FOCAL_HPP
