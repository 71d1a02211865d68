#ifndef STITCH_LOSS_DICE_FOCAL_HPP
#define STITCH_LOSS_DICE_FOCAL_HPP

#include <torch/torch.h>

#include "dice.hpp"
#include "focal.hpp"

namespace Stitch::Loss::Details {

    struct DiceFocalOptions {
        double dice_weight{0.7};
        double focal_weight{0.3};
        DiceOptions dice{};
        FocalOptions focal{};
    };

    struct DiceFocalDescriptor {
        DiceFocalOptions options{};
    };

    inline torch::Tensor compute(const DiceFocalDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        auto dice = compute(DiceDescriptor{descriptor.options.dice}, prediction, target);
        auto focal = compute(FocalDescriptor{descriptor.options.focal}, prediction, target);
        return descriptor.options.dice_weight * dice + descriptor.options.focal_weight * focal;
    }

}

#endif // STITCH_LOSS_DICE_FOCAL_HPP
