#ifndef STITCH_LOSS_DICE_HPP
#define STITCH_LOSS_DICE_HPP

#include <stdexcept>
#include <torch/torch.h>

#include "helper.hpp"

namespace Stitch::Loss::Details {

    struct DiceOptions {
        Reduction reduction{Reduction::Mean};
        double smooth_numerator{1e-5};
        double smooth_denominator{1e-5};
        bool include_background{true};
    };

    struct DiceDescriptor {
        DiceOptions options{};
    };

    // Soft Dice over softmax probabilities and one-hot labels, one term per sample and class.
    inline torch::Tensor compute(const DiceDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        const auto labels = class_targets(prediction, target);
        const auto classes = prediction.size(1);
        auto probabilities = torch::softmax(prediction.to(torch::kFloat32), 1);
        auto expected = one_hot_targets(labels, classes);

        if (!descriptor.options.include_background) {
            if (classes < 2) {
                throw std::invalid_argument("Dice loss without background needs at least two classes.");
            }
            probabilities = probabilities.narrow(1, 1, classes - 1);
            expected = expected.narrow(1, 1, classes - 1);
        }

        const auto axes = spatial_axes(prediction);
        auto intersection = (probabilities * expected).sum(axes);
        auto denominator = probabilities.sum(axes) + expected.sum(axes);

        auto dice = (intersection * 2.0 + descriptor.options.smooth_numerator)
                    / (denominator + descriptor.options.smooth_denominator);
        return reduce(1.0 - dice, descriptor.options.reduction);
    }

}

#endif // STITCH_LOSS_DICE_HPP
