#ifndef STITCH_LOSS_HPP
#define STITCH_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include <torch/torch.h>

#include "details/ce.hpp"
#include "details/dice.hpp"
#include "details/dice_focal.hpp"
#include "details/focal.hpp"
#include "details/helper.hpp"

namespace Stitch::Loss {
    using Reduction = Details::Reduction;
    using DiceOptions = Details::DiceOptions;
    using FocalOptions = Details::FocalOptions;
    using CrossEntropyOptions = Details::CrossEntropyOptions;
    using DiceFocalOptions = Details::DiceFocalOptions;

    using Descriptor = std::variant<Details::DiceFocalDescriptor,
                                    Details::DiceDescriptor,
                                    Details::FocalDescriptor,
                                    Details::CrossEntropyDescriptor>;

    [[nodiscard]] inline Details::DiceFocalDescriptor DiceFocal(const DiceFocalOptions& options = {}) { return {options}; }
    [[nodiscard]] inline Details::DiceDescriptor Dice(const DiceOptions& options = {}) { return {options}; }
    [[nodiscard]] inline Details::FocalDescriptor Focal(const FocalOptions& options = {}) { return {options}; }
    [[nodiscard]] inline Details::CrossEntropyDescriptor CrossEntropy(const CrossEntropyOptions& options = {}) { return {options}; }

    // Logits [B, K, *S] scored against labels [B, *S] or [B, 1, *S]; returns a scalar unless reduction is None.
    [[nodiscard]] inline torch::Tensor compute(const Descriptor& descriptor,
                                               const torch::Tensor& prediction,
                                               const torch::Tensor& target) {
        return std::visit([&](const auto& loss) { return Details::compute(loss, prediction, target); }, descriptor);
    }
}

#endif // STITCH_LOSS_HPP
