#ifndef STITCH_LOSS_HELPER_HPP
#define STITCH_LOSS_HELPER_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/shape.hpp"

namespace Stitch::Loss::Details {
    enum class Reduction { Mean, Sum, None };

    // Collapses a per-voxel or per-class loss; None hands it back untouched.
    inline torch::Tensor reduce(const torch::Tensor& loss, Reduction reduction) {
        if (reduction == Reduction::Sum) {
            return loss.sum();
        }
        return reduction == Reduction::Mean ? loss.mean() : loss;
    }

    // prediction: logits [B, K, *S]; target: labels [B, *S] or [B, 1, *S]. Returns int64 [B, *S].
    inline torch::Tensor class_targets(const torch::Tensor& prediction, const torch::Tensor& target) {
        if (!prediction.defined() || !target.defined()) {
            throw std::invalid_argument("Segmentation losses require defined prediction and target tensors.");
        }
        auto labels = target;
        if (labels.dim() == prediction.dim() && labels.size(1) == 1) {
            labels = labels.squeeze(1);
        }
        auto expected = prediction.sizes().vec();
        expected.erase(expected.begin() + 1);
        if (labels.sizes().vec() != expected) {
            throw ShapeMismatchError(Stage::TrainingStep,
                                     "Target " + Common::format_shape(target.sizes()) + " does not match logits "
                                         + Common::format_shape(prediction.sizes()) + '.');
        }
        return labels.to(prediction.device(), torch::kLong);
    }

    // [B, *S] -> [B, K, *S] float one-hot.
    inline torch::Tensor one_hot_targets(const torch::Tensor& labels, std::int64_t num_classes) {
        auto encoded = torch::one_hot(labels, num_classes).to(torch::kFloat32);
        std::vector<std::int64_t> order{0, encoded.dim() - 1};
        for (std::int64_t axis = 1; axis < encoded.dim() - 1; ++axis) {
            order.push_back(axis);
        }
        return encoded.permute(order).contiguous();
    }

    inline std::vector<std::int64_t> spatial_axes(const torch::Tensor& prediction) {
        std::vector<std::int64_t> axes;
        for (std::int64_t axis = 2; axis < prediction.dim(); ++axis) {
            axes.push_back(axis);
        }
        return axes;
    }
}
#endif // STITCH_LOSS_HELPER_HPP
