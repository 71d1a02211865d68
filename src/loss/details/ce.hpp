#ifndef STITCH_LOSS_CE_HPP
#define STITCH_LOSS_CE_HPP
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "helper.hpp"

namespace Stitch::Loss::Details {
    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double label_smoothing{0.0};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    // Per-voxel loss is reduced here; a weighted mean divides by the weight of each voxel's true class.
    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target) {
        const auto& options = descriptor.options;
        const auto labels = class_targets(prediction, target);
        const auto classes = prediction.size(1);

        auto log_probabilities = torch::log_softmax(prediction.to(torch::kFloat32), 1);
        auto smoothed = one_hot_targets(labels, classes) * (1.0 - options.label_smoothing)
                        + options.label_smoothing / static_cast<double>(classes);

        torch::Tensor voxel_weight;
        if (!options.weight.empty()) {
            if (static_cast<std::int64_t>(options.weight.size()) != classes) {
                throw ShapeMismatchError(Stage::TrainingStep,
                                         "Cross-entropy has " + std::to_string(options.weight.size())
                                             + " class weights for " + std::to_string(classes) + " classes.");
            }
            auto class_weight = torch::tensor(options.weight, log_probabilities.options());
            std::vector<std::int64_t> broadcast(static_cast<std::size_t>(prediction.dim()), 1);
            broadcast[1] = classes;
            log_probabilities = log_probabilities * class_weight.view(broadcast);
            voxel_weight = class_weight.index_select(0, labels.flatten()).view_as(labels);
        }

        auto loss = -(smoothed * log_probabilities).sum(1);
        if (options.reduction == Reduction::Mean && voxel_weight.defined()) {
            return loss.sum() / voxel_weight.sum();
        }
        return reduce(loss, options.reduction);
    }
}
#endif // STITCH_LOSS_CE_HPP
