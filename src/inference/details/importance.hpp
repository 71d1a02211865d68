#ifndef STITCH_INFERENCE_IMPORTANCE_HPP
#define STITCH_INFERENCE_IMPORTANCE_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Stitch::Inference::Details {
    enum class BlendMode {
        Constant,
        Gaussian
    };

    [[nodiscard]] constexpr std::string_view to_string(BlendMode mode) noexcept
    {
        return mode == BlendMode::Gaussian ? "gaussian" : "constant";
    }

    // Per-voxel window weight of shape roi_size. The gaussian variant peaks at 1
    // in the centre; its tails are clamped to the smallest positive weight so no
    // covered voxel can end up with zero accumulated weight.
    [[nodiscard]] inline torch::Tensor importance_map(const std::vector<std::int64_t>& roi_size,
                                                      BlendMode mode,
                                                      double sigma_scale,
                                                      const torch::Device& device)
    {
        const auto options = torch::TensorOptions().dtype(torch::kFloat32).device(device);
        if (mode == BlendMode::Constant) {
            return torch::ones(roi_size, options);
        }

        if (!(sigma_scale > 0.0)) {
            throw ConfigurationError("Gaussian importance requires a positive sigma_scale.", Stage::WindowConstruction);
        }

        torch::Tensor map = torch::ones({}, options);
        for (std::size_t axis = 0; axis < roi_size.size(); ++axis) {
            const auto extent = roi_size[axis];
            const double half = static_cast<double>(extent - 1) / 2.0;
            const double sigma = std::max(static_cast<double>(extent) * sigma_scale, 1e-6);
            auto coordinates = torch::linspace(-half, half, extent, options);
            auto profile = torch::exp(-0.5 * coordinates.pow(2) / (sigma * sigma));

            std::vector<std::int64_t> view(roi_size.size(), 1);
            view[axis] = extent;
            map = map * profile.view(view);
        }

        map = map / map.max();
        const auto positive = map.masked_select(map > 0);
        const auto floor = positive.numel() > 0 ? positive.min().item<float>() : 1.0f;
        return map.clamp_min(floor).contiguous();
    }
}

#endif // STITCH_INFERENCE_IMPORTANCE_HPP
