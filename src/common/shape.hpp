#ifndef STITCH_COMMON_SHAPE_HPP
#define STITCH_COMMON_SHAPE_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "errors.hpp"

namespace Stitch::Common {
    inline std::string format_shape(c10::IntArrayRef sizes)
    {
        std::ostringstream stream;
        stream << '(';
        for (std::size_t index = 0; index < sizes.size(); ++index) {
            if (index > 0) {
                stream << ", ";
            }
            stream << sizes[index];
        }
        stream << ')';
        return stream.str();
    }

    inline std::string format_shape(const std::vector<std::int64_t>& sizes)
    {
        return format_shape(c10::IntArrayRef(sizes));
    }

    // Trailing `spatial_dims` extents of a tensor.
    inline std::vector<std::int64_t> spatial_extent(const torch::Tensor& tensor, std::size_t spatial_dims)
    {
        if (tensor.dim() < static_cast<std::int64_t>(spatial_dims)) {
            throw ShapeMismatchError(Stage::WindowConstruction,
                                     "Tensor of shape " + format_shape(tensor.sizes()) + " has fewer than "
                                         + std::to_string(spatial_dims) + " spatial dimensions.");
        }
        const auto sizes = tensor.sizes();
        return {sizes.end() - static_cast<std::ptrdiff_t>(spatial_dims), sizes.end()};
    }

    // Drops a singleton channel axis from an integer label map: [B, 1, *S] -> [B, *S].
    inline torch::Tensor squeeze_label_channel(const torch::Tensor& labels, std::size_t spatial_dims)
    {
        if (labels.dim() == static_cast<std::int64_t>(spatial_dims) + 2 && labels.size(1) == 1) {
            return labels.squeeze(1);
        }
        return labels;
    }
}

#endif // STITCH_COMMON_SHAPE_HPP
