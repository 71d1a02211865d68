#ifndef STITCH_DATA_SYNTHETIC_HPP
#define STITCH_DATA_SYNTHETIC_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <torch/torch.h>
#include <ATen/CPUGeneratorImpl.h>

#include "../../common/errors.hpp"
#include "stream.hpp"

namespace Stitch::Data::Details {
    struct SyntheticSpheresOptions {
        std::vector<std::int64_t> extent{32, 32, 32};
        std::int64_t channels{1};
        std::int64_t num_classes{2};
        double min_radius{0.15};
        double max_radius{0.3};
        double noise{0.1};
        std::uint64_t seed{0};
    };

    // One sphere (disc in 2-D) per volume. Radii are fractions of the smallest
    // extent. With three or more classes the inner half of the radius is labelled
    // 2. Images are the label intensity plus gaussian noise on every channel.
    [[nodiscard]] inline std::vector<Sample> synthetic_spheres(std::size_t count, const SyntheticSpheresOptions& options = {})
    {
        const auto& extent = options.extent;
        if (extent.size() != 2 && extent.size() != 3) {
            throw ConfigurationError("synthetic_spheres supports 2 or 3 spatial axes.", Stage::DataStream);
        }
        if (options.channels < 1 || options.num_classes < 2) {
            throw ConfigurationError("synthetic_spheres needs at least one channel and two classes.", Stage::DataStream);
        }
        if (!(options.min_radius > 0.0) || options.max_radius < options.min_radius) {
            throw ConfigurationError("synthetic_spheres radius range is empty.", Stage::DataStream);
        }

        std::mt19937_64 random(options.seed);
        auto noise_generator = at::detail::createCPUGenerator(options.seed);
        const auto smallest = static_cast<double>(*std::min_element(extent.begin(), extent.end()));

        std::vector<torch::Tensor> grids;
        for (const auto size : extent) {
            grids.push_back(torch::arange(size, torch::kFloat32));
        }
        const auto coordinates = torch::meshgrid(grids, "ij");

        std::vector<Sample> samples;
        samples.reserve(count);
        for (std::size_t index = 0; index < count; ++index) {
            std::uniform_real_distribution<double> radius_draw(options.min_radius * smallest, options.max_radius * smallest);
            const double radius = radius_draw(random);

            auto squared = torch::zeros(extent, torch::kFloat32);
            for (std::size_t axis = 0; axis < extent.size(); ++axis) {
                const double size = static_cast<double>(extent[axis]);
                const double low = std::min(radius, size / 2.0);
                std::uniform_real_distribution<double> centre_draw(low, std::max(low, size - 1.0 - low));
                squared += (coordinates[axis] - centre_draw(random)).pow(2);
            }
            const auto distance = squared.sqrt();

            auto label = (distance <= radius).to(torch::kLong);
            if (options.num_classes > 2) {
                label.masked_fill_(distance <= radius / 2.0, 2);
            }

            std::vector<std::int64_t> image_shape{options.channels};
            image_shape.insert(image_shape.end(), extent.begin(), extent.end());
            auto intensity = label.to(torch::kFloat32).unsqueeze(0).expand(image_shape);
            auto noise = torch::randn(image_shape, noise_generator, torch::TensorOptions().dtype(torch::kFloat32)) * options.noise;

            samples.push_back(Sample{(intensity + noise).contiguous(), label});
        }
        return samples;
    }
}

#endif // STITCH_DATA_SYNTHETIC_HPP
