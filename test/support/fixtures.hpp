#ifndef STITCH_TEST_SUPPORT_FIXTURES_HPP
#define STITCH_TEST_SUPPORT_FIXTURES_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../include/Stitch.h"

namespace StitchTest {
    // 1x1x1 convolution: every voxel is scored independently, which makes the
    // network equivariant to flips and insensitive to window placement.
    class PointwiseNetwork final : public Stitch::Network {
    public:
        PointwiseNetwork(std::int64_t in_channels, std::int64_t classes)
            : conv_(register_module("conv", torch::nn::Conv3d(torch::nn::Conv3dOptions(in_channels, classes, 1))))
        {}

        torch::Tensor forward(torch::Tensor input) override { return conv_->forward(input); }

    private:
        torch::nn::Conv3d conv_{nullptr};
    };

    // A padded 3x3x3 convolution followed by a pointwise one; enough for training
    // to move the loss, small enough for a 16^3 volume on the CPU.
    class TinySegmenter final : public Stitch::Network {
    public:
        TinySegmenter(std::int64_t in_channels, std::int64_t classes, std::int64_t width = 4)
            : first_(register_module("first", torch::nn::Conv3d(torch::nn::Conv3dOptions(in_channels, width, 3).padding(1)))),
              second_(register_module("second", torch::nn::Conv3d(torch::nn::Conv3dOptions(width, classes, 1))))
        {}

        torch::Tensor forward(torch::Tensor input) override
        {
            return second_->forward(torch::relu(first_->forward(input)));
        }

    private:
        torch::nn::Conv3d first_{nullptr};
        torch::nn::Conv3d second_{nullptr};
    };

    // Channel mixing with a fixed [K, C] matrix; works for any number of spatial axes.
    inline Stitch::Predictor linear_predictor(torch::Tensor weights)
    {
        return [weights = std::move(weights)](const torch::Tensor& input) {
            return torch::einsum("kc,nc...->nk...", {weights, input});
        };
    }

    // Scores that depend on the absolute position inside the window, so results
    // change under flips unless the flip is undone.
    inline Stitch::Predictor position_sensitive_predictor(std::int64_t classes)
    {
        return [classes](const torch::Tensor& input) {
            const auto spatial = input.dim() - 2;
            auto ramp = torch::arange(input.size(2), input.options());
            std::vector<std::int64_t> shape(static_cast<std::size_t>(spatial), 1);
            shape[0] = input.size(2);
            ramp = ramp.view(shape);
            std::vector<torch::Tensor> channels;
            for (std::int64_t k = 0; k < classes; ++k) {
                channels.push_back(input.sum(1) * static_cast<double>(k + 1) + ramp * static_cast<double>(k));
            }
            return torch::stack(channels, 1);
        };
    }

    inline Stitch::Data::TensorStream spheres_stream(std::size_t count,
                                                     std::vector<std::int64_t> extent,
                                                     std::size_t batch_size = 1,
                                                     std::uint64_t seed = 7)
    {
        Stitch::Data::SyntheticSpheresOptions options{};
        options.extent = std::move(extent);
        options.seed = seed;
        return Stitch::Data::TensorStream(Stitch::Data::synthetic_spheres(count, options), {.batch_size = batch_size});
    }

    // Unique directory under the system temp path, removed on destruction.
    class TemporaryDirectory {
    public:
        TemporaryDirectory()
        {
            static std::atomic<int> counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path()
                    / ("stitch-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        ~TemporaryDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };
}

#endif // STITCH_TEST_SUPPORT_FIXTURES_HPP
