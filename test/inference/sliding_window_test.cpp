#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support/fixtures.hpp"

using Stitch::Inference::BlendMode;
using Stitch::Inference::SlidingWindowInferer;
using Stitch::Inference::SlidingWindowOptions;

namespace {
    torch::Tensor class_weights(std::int64_t classes, std::int64_t channels)
    {
        return torch::linspace(-1.0, 1.0, classes * channels, torch::kFloat32).view({classes, channels});
    }
}

TEST(SlidingWindow, SingleWindowMatchesDirectPredictorCall)
{
    torch::manual_seed(0);
    const auto volume = torch::randn({2, 6, 5, 4});
    const auto predictor = StitchTest::position_sensitive_predictor(3);

    SlidingWindowInferer inferer({.roi_size = {6, 5, 4}, .overlap = 0.5});
    const auto scores = inferer.infer(volume, predictor);
    const auto direct = predictor(volume.unsqueeze(0)).squeeze(0);
    EXPECT_TRUE(torch::allclose(scores, direct, 1e-5, 1e-6));
}

TEST(SlidingWindow, PaddedSingleWindowMatchesPaddedDirectCall)
{
    torch::manual_seed(1);
    const auto volume = torch::randn({1, 3, 4});
    const auto predictor = StitchTest::position_sensitive_predictor(2);

    SlidingWindowInferer inferer({.roi_size = {4, 4}, .overlap = 0.25});
    const auto scores = inferer.infer(volume, predictor);
    ASSERT_EQ(scores.sizes(), (std::vector<std::int64_t>{2, 3, 4}));

    const auto padded = torch::constant_pad_nd(volume, {0, 0, 0, 1}, 0.0);
    const auto direct = predictor(padded.unsqueeze(0)).squeeze(0).narrow(1, 0, 3);
    EXPECT_TRUE(torch::allclose(scores, direct, 1e-5, 1e-6));
}

TEST(SlidingWindow, PointwisePredictorIsReconstructedExactly)
{
    torch::manual_seed(2);
    const auto volume = torch::randn({2, 9, 7, 11});
    const auto weights = class_weights(3, 2);
    const auto predictor = StitchTest::linear_predictor(weights);

    for (const auto mode : {BlendMode::Constant, BlendMode::Gaussian}) {
        SlidingWindowInferer inferer({.roi_size = {4, 4, 4}, .overlap = 0.4, .batch_size = 3, .mode = mode});
        const auto scores = inferer.infer(volume, predictor);
        const auto direct = predictor(volume.unsqueeze(0)).squeeze(0);
        EXPECT_TRUE(torch::allclose(scores, direct, 1e-4, 1e-5)) << Stitch::Inference::Details::to_string(mode);
    }
}

TEST(SlidingWindow, WindowOrderDoesNotChangeTheResult)
{
    torch::manual_seed(3);
    const auto volume = torch::randn({1, 7, 6, 5});
    const auto predictor = StitchTest::position_sensitive_predictor(2);
    SlidingWindowInferer inferer({.roi_size = {3, 3, 3}, .overlap = 0.5, .batch_size = 2, .mode = BlendMode::Gaussian});

    const auto forward = inferer.infer_with_report(volume, predictor);
    std::vector<std::size_t> reverse(forward.plan.size());
    std::iota(reverse.rbegin(), reverse.rend(), std::size_t{0});
    auto shuffled = reverse;
    std::shuffle(shuffled.begin(), shuffled.end(), std::mt19937(99));

    const auto backward = inferer.infer_with_report(volume, predictor, reverse);
    const auto mixed = inferer.infer_with_report(volume, predictor, shuffled);
    EXPECT_TRUE(torch::allclose(forward.scores, backward.scores, 1e-5, 1e-6));
    EXPECT_TRUE(torch::allclose(forward.scores, mixed.scores, 1e-5, 1e-6));

    EXPECT_THROW((void)inferer.infer_with_report(volume, predictor, {0, 0, 1}), std::invalid_argument);
}

TEST(SlidingWindow, FourCubeScenarioLeavesNoVoxelUnweighted)
{
    const auto volume = torch::rand({1, 4, 4, 4});
    SlidingWindowInferer inferer({.roi_size = {2, 2, 2}, .overlap = 0.5});
    const auto report = inferer.infer_with_report(volume, StitchTest::linear_predictor(class_weights(2, 1)));

    EXPECT_EQ(report.plan.size(), 27u);
    EXPECT_EQ(report.predictor_calls, 27u);
    EXPECT_GT(report.weight_sum.min().item<float>(), 0.0f);
    // Corners are seen once, the centre by all eight windows around it.
    EXPECT_FLOAT_EQ(report.weight_sum[0][0][0].item<float>(), 1.0f);
    EXPECT_FLOAT_EQ(report.weight_sum[1][1][1].item<float>(), 8.0f);
}

TEST(SlidingWindow, BatchedInputIsInferredPerItem)
{
    const auto volumes = torch::randn({2, 1, 5, 5});
    const auto predictor = StitchTest::linear_predictor(class_weights(2, 1));
    SlidingWindowInferer inferer({.roi_size = {3, 3}, .overlap = 0.5, .batch_size = 4});

    const auto scores = inferer.infer(volumes, predictor);
    ASSERT_EQ(scores.sizes(), (std::vector<std::int64_t>{2, 2, 5, 5}));
    EXPECT_TRUE(torch::allclose(scores[1], inferer.infer(volumes[1], predictor), 1e-6, 1e-7));
}

TEST(SlidingWindow, RetriesWithSmallerBatchAfterMemoryExhaustion)
{
    const auto volume = torch::randn({1, 6, 6});
    const auto inner = StitchTest::linear_predictor(class_weights(2, 1));
    std::vector<std::int64_t> batch_sizes;
    const Stitch::Predictor predictor = [&](const torch::Tensor& input) {
        batch_sizes.push_back(input.size(0));
        if (input.size(0) > 2) {
            throw Stitch::ResourceExhaustionError("simulated device exhaustion");
        }
        return inner(input);
    };

    SlidingWindowInferer inferer({.roi_size = {3, 3}, .overlap = 0.5, .batch_size = 4});
    const auto report = inferer.infer_with_report(volume, predictor);
    EXPECT_EQ(report.batch_size, 2u);
    EXPECT_EQ(batch_sizes.front(), 4);
    EXPECT_TRUE(std::all_of(batch_sizes.begin() + 1, batch_sizes.end(), [](std::int64_t size) { return size <= 2; }));
    EXPECT_TRUE(torch::allclose(report.scores, inner(volume.unsqueeze(0)).squeeze(0), 1e-5, 1e-6));
}

TEST(SlidingWindow, RepeatedExhaustionPropagates)
{
    const auto volume = torch::randn({1, 6, 6});
    const Stitch::Predictor predictor = [](const torch::Tensor&) -> torch::Tensor {
        throw Stitch::ResourceExhaustionError("always out of memory");
    };

    SlidingWindowInferer batched({.roi_size = {3, 3}, .overlap = 0.5, .batch_size = 4});
    EXPECT_THROW((void)batched.infer(volume, predictor), Stitch::ResourceExhaustionError);

    SlidingWindowInferer single({.roi_size = {3, 3}, .overlap = 0.5, .batch_size = 1});
    EXPECT_THROW((void)single.infer(volume, predictor), Stitch::ResourceExhaustionError);
}

TEST(SlidingWindow, OtherPredictorFailuresAreNotRetried)
{
    const auto volume = torch::randn({1, 6, 6});
    int calls = 0;
    const Stitch::Predictor predictor = [&](const torch::Tensor&) -> torch::Tensor {
        ++calls;
        throw std::runtime_error("broken predictor");
    };
    SlidingWindowInferer inferer({.roi_size = {3, 3}, .overlap = 0.5, .batch_size = 4});
    EXPECT_THROW((void)inferer.infer(volume, predictor), std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST(SlidingWindow, ClassCountMismatchIsAShapeError)
{
    const auto volume = torch::randn({1, 4, 4});
    SlidingWindowInferer inferer({.roi_size = {4, 4}, .num_classes = 3});
    try {
        (void)inferer.infer(volume, StitchTest::linear_predictor(class_weights(2, 1)));
        FAIL() << "expected a shape mismatch";
    } catch (const Stitch::ShapeMismatchError& error) {
        EXPECT_EQ(error.stage(), Stitch::Stage::PredictorCall);
    }
}

TEST(SlidingWindow, WrongSpatialOutputIsAShapeError)
{
    const auto volume = torch::randn({1, 4, 4});
    const Stitch::Predictor shrinking = [](const torch::Tensor& input) { return input.narrow(2, 0, 2); };
    SlidingWindowInferer inferer({.roi_size = {4, 4}});
    EXPECT_THROW((void)inferer.infer(volume, shrinking), Stitch::ShapeMismatchError);
}

TEST(SlidingWindow, RoiLargerThanVolumeWithoutPaddingIsRejected)
{
    const auto volume = torch::randn({1, 3, 3});
    SlidingWindowInferer inferer({.roi_size = {4, 4}, .pad = false});
    EXPECT_THROW((void)inferer.infer(volume, StitchTest::linear_predictor(class_weights(2, 1))), Stitch::ConfigurationError);
}

TEST(SlidingWindow, ConstructorValidatesOptions)
{
    EXPECT_THROW(SlidingWindowInferer({.roi_size = {}}), Stitch::ConfigurationError);
    EXPECT_THROW(SlidingWindowInferer({.roi_size = {4}}), Stitch::ConfigurationError);
    EXPECT_THROW(SlidingWindowInferer({.roi_size = {4, 4}, .overlap = 1.0}), Stitch::ConfigurationError);
    EXPECT_THROW(SlidingWindowInferer({.roi_size = {4, 4}, .batch_size = 0}), Stitch::ConfigurationError);
}

TEST(SlidingWindow, CancellationStopsBetweenWindows)
{
    Stitch::Common::CancellationToken token;
    SlidingWindowOptions options{.roi_size = {2, 2}, .overlap = 0.5};
    options.cancellation = token;
    SlidingWindowInferer inferer(options);

    int calls = 0;
    const auto inner = StitchTest::linear_predictor(class_weights(2, 1));
    const Stitch::Predictor predictor = [&](const torch::Tensor& input) {
        if (++calls == 2) {
            token.cancel();
        }
        return inner(input);
    };
    EXPECT_THROW((void)inferer.infer(torch::randn({1, 5, 5}), predictor), Stitch::CancelledError);
    EXPECT_EQ(calls, 2);
}
