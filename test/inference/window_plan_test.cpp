#include <cstdint>
#include <random>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support/fixtures.hpp"

namespace {
    using Stitch::Inference::make_window_plan;

    torch::Tensor coverage(const Stitch::Inference::WindowPlan& plan)
    {
        auto counts = torch::zeros(plan.extent, torch::kInt32);
        for (const auto& window : plan.windows) {
            auto view = counts;
            for (std::size_t axis = 0; axis < window.offset.size(); ++axis) {
                view = view.narrow(static_cast<std::int64_t>(axis), window.offset[axis], window.size[axis]);
            }
            view.add_(1);
        }
        return counts;
    }
}

TEST(WindowPlan, CoversEveryVoxelForRandomSettings)
{
    std::mt19937 random(1234);
    std::uniform_int_distribution<int> dims(2, 3);
    std::uniform_int_distribution<std::int64_t> extent_draw(1, 23);
    std::uniform_int_distribution<std::int64_t> roi_draw(1, 9);
    std::uniform_real_distribution<double> overlap_draw(0.0, 0.95);

    for (int trial = 0; trial < 200; ++trial) {
        const auto k = static_cast<std::size_t>(dims(random));
        std::vector<std::int64_t> extent(k);
        std::vector<std::int64_t> roi(k);
        for (std::size_t axis = 0; axis < k; ++axis) {
            extent[axis] = extent_draw(random);
            roi[axis] = roi_draw(random);
        }
        const auto overlap = overlap_draw(random);

        const auto plan = make_window_plan(extent, roi, overlap, true);
        ASSERT_FALSE(plan.empty());
        const auto counts = coverage(plan);
        EXPECT_GT(counts.min().item<std::int32_t>(), 0) << "trial " << trial << " overlap " << overlap;

        for (const auto& window : plan.windows) {
            for (std::size_t axis = 0; axis < k; ++axis) {
                EXPECT_GE(window.offset[axis], 0);
                EXPECT_LE(window.offset[axis] + window.size[axis], plan.extent[axis]);
            }
        }
    }
}

TEST(WindowPlan, FourCubeWithHalfOverlapStepsByOneVoxel)
{
    const auto plan = make_window_plan({4, 4, 4}, {2, 2, 2}, 0.5, true);
    EXPECT_EQ(plan.stride, (std::vector<std::int64_t>{1, 1, 1}));
    EXPECT_EQ(plan.size(), 27u);
    EXPECT_EQ(plan.windows.front().offset, (std::vector<std::int64_t>{0, 0, 0}));
    EXPECT_EQ(plan.windows.back().offset, (std::vector<std::int64_t>{2, 2, 2}));
}

TEST(WindowPlan, ExtentEqualToRoiIsSingleWindow)
{
    const auto plan = make_window_plan({8, 6, 4}, {8, 6, 4}, 0.25, false);
    EXPECT_EQ(plan.size(), 1u);
    EXPECT_FALSE(plan.requires_padding());
}

TEST(WindowPlan, ZeroOverlapTilesWithoutOverlapWhenDivisible)
{
    const auto plan = make_window_plan({8, 8}, {4, 4}, 0.0, false);
    EXPECT_EQ(plan.size(), 4u);
    EXPECT_EQ(coverage(plan).max().item<std::int32_t>(), 1);
}

TEST(WindowPlan, FinalWindowIsFlushWithTheEnd)
{
    const auto plan = make_window_plan({10}, {4}, 0.0, false);
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan.windows[0].offset[0], 0);
    EXPECT_EQ(plan.windows[1].offset[0], 4);
    EXPECT_EQ(plan.windows[2].offset[0], 6);
}

TEST(WindowPlan, SmallVolumeGrowsToRoiWhenPaddingIsAllowed)
{
    const auto plan = make_window_plan({3, 5}, {4, 4}, 0.5, true);
    EXPECT_TRUE(plan.requires_padding());
    EXPECT_EQ(plan.extent, (std::vector<std::int64_t>{4, 5}));
}

TEST(WindowPlan, RejectsInvalidSettings)
{
    EXPECT_THROW((void)make_window_plan({3, 5}, {4, 4}, 0.5, false), Stitch::ConfigurationError);
    EXPECT_THROW((void)make_window_plan({8, 8}, {4, 4}, 1.0, true), Stitch::ConfigurationError);
    EXPECT_THROW((void)make_window_plan({8, 8}, {4, 4}, -0.1, true), Stitch::ConfigurationError);
    EXPECT_THROW((void)make_window_plan({8, 8}, {4, 0}, 0.5, true), Stitch::ConfigurationError);
    EXPECT_THROW((void)make_window_plan({8, 8, 8}, {4, 4}, 0.5, true), Stitch::ConfigurationError);

    try {
        (void)make_window_plan({3, 5}, {4, 4}, 0.5, false);
        FAIL() << "expected a configuration error";
    } catch (const Stitch::ConfigurationError& error) {
        EXPECT_EQ(error.stage(), Stitch::Stage::WindowConstruction);
        EXPECT_NE(std::string(error.what()).find("window construction"), std::string::npos);
    }
}
