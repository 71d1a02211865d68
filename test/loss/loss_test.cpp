#include <cmath>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support/fixtures.hpp"

namespace {
    // Logits that put almost all mass on the true class.
    torch::Tensor confident_logits(const torch::Tensor& labels, std::int64_t classes)
    {
        return Stitch::Loss::Details::one_hot_targets(labels, classes) * 40.0 - 20.0;
    }
}

TEST(Loss, DiceIsNearZeroForConfidentCorrectPrediction)
{
    const auto labels = torch::randint(0, 3, {2, 4, 4, 4}, torch::kLong);
    const auto loss = Stitch::Loss::compute(Stitch::Loss::Dice(), confident_logits(labels, 3), labels);
    EXPECT_EQ(loss.dim(), 0);
    EXPECT_LT(loss.item<double>(), 1e-4);
}

TEST(Loss, DiceIsNearOneForConfidentWrongPrediction)
{
    auto labels = torch::zeros({1, 4, 4}, torch::kLong);
    labels.narrow(1, 0, 2).fill_(1);
    const auto wrong = 1 - labels;
    const auto loss = Stitch::Loss::compute(Stitch::Loss::Dice({.include_background = false}),
                                            confident_logits(wrong, 2), labels);
    EXPECT_GT(loss.item<double>(), 0.99);
}

TEST(Loss, AcceptsChannelledTargets)
{
    const auto labels = torch::randint(0, 2, {2, 3, 3, 3}, torch::kLong);
    const auto logits = torch::randn({2, 2, 3, 3, 3});
    const auto flat = Stitch::Loss::compute(Stitch::Loss::DiceFocal(), logits, labels);
    const auto channelled = Stitch::Loss::compute(Stitch::Loss::DiceFocal(), logits, labels.unsqueeze(1));
    EXPECT_TRUE(torch::allclose(flat, channelled));
}

TEST(Loss, FocalWithZeroGammaEqualsCrossEntropy)
{
    const auto labels = torch::randint(0, 3, {2, 5, 5}, torch::kLong);
    const auto logits = torch::randn({2, 3, 5, 5});
    const auto focal = Stitch::Loss::compute(Stitch::Loss::Focal({.gamma = 0.0}), logits, labels);
    const auto cross_entropy = Stitch::Loss::compute(Stitch::Loss::CrossEntropy(), logits, labels);
    EXPECT_NEAR(focal.item<double>(), cross_entropy.item<double>(), 1e-5);
}

TEST(Loss, FocalDownWeightsEasyVoxels)
{
    const auto labels = torch::randint(0, 2, {1, 6, 6}, torch::kLong);
    const auto logits = Stitch::Loss::Details::one_hot_targets(labels, 2) * 2.0;
    const auto focal = Stitch::Loss::compute(Stitch::Loss::Focal(), logits, labels).item<double>();
    const auto cross_entropy = Stitch::Loss::compute(Stitch::Loss::CrossEntropy(), logits, labels).item<double>();
    EXPECT_LT(focal, cross_entropy);
}

TEST(Loss, DiceFocalIsTheWeightedSum)
{
    const auto labels = torch::randint(0, 2, {2, 4, 4, 4}, torch::kLong);
    const auto logits = torch::randn({2, 2, 4, 4, 4});
    const auto dice = Stitch::Loss::compute(Stitch::Loss::Dice(), logits, labels).item<double>();
    const auto focal = Stitch::Loss::compute(Stitch::Loss::Focal(), logits, labels).item<double>();
    const auto combined = Stitch::Loss::compute(Stitch::Loss::DiceFocal(), logits, labels).item<double>();
    EXPECT_NEAR(combined, 0.7 * dice + 0.3 * focal, 1e-5);
}

TEST(Loss, NoReductionKeepsPerSampleTerms)
{
    const auto labels = torch::randint(0, 2, {3, 4, 4}, torch::kLong);
    const auto logits = torch::randn({3, 2, 4, 4});
    const auto loss = Stitch::Loss::compute(Stitch::Loss::Dice({.reduction = Stitch::Loss::Reduction::None}), logits, labels);
    EXPECT_EQ(loss.sizes(), (std::vector<std::int64_t>{3, 2}));
}

TEST(Loss, GradientsFlowToLogits)
{
    const auto labels = torch::randint(0, 2, {1, 4, 4, 4}, torch::kLong);
    auto logits = torch::randn({1, 2, 4, 4, 4}, torch::requires_grad());
    Stitch::Loss::compute(Stitch::Loss::DiceFocal(), logits, labels).backward();
    ASSERT_TRUE(logits.grad().defined());
    EXPECT_GT(logits.grad().abs().sum().item<double>(), 0.0);
}

TEST(Loss, MismatchedTargetIsAShapeError)
{
    const auto logits = torch::randn({2, 2, 4, 4});
    const auto labels = torch::zeros({2, 4, 5}, torch::kLong);
    EXPECT_THROW((void)Stitch::Loss::compute(Stitch::Loss::Dice(), logits, labels), Stitch::ShapeMismatchError);
    EXPECT_THROW((void)Stitch::Loss::compute(Stitch::Loss::CrossEntropy(), logits, labels), Stitch::ShapeMismatchError);
}

TEST(Loss, WeightedCrossEntropyMatchesTorch)
{
    const auto labels = torch::randint(0, 3, {2, 4, 4}, torch::kLong);
    const auto logits = torch::randn({2, 3, 4, 4});
    const auto ours = Stitch::Loss::compute(Stitch::Loss::CrossEntropy({.weight = {0.2, 1.0, 3.0}}), logits, labels);
    const auto reference = torch::nn::functional::cross_entropy(
        logits, labels, torch::nn::functional::CrossEntropyFuncOptions().weight(torch::tensor({0.2f, 1.0f, 3.0f})));
    EXPECT_NEAR(ours.item<double>(), reference.item<double>(), 1e-5);

    const auto per_voxel = Stitch::Loss::compute(
        Stitch::Loss::CrossEntropy({.reduction = Stitch::Loss::Reduction::None}), logits, labels);
    EXPECT_EQ(per_voxel.sizes(), labels.sizes());

    EXPECT_THROW((void)Stitch::Loss::compute(Stitch::Loss::CrossEntropy({.weight = {1.0, 1.0}}), logits, labels),
                 Stitch::ShapeMismatchError);
}
