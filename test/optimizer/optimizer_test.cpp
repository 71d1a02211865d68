#include <cstddef>
#include <variant>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support/fixtures.hpp"

namespace {
    std::size_t optimized_tensors(torch::optim::Optimizer& optimizer)
    {
        std::size_t count = 0;
        for (auto& group : optimizer.param_groups()) {
            count += group.params().size();
        }
        return count;
    }
}

TEST(Optimizer, BuildsEachKindWithItsLearningRate)
{
    StitchTest::PointwiseNetwork network(1, 2);
    const Stitch::Optimizer::Descriptor descriptors[] = {
        Stitch::Optimizer::AdamW({.learning_rate = 3e-4}),
        Stitch::Optimizer::Adam({.learning_rate = 2e-3}),
        Stitch::Optimizer::SGD({.learning_rate = 5e-2, .nesterov = true}),
    };
    const double expected[] = {3e-4, 2e-3, 5e-2};
    for (std::size_t index = 0; index < 3; ++index) {
        auto optimizer = Stitch::Optimizer::build(network, descriptors[index]);
        ASSERT_NE(optimizer, nullptr);
        EXPECT_DOUBLE_EQ(Stitch::Optimizer::Details::learning_rate(*optimizer), expected[index]);
        EXPECT_EQ(optimized_tensors(*optimizer), 2u);
    }
    EXPECT_TRUE(std::holds_alternative<Stitch::Optimizer::AdamWDescriptor>(Stitch::Optimizer::Descriptor{}));
}

TEST(Optimizer, SkipsFrozenParameters)
{
    StitchTest::PointwiseNetwork network(1, 2);
    auto parameters = network.parameters();
    parameters.front().set_requires_grad(false);

    auto optimizer = Stitch::Optimizer::build(network, Stitch::Optimizer::Adam());
    EXPECT_EQ(optimized_tensors(*optimizer), parameters.size() - 1);

    for (auto& parameter : parameters) {
        parameter.set_requires_grad(false);
    }
    EXPECT_THROW((void)Stitch::Optimizer::build(network, Stitch::Optimizer::Adam()), Stitch::ConfigurationError);
}

TEST(Optimizer, RejectsInvalidOptions)
{
    StitchTest::PointwiseNetwork network(1, 2);
    EXPECT_THROW((void)Stitch::Optimizer::build(network, Stitch::Optimizer::Adam({.learning_rate = 0.0})),
                 Stitch::ConfigurationError);
    EXPECT_THROW((void)Stitch::Optimizer::build(network, Stitch::Optimizer::AdamW({.beta1 = 1.0})),
                 Stitch::ConfigurationError);
    EXPECT_THROW((void)Stitch::Optimizer::build(network, Stitch::Optimizer::SGD({.momentum = 0.0, .nesterov = true})),
                 Stitch::ConfigurationError);
    EXPECT_THROW((void)Stitch::Optimizer::build(network, Stitch::Optimizer::SGD({.weight_decay = -1.0})),
                 Stitch::ConfigurationError);
}
