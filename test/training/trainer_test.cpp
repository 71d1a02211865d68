#include <limits>
#include <memory>
#include <optional>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "support/fixtures.hpp"

using Stitch::Training::Trainer;
using Stitch::Training::TrainerOptions;

namespace {
    // Scores every voxel as NaN once the bias is touched.
    class DivergingNetwork final : public Stitch::Network {
    public:
        DivergingNetwork() { bias_ = register_parameter("bias", torch::zeros({1})); }

        torch::Tensor forward(torch::Tensor input) override
        {
            auto scores = torch::cat({input, input}, 1) + bias_;
            return scores * std::numeric_limits<float>::quiet_NaN();
        }

    private:
        torch::Tensor bias_;
    };

    TrainerOptions quiet_options()
    {
        TrainerOptions options{};
        options.stream = nullptr;
        return options;
    }

    Trainer make_trainer(Stitch::NetworkPtr network,
                         std::optional<Stitch::LrScheduler::Descriptor> scheduler = std::nullopt,
                         TrainerOptions options = quiet_options())
    {
        return Trainer(std::move(network),
                       Stitch::Optimizer::Adam({.learning_rate = 1e-2}),
                       std::move(scheduler),
                       Stitch::Loss::DiceFocal(),
                       Stitch::ExecutionContext::cpu(),
                       std::move(options));
    }
}

TEST(Trainer, LossDecreasesOnSyntheticSpheres)
{
    torch::manual_seed(21);
    auto network = std::make_shared<StitchTest::TinySegmenter>(1, 2);
    auto trainer = make_trainer(network);
    auto stream = StitchTest::spheres_stream(4, {12, 12, 12}, 2);

    const auto first = trainer.train_epoch(stream, 1);
    double last = first;
    for (std::size_t epoch = 2; epoch <= 15; ++epoch) {
        last = trainer.train_epoch(stream, epoch);
    }
    EXPECT_LT(last, first);
    EXPECT_TRUE(network->is_training());
}

TEST(Trainer, NonFiniteLossIsDivergence)
{
    auto trainer = make_trainer(std::make_shared<DivergingNetwork>());
    auto stream = StitchTest::spheres_stream(2, {6, 6, 6});
    try {
        (void)trainer.train_epoch(stream, 3);
        FAIL() << "expected divergence";
    } catch (const Stitch::TrainingDivergenceError& error) {
        EXPECT_EQ(error.stage(), Stitch::Stage::TrainingStep);
    }
}

TEST(Trainer, EmptyStreamIsADataStreamError)
{
    auto trainer = make_trainer(std::make_shared<StitchTest::PointwiseNetwork>(1, 2));
    Stitch::Data::TensorStream empty({});
    try {
        (void)trainer.train_epoch(empty, 1);
        FAIL() << "expected a data stream error";
    } catch (const Stitch::Error& error) {
        EXPECT_EQ(error.stage(), Stitch::Stage::DataStream);
    }
}

TEST(Trainer, GradientClippingBoundsTheUpdate)
{
    torch::manual_seed(22);
    auto clipped_network = std::make_shared<StitchTest::PointwiseNetwork>(1, 2);
    auto before = clipped_network->parameters()[0].detach().clone();

    auto options = quiet_options();
    options.gradient_clip_max_norm = 1e-6;
    Trainer trainer(clipped_network,
                    Stitch::Optimizer::SGD({.learning_rate = 1.0}),
                    std::nullopt,
                    Stitch::Loss::CrossEntropy(),
                    Stitch::ExecutionContext::cpu(),
                    options);
    auto stream = StitchTest::spheres_stream(1, {6, 6, 6});
    (void)trainer.train_epoch(stream, 1);

    const auto moved = (clipped_network->parameters()[0].detach() - before).norm().item<double>();
    EXPECT_LE(moved, 1e-5);
}

TEST(Trainer, InvalidClipNormIsRejected)
{
    auto options = quiet_options();
    options.gradient_clip_max_norm = 0.0;
    EXPECT_THROW((void)make_trainer(std::make_shared<StitchTest::PointwiseNetwork>(1, 2), std::nullopt, options),
                 Stitch::ConfigurationError);
}

TEST(Trainer, SchedulerStepsOncePerCall)
{
    auto trainer = make_trainer(std::make_shared<StitchTest::PointwiseNetwork>(1, 2),
                                Stitch::LrScheduler::Step({.step_size = 1, .gamma = 0.5}));
    EXPECT_NEAR(trainer.learning_rate(), 1e-2, 1e-12);
    trainer.step_scheduler(std::nullopt);
    EXPECT_NEAR(trainer.learning_rate(), 5e-3, 1e-12);

    auto unscheduled = make_trainer(std::make_shared<StitchTest::PointwiseNetwork>(1, 2));
    unscheduled.step_scheduler(0.5);
    EXPECT_EQ(unscheduled.scheduler(), nullptr);
    EXPECT_NEAR(unscheduled.learning_rate(), 1e-2, 1e-12);
}

TEST(Trainer, CancellationStopsTheEpoch)
{
    auto options = quiet_options();
    Stitch::Common::CancellationToken token;
    options.cancellation = token;
    token.cancel();
    auto trainer = make_trainer(std::make_shared<StitchTest::PointwiseNetwork>(1, 2), std::nullopt, options);
    auto stream = StitchTest::spheres_stream(2, {4, 4, 4});
    EXPECT_THROW((void)trainer.train_epoch(stream, 1), Stitch::CancelledError);
}
