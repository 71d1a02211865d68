#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <torch/torch.h>
#include <utility>
#include <vector>
#include "../../include/Stitch.h"

namespace {
    // Two padded 3x3x3 convolutions and a pointwise classifier.
    class SphereSegmenter final : public Stitch::Network {
    public:
        SphereSegmenter(std::int64_t in_channels, std::int64_t classes, std::int64_t width = 8)
            : first_(register_module("first", torch::nn::Conv3d(torch::nn::Conv3dOptions(in_channels, width, 3).padding(1)))),
              second_(register_module("second", torch::nn::Conv3d(torch::nn::Conv3dOptions(width, width, 3).padding(1)))),
              head_(register_module("head", torch::nn::Conv3d(torch::nn::Conv3dOptions(width, classes, 1))))
        {}

        torch::Tensor forward(torch::Tensor input) override {
            auto x = torch::relu(first_->forward(input));
            x = torch::relu(second_->forward(x));
            return head_->forward(x);
        }

    private:
        torch::nn::Conv3d first_{nullptr};
        torch::nn::Conv3d second_{nullptr};
        torch::nn::Conv3d head_{nullptr};
    };

    struct Arguments {
        std::size_t epochs{10};
        std::filesystem::path output{"synthetic_spheres"};
    };

    Arguments parse(int argc, char** argv) {
        Arguments arguments{};
        for (int index = 1; index < argc; ++index) {
            const std::string flag = argv[index];
            if (index + 1 >= argc) {
                throw Stitch::ConfigurationError("Missing value for " + flag + '.');
            }
            const std::string value = argv[++index];
            if (flag == "--epochs") {
                arguments.epochs = static_cast<std::size_t>(std::stoul(value));
            } else if (flag == "--output") {
                arguments.output = value;
            } else {
                throw Stitch::ConfigurationError("Unknown argument " + flag + "; expected --epochs N --output DIR.");
            }
        }
        return arguments;
    }
}

int main(int argc, char** argv) {
    try {
        const auto arguments = parse(argc, argv);
        std::filesystem::remove_all(arguments.output);
        std::filesystem::create_directories(arguments.output);

        Stitch::Config::RunConfig config{};
        config.roi_size = {12, 12, 12};
        config.overlap = 0.25;
        config.sw_batch_size = 2;
        config.max_epochs = arguments.epochs;
        config.learning_rate = 5e-3;
        config.weight_decay = 0.0;
        config.scheduler_kind = "cosine";
        config.use_tta = true;
        config.tta_flips = "single_axis";
        config.device = "auto";
        config.seed = 2024;
        config.checkpoint_dir = arguments.output / "checkpoints";

        Stitch::Config::write_json(arguments.output / "run.json", config);
        std::cout << "[Stitch] configuration written to " << (arguments.output / "run.json").string() << std::endl;

        Stitch::Data::SyntheticSpheresOptions train_options{};
        train_options.extent = {16, 16, 16};
        train_options.seed = 1;
        Stitch::Data::SyntheticSpheresOptions val_options = train_options;
        val_options.seed = 2;

        Stitch::Data::TensorStream training(Stitch::Data::synthetic_spheres(16, train_options),
                                            {.batch_size = 4, .shuffle = true, .seed = config.seed});
        Stitch::Data::TensorStream validation(Stitch::Data::synthetic_spheres(4, val_options));

        auto network = std::make_shared<SphereSegmenter>(1, config.num_classes);
        auto orchestrator = Stitch::Orchestration::from_config(
            network, config,
            {Stitch::Telemetry::Console(&std::cout), Stitch::Telemetry::Csv(arguments.output / "metrics.csv")});
        const auto summary = orchestrator->run(training, &validation);

        std::cout << "[Stitch] " << summary.epochs_run << " epochs, best checkpoint written "
                  << summary.best_checkpoint_writes << " times" << std::endl;
        if (!summary.best_metric) {
            std::cerr << "[Stitch] no validation metric was recorded" << std::endl;
            return EXIT_FAILURE;
        }

        Stitch::Inference::SegmentationPredictorOptions predictor_options{};
        predictor_options.sliding_window = Stitch::Config::sliding_window_options(config);
        predictor_options.flip = Stitch::Config::flip_options(config);
        predictor_options.checkpoint_dir = config.checkpoint_dir;

        Stitch::Inference::SegmentationPredictor predictor(std::make_shared<SphereSegmenter>(1, config.num_classes),
                                                           Stitch::Config::execution_context(config),
                                                           predictor_options);
        const auto epoch = predictor.load();

        Stitch::Data::SyntheticSpheresOptions test_options = train_options;
        test_options.extent = {24, 20, 18};
        test_options.seed = 3;
        const auto held_out = Stitch::Data::synthetic_spheres(2, test_options);

        std::vector<torch::Tensor> volumes;
        for (const auto& sample : held_out) {
            volumes.push_back(sample.image);
        }
        const auto outcomes = predictor.predict_batch(volumes);

        auto dice = Stitch::Metric::Dice(Stitch::Config::dice_options(config));
        for (std::size_t index = 0; index < outcomes.size(); ++index) {
            if (!outcomes[index].ok()) {
                std::cerr << "[Stitch] volume " << index << " failed: " << outcomes[index].error << std::endl;
                return EXIT_FAILURE;
            }
            dice->update(outcomes[index].prediction.to(torch::kCPU).unsqueeze(0), held_out[index].label.unsqueeze(0));
        }

        std::cout << "[Stitch] best epoch " << epoch << " (validation dice " << std::fixed << std::setprecision(4)
                  << *summary.best_metric << "), held-out dice " << dice->aggregate().value_or(0.0) << std::endl;
        return EXIT_SUCCESS;
    } catch (const std::exception& error) {
        std::cerr << "[Stitch] " << error.what() << std::endl;
        return EXIT_FAILURE;
    }
}
