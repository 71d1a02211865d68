#ifndef STITCH_TRAINING_TRAINER_HPP
#define STITCH_TRAINING_TRAINER_HPP

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/cancellation.hpp"
#include "../../common/context.hpp"
#include "../../common/errors.hpp"
#include "../../data/data.hpp"
#include "../../loss/loss.hpp"
#include "../../lrscheduler/lrscheduler.hpp"
#include "../../network.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../utils/progressbar.hpp"
#include "grad_scaler.hpp"

namespace Stitch::Training::Details {
    struct TrainerOptions {
        std::optional<double> gradient_clip_max_norm{};
        GradScalerOptions scaler{};
        bool show_progress{false};
        std::ostream* stream{&std::cout};
        Common::CancellationToken cancellation{};
    };

    // Owns the optimizer, the learning-rate schedule and the loss scaler bound to
    // one network. The network's parameters are only ever mutated here.
    class Trainer {
    public:
        Trainer(NetworkPtr network,
                const Optimizer::Descriptor& optimizer,
                std::optional<LrScheduler::Descriptor> scheduler,
                Loss::Descriptor loss,
                ExecutionContext context,
                TrainerOptions options = {})
            : network_(std::move(network)),
              loss_(std::move(loss)),
              context_(context),
              options_(std::move(options)),
              scaler_(scaler_options(options_.scaler, context_))
        {
            if (!network_) {
                throw std::invalid_argument("Trainer requires a network.");
            }
            if (options_.gradient_clip_max_norm && !(*options_.gradient_clip_max_norm > 0.0)) {
                throw ConfigurationError("gradient_clip_max_norm must be positive when set.");
            }
            network_->to(context_.device);
            optimizer_ = Optimizer::build(*network_, optimizer);
            if (scheduler) {
                scheduler_ = LrScheduler::build(*optimizer_, *scheduler);
            }
        }

        Trainer(const Trainer&) = delete;
        Trainer& operator=(const Trainer&) = delete;

        // One pass over `stream`; returns the mean of the per-batch losses.
        double train_epoch(Data::Stream& stream, std::size_t epoch_index)
        {
            network_->train();
            stream.reset(epoch_index);

            std::optional<Utils::ProgressBar> progress;
            const auto total = stream.batches();
            if (options_.show_progress && options_.stream && total) {
                progress.emplace(static_cast<std::int64_t>(*total), "Epoch " + std::to_string(epoch_index), *options_.stream);
            }

            double loss_sum = 0.0;
            std::size_t steps = 0;
            while (auto batch = stream.next()) {
                options_.cancellation.throw_if_cancelled(Stage::TrainingStep);
                const auto value = train_step(*batch, epoch_index, steps);
                loss_sum += value;
                ++steps;
                if (progress) {
                    std::ostringstream suffix;
                    suffix << "loss " << std::fixed << std::setprecision(4) << (loss_sum / static_cast<double>(steps));
                    progress->update(static_cast<std::int64_t>(steps), suffix.str());
                }
            }

            if (steps == 0) {
                throw Error(Stage::DataStream, "Training stream produced no batches.");
            }
            return loss_sum / static_cast<double>(steps);
        }

        // Advances the schedule by one epoch; plateau schedules read `metric`.
        void step_scheduler(std::optional<double> metric)
        {
            if (scheduler_) {
                scheduler_->step(metric);
            }
        }

        [[nodiscard]] double learning_rate() const { return Optimizer::Details::learning_rate(*optimizer_); }

        [[nodiscard]] Network& network() noexcept { return *network_; }
        [[nodiscard]] const NetworkPtr& network_ptr() const noexcept { return network_; }
        [[nodiscard]] torch::optim::Optimizer& optimizer() noexcept { return *optimizer_; }
        [[nodiscard]] LrScheduler::Scheduler* scheduler() noexcept { return scheduler_.get(); }
        [[nodiscard]] GradScaler& scaler() noexcept { return scaler_; }
        [[nodiscard]] const Loss::Descriptor& loss() const noexcept { return loss_; }
        [[nodiscard]] const ExecutionContext& context() const noexcept { return context_; }

    private:
        static GradScalerOptions scaler_options(GradScalerOptions options, const ExecutionContext& context)
        {
            // bfloat16 keeps the float32 exponent range and needs no scaling.
            options.enabled = options.enabled && context.precision == Precision::Float16;
            return options;
        }

        double train_step(const Data::Batch& batch, std::size_t epoch_index, std::size_t step_index)
        {
            auto inputs = batch.images.to(context_.device);
            auto labels = batch.labels.to(context_.device);

            optimizer_->zero_grad();
            torch::Tensor loss;
            {
                AutocastGuard autocast(context_);
                auto scores = network_->forward(inputs);
                loss = Loss::compute(loss_, scores, labels);
                if (loss.dim() != 0) {
                    loss = loss.mean();
                }
            }

            const auto value = loss.item<double>();
            if (!std::isfinite(value)) {
                std::ostringstream message;
                message << "Loss became " << value << " at epoch " << epoch_index << ", batch " << step_index << '.';
                throw TrainingDivergenceError(message.str());
            }

            scaler_.scale(loss).backward();
            if (options_.gradient_clip_max_norm) {
                scaler_.unscale(*optimizer_);
                torch::nn::utils::clip_grad_norm_(network_->parameters(), *options_.gradient_clip_max_norm);
            }
            scaler_.step(*optimizer_);
            scaler_.update();
            return value;
        }

        NetworkPtr network_;
        Loss::Descriptor loss_;
        ExecutionContext context_;
        TrainerOptions options_;
        GradScaler scaler_;
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
        LrScheduler::SchedulerPtr scheduler_{};
    };
}

#endif // STITCH_TRAINING_TRAINER_HPP
