#ifndef STITCH_CORE_HPP
#define STITCH_CORE_HPP
/*
 * Core orchestrator of the framework.
 * ---------------------------------------------------------------------------
 *  - Sequences Initializing -> (Resuming) -> [TrainEpoch -> (ValidateEpoch)
 *    -> Checkpoint] x max_epochs -> Finalizing.
 *  - Owns the run state (best metric, best epoch, history); nothing lives in
 *    globals, so several runs can coexist in one process.
 *  - "latest" is written after every epoch, "best" only when the validation
 *    metric strictly exceeds the previous best, both before telemetry sinks
 *    see the epoch. Scheduler and loss-scaler state always travel with the
 *    checkpoint.
 *  - With a seed, epoch e trains with the torch generator at seed + e and
 *    streams are rewound for pass e, so resuming reproduces the same epoch.
 *  - Any failure is logged with the state it happened in and rethrown; the
 *    last written checkpoint is left as it was.
 */
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "checkpoint/checkpoint.hpp"
#include "common/cancellation.hpp"
#include "common/context.hpp"
#include "common/errors.hpp"
#include "common/save_load.hpp"
#include "config/config.hpp"
#include "data/data.hpp"
#include "network.hpp"
#include "telemetry/telemetry.hpp"
#include "training/training.hpp"
#include "utils/terminal.hpp"
#include "validation/validation.hpp"

namespace Stitch::Orchestration {
    enum class State {
        Initializing,
        Resuming,
        TrainEpoch,
        ValidateEpoch,
        Checkpoint,
        Finalizing,
        Finished,
        Failed
    };

    [[nodiscard]] constexpr std::string_view to_string(State state) noexcept
    {
        switch (state) {
            case State::Initializing: return "initializing";
            case State::Resuming: return "resuming";
            case State::TrainEpoch: return "train epoch";
            case State::ValidateEpoch: return "validate epoch";
            case State::Checkpoint: return "checkpoint";
            case State::Finalizing: return "finalizing";
            case State::Finished: return "finished";
            case State::Failed: return "failed";
        }
        return "unknown";
    }

    struct OrchestratorOptions {
        std::size_t max_epochs{100};
        std::size_t val_interval{1};
        std::size_t early_stopping_patience{0};
        std::optional<std::uint64_t> seed{};
        bool resume{true};
        std::filesystem::path checkpoint_dir{"checkpoints"};
        Common::SaveLoad::PropertyTree config{};
        std::vector<Telemetry::SinkPtr> sinks{};
        std::ostream* stream{&std::cout};
        Common::CancellationToken cancellation{};
    };

    struct Summary {
        std::size_t epochs_run{0};
        std::size_t last_epoch{0};
        std::optional<std::size_t> resumed_from{};
        std::optional<double> best_metric{};
        std::optional<std::size_t> best_epoch{};
        bool stopped_early{false};
        std::size_t best_checkpoint_writes{0};
        std::vector<Telemetry::EpochRecord> history{};
    };

    class Orchestrator {
    public:
        Orchestrator(std::unique_ptr<Training::Trainer> trainer,
                     std::unique_ptr<Validation::Validator> validator,
                     OrchestratorOptions options = {})
            : trainer_(std::move(trainer)),
              validator_(std::move(validator)),
              options_(std::move(options)),
              store_(options_.checkpoint_dir, Checkpoint::StoreOptions{.stream = options_.stream})
        {
            if (!trainer_) {
                throw std::invalid_argument("Orchestrator requires a trainer.");
            }
            if (options_.max_epochs == 0) {
                throw ConfigurationError("max_epochs must be at least 1.");
            }
            if (options_.val_interval == 0) {
                throw ConfigurationError("val_interval must be at least 1.");
            }
        }

        Orchestrator(const Orchestrator&) = delete;
        Orchestrator& operator=(const Orchestrator&) = delete;

        // Epochs are numbered from 1. Without a validation stream (or validator)
        // no metric is recorded and "best" is never written.
        Summary run(Data::Stream& training, Data::Stream* validation = nullptr)
        {
            try {
                return execute(training, validation);
            } catch (const std::exception& error) {
                if (options_.stream) {
                    *options_.stream << Utils::Terminal::ApplyColor("[Stitch] run failed during " + std::string(to_string(state_))
                                                                        + ": " + error.what(),
                                                                    Utils::Terminal::Colors::kRed)
                                     << std::endl;
                }
                state_ = State::Failed;
                throw;
            }
        }

        [[nodiscard]] State state() const noexcept { return state_; }
        [[nodiscard]] const std::optional<double>& best_metric() const noexcept { return best_metric_; }
        [[nodiscard]] const std::optional<std::size_t>& best_epoch() const noexcept { return best_epoch_; }
        [[nodiscard]] const std::vector<Telemetry::EpochRecord>& history() const noexcept { return history_; }
        [[nodiscard]] Training::Trainer& trainer() noexcept { return *trainer_; }
        [[nodiscard]] Validation::Validator* validator() noexcept { return validator_.get(); }
        [[nodiscard]] Checkpoint::Store& store() noexcept { return store_; }

    private:
        Summary execute(Data::Stream& training, Data::Stream* validation)
        {
            state_ = State::Initializing;
            if (options_.seed) {
                torch::manual_seed(*options_.seed);
            }
            log() << "[Stitch] training on " << trainer_->context().describe() << " for " << options_.max_epochs << " epochs";
            end_line();

            Summary summary{};
            std::size_t first_epoch = 1;
            if (options_.resume) {
                if (auto resumed = resume()) {
                    summary.resumed_from = *resumed;
                    first_epoch = *resumed + 1;
                }
            }
            summary.last_epoch = first_epoch - 1;

            for (std::size_t epoch = first_epoch; epoch <= options_.max_epochs; ++epoch) {
                options_.cancellation.throw_if_cancelled(Stage::TrainingStep);
                const auto started = std::chrono::steady_clock::now();
                if (options_.seed) {
                    // Random draws inside an epoch depend on (seed, epoch) alone.
                    torch::manual_seed(*options_.seed + epoch);
                }

                state_ = State::TrainEpoch;
                Telemetry::EpochRecord record{};
                record.epoch_index = epoch;
                record.learning_rate = trainer_->learning_rate();
                record.train_loss = trainer_->train_epoch(training, epoch);

                if (validation && validator_ && epoch % options_.val_interval == 0) {
                    state_ = State::ValidateEpoch;
                    const auto report = validator_->run(trainer_->network(), trainer_->context(), *validation);
                    record.val_metric = report.metric;
                    record.val_loss = report.loss;
                    if (report.metric && (!best_metric_ || *report.metric > *best_metric_)) {
                        best_metric_ = report.metric;
                        best_epoch_ = epoch;
                        record.improved = true;
                    }
                }
                trainer_->step_scheduler(record.val_metric);

                record.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
                history_.push_back(record);

                state_ = State::Checkpoint;
                const auto metadata = snapshot(epoch);
                store_.save(Checkpoint::Variant::Latest, trainer_->network(), trainer_->optimizer(), metadata);
                if (record.improved) {
                    store_.save(Checkpoint::Variant::Best, trainer_->network(), trainer_->optimizer(), metadata);
                }

                // Sinks see an epoch only once it is on disk; a failing sink never costs the epoch.
                for (const auto& sink : options_.sinks) {
                    if (sink) {
                        sink->record(record);
                    }
                }

                ++summary.epochs_run;
                summary.last_epoch = epoch;
                if (should_stop(epoch)) {
                    summary.stopped_early = true;
                    log() << "[Stitch] no improvement for " << (epoch - *best_epoch_) << " epochs, stopping early";
                    end_line();
                    break;
                }
            }

            state_ = State::Finalizing;
            summary.best_metric = best_metric_;
            summary.best_epoch = best_epoch_;
            summary.best_checkpoint_writes = store_.writes(Checkpoint::Variant::Best);
            summary.history = history_;
            if (best_metric_) {
                log() << "[Stitch] best metric " << std::fixed << std::setprecision(4) << *best_metric_ << " at epoch "
                      << *best_epoch_;
                end_line();
            }
            state_ = State::Finished;
            return summary;
        }

        // Restores the latest checkpoint, if any; returns its epoch.
        std::optional<std::size_t> resume()
        {
            state_ = State::Resuming;
            auto metadata = store_.load(Checkpoint::Variant::Latest, trainer_->network(), &trainer_->optimizer());
            if (!metadata) {
                return std::nullopt;
            }

            best_metric_ = metadata->best_metric;
            best_epoch_ = metadata->best_epoch;
            history_ = std::move(metadata->history);

            if (auto* scheduler = trainer_->scheduler()) {
                if (metadata->scheduler) {
                    scheduler->load_state(*metadata->scheduler);
                } else {
                    log() << Utils::Terminal::ApplyColor("[Stitch] checkpoint carries no scheduler state, the schedule restarts",
                                                         Utils::Terminal::Colors::kYellow);
                    end_line();
                }
            }
            if (metadata->scaler) {
                trainer_->scaler().load_state(*metadata->scaler);
            }

            log() << "[Stitch] resumed from epoch " << metadata->epoch << " in " << store_.directory().string();
            end_line();
            return metadata->epoch;
        }

        [[nodiscard]] Checkpoint::Metadata snapshot(std::size_t epoch) const
        {
            Checkpoint::Metadata metadata{};
            metadata.epoch = epoch;
            metadata.best_metric = best_metric_;
            metadata.best_epoch = best_epoch_;
            metadata.history = history_;
            metadata.config = options_.config;
            if (const auto* scheduler = trainer_->scheduler()) {
                metadata.scheduler = scheduler->state();
            }
            metadata.scaler = trainer_->scaler().state();
            return metadata;
        }

        [[nodiscard]] bool should_stop(std::size_t epoch) const noexcept
        {
            return options_.early_stopping_patience > 0 && best_epoch_
                   && epoch - *best_epoch_ > options_.early_stopping_patience;
        }

        std::ostream& log()
        {
            return options_.stream ? *options_.stream : null_stream_;
        }

        void end_line()
        {
            if (options_.stream) {
                *options_.stream << std::endl;
            }
        }

        std::unique_ptr<Training::Trainer> trainer_;
        std::unique_ptr<Validation::Validator> validator_;
        OrchestratorOptions options_;
        Checkpoint::Store store_;
        State state_{State::Initializing};
        std::optional<double> best_metric_{};
        std::optional<std::size_t> best_epoch_{};
        std::vector<Telemetry::EpochRecord> history_{};
        std::ostream null_stream_{nullptr};
    };

    // Wires a trainer, validator and orchestrator from a run configuration.
    // A console sink is attached when no sink is given and `stream` is set.
    [[nodiscard]] inline std::unique_ptr<Orchestrator> from_config(NetworkPtr network,
                                                                   const Config::RunConfig& config,
                                                                   std::vector<Telemetry::SinkPtr> sinks = {},
                                                                   std::ostream* stream = &std::cout)
    {
        config.validate();
        const auto context = Config::execution_context(config);
        Common::CancellationToken cancellation{};

        Training::TrainerOptions trainer_options{};
        trainer_options.gradient_clip_max_norm = config.gradient_clip_max_norm;
        trainer_options.stream = stream;
        trainer_options.cancellation = cancellation;
        auto trainer = std::make_unique<Training::Trainer>(std::move(network),
                                                           Config::optimizer_descriptor(config),
                                                           Config::scheduler_descriptor(config),
                                                           Config::loss_descriptor(config),
                                                           context,
                                                           trainer_options);

        Validation::ValidatorOptions validator_options{};
        validator_options.sliding_window = Config::sliding_window_options(config);
        validator_options.sliding_window.cancellation = cancellation;
        validator_options.use_tta = config.use_tta;
        validator_options.flip = Config::flip_options(config);
        validator_options.max_batches = config.val_max_batches;
        validator_options.dice = Config::dice_options(config);
        validator_options.loss = Config::loss_descriptor(config);
        validator_options.stream = stream;
        validator_options.cancellation = cancellation;
        auto validator = std::make_unique<Validation::Validator>(std::move(validator_options));

        if (sinks.empty() && stream) {
            sinks.push_back(Telemetry::Console(stream));
        }

        OrchestratorOptions options{};
        options.max_epochs = config.max_epochs;
        options.val_interval = config.val_interval;
        options.early_stopping_patience = config.early_stopping_patience;
        options.seed = config.seed;
        options.checkpoint_dir = config.checkpoint_dir;
        options.config = Config::to_tree(config);
        options.sinks = std::move(sinks);
        options.stream = stream;
        options.cancellation = cancellation;
        return std::make_unique<Orchestrator>(std::move(trainer), std::move(validator), std::move(options));
    }
}

#endif // STITCH_CORE_HPP
