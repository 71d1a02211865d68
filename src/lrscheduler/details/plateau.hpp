#ifndef STITCH_LRSCHEDULER_PLATEAU_HPP
#define STITCH_LRSCHEDULER_PLATEAU_HPP
#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

namespace Stitch::LrScheduler::Details {
    enum class PlateauMode { Max, Min };

    struct PlateauOptions {
        PlateauMode mode{PlateauMode::Max};
        double factor{0.5};
        std::size_t patience{10};
        double threshold{1e-4};
        std::size_t cooldown{0};
        double min_lr{1e-7};
    };

    struct PlateauDescriptor {
        PlateauOptions options{};
    };

    // Multiplies every group's rate by `factor` once the metric has failed to
    // improve (relative threshold) for more than `patience` metric steps.
    class PlateauScheduler final : public Scheduler {
    public:
        PlateauScheduler(torch::optim::Optimizer& optimizer, PlateauOptions options)
            : optimizer_(optimizer), options_(std::move(options)) {
            if (!(options_.factor > 0.0) || options_.factor >= 1.0) {
                throw std::invalid_argument("PlateauScheduler factor must lie in (0, 1).");
            }
            if (options_.threshold < 0.0) {
                throw std::invalid_argument("PlateauScheduler threshold must be non-negative.");
            }
        }

        void step(std::optional<double> metric) override {
            if (!metric) {
                return;
            }
            if (!best_ || improves(*metric, *best_)) {
                best_ = *metric;
                bad_epochs_ = 0;
            } else {
                ++bad_epochs_;
            }

            if (cooldown_counter_ > 0) {
                --cooldown_counter_;
                bad_epochs_ = 0;
            }

            if (bad_epochs_ > options_.patience) {
                reduce();
                cooldown_counter_ = options_.cooldown;
                bad_epochs_ = 0;
            }
        }

        [[nodiscard]] std::string_view name() const noexcept override { return "plateau"; }

        [[nodiscard]] PropertyTree state() const override {
            PropertyTree tree;
            tree.put("name", std::string(name()));
            if (best_) {
                tree.put("best", *best_);
            }
            tree.put("bad_epochs", bad_epochs_);
            tree.put("cooldown_counter", cooldown_counter_);
            std::vector<double> rates;
            for (auto& group : optimizer_.param_groups()) {
                rates.push_back(group.options().get_lr());
            }
            tree.add_child("learning_rates", Common::SaveLoad::Detail::write_array(rates));
            return tree;
        }

        void load_state(const PropertyTree& state) override {
            const std::string context = "scheduler state";
            if (Common::SaveLoad::Detail::get_string(state, "name", context) != name()) {
                throw Error(Stage::CheckpointRead, "Scheduler state belongs to a different schedule.");
            }
            best_ = Common::SaveLoad::Detail::get_optional_numeric<double>(state, "best", context);
            bad_epochs_ = Common::SaveLoad::Detail::get_numeric<std::size_t>(state, "bad_epochs", context);
            cooldown_counter_ = Common::SaveLoad::Detail::get_numeric<std::size_t>(state, "cooldown_counter", context);
            const auto stored = state.get_child_optional("learning_rates");
            if (!stored) {
                throw Error(Stage::CheckpointRead, "Scheduler state has no learning_rates.");
            }
            const auto rates = Common::SaveLoad::Detail::read_array<double>(*stored, context);
            auto& groups = optimizer_.param_groups();
            if (rates.size() != groups.size()) {
                throw Error(Stage::CheckpointRead, "Scheduler state does not match the optimizer's parameter groups.");
            }
            for (std::size_t index = 0; index < groups.size(); ++index) {
                groups[index].options().set_lr(rates[index]);
            }
        }

        [[nodiscard]] std::size_t bad_epochs() const noexcept { return bad_epochs_; }

    private:
        [[nodiscard]] bool improves(double value, double best) const noexcept {
            if (options_.mode == PlateauMode::Max) {
                return value > best * (1.0 + options_.threshold);
            }
            return value < best * (1.0 - options_.threshold);
        }

        void reduce() {
            constexpr double kEpsilon = 1e-8;
            for (auto& group : optimizer_.param_groups()) {
                const auto current = group.options().get_lr();
                const auto reduced = std::max(current * options_.factor, options_.min_lr);
                if (current - reduced > kEpsilon) {
                    group.options().set_lr(reduced);
                }
            }
        }

        torch::optim::Optimizer& optimizer_;
        PlateauOptions options_{};
        std::optional<double> best_{};
        std::size_t bad_epochs_{0};
        std::size_t cooldown_counter_{0};
    };
}

#endif // STITCH_LRSCHEDULER_PLATEAU_HPP
