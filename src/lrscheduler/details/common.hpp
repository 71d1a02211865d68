#ifndef STITCH_LRSCHEDULER_COMMON_HPP
#define STITCH_LRSCHEDULER_COMMON_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/save_load.hpp"

namespace Stitch::LrScheduler::Details {
    using PropertyTree = Common::SaveLoad::PropertyTree;

    // Advanced once per epoch. Only metric-driven schedules read `metric`.
    class Scheduler {
    public:
        virtual ~Scheduler() = default;
        virtual void step(std::optional<double> metric) = 0;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual PropertyTree state() const = 0;
        virtual void load_state(const PropertyTree& state) = 0;
    };

    inline std::vector<double> capture_base_lrs(torch::optim::Optimizer& optimizer) {
        std::vector<double> base_lrs;
        base_lrs.reserve(optimizer.param_groups().size());
        for (auto& group : optimizer.param_groups()) {
            base_lrs.push_back(group.options().get_lr());
        }
        return base_lrs;
    }

    // Schedules whose rate is a closed-form function of the epoch counter.
    class EpochScheduler : public Scheduler {
    public:
        explicit EpochScheduler(torch::optim::Optimizer& optimizer)
            : optimizer_(optimizer), base_lrs_(capture_base_lrs(optimizer)) {}

        void step(std::optional<double>) override {
            ++step_count_;
            apply();
        }

        [[nodiscard]] PropertyTree state() const override {
            PropertyTree tree;
            tree.put("name", std::string(name()));
            tree.put("step_count", step_count_);
            tree.add_child("base_lrs", Common::SaveLoad::Detail::write_array(base_lrs_));
            return tree;
        }

        void load_state(const PropertyTree& state) override {
            const std::string context = "scheduler state";
            if (Common::SaveLoad::Detail::get_string(state, "name", context) != name()) {
                throw Error(Stage::CheckpointRead, "Scheduler state belongs to a different schedule.");
            }
            step_count_ = Common::SaveLoad::Detail::get_numeric<std::size_t>(state, "step_count", context);
            const auto stored = state.get_child_optional("base_lrs");
            if (!stored) {
                throw Error(Stage::CheckpointRead, "Scheduler state has no base_lrs.");
            }
            auto base_lrs = Common::SaveLoad::Detail::read_array<double>(*stored, context);
            if (base_lrs.size() != optimizer_.param_groups().size()) {
                throw Error(Stage::CheckpointRead, "Scheduler state does not match the optimizer's parameter groups.");
            }
            base_lrs_ = std::move(base_lrs);
            apply();
        }

        [[nodiscard]] std::size_t step_count() const noexcept { return step_count_; }

    protected:
        void apply() {
            auto& param_groups = optimizer_.param_groups();
            if (base_lrs_.size() != param_groups.size()) {
                throw Error(Stage::TrainingStep, "Optimizer param group count changed after the schedule was built.");
            }
            for (std::size_t index = 0; index < param_groups.size(); ++index) {
                param_groups[index].options().set_lr(compute_lr(base_lrs_[index], step_count_));
            }
        }

        [[nodiscard]] virtual double compute_lr(double base_lr, std::size_t step) const = 0;

    private:
        torch::optim::Optimizer& optimizer_;
        std::vector<double> base_lrs_{};
        std::size_t step_count_{0};
    };

}

#endif // STITCH_LRSCHEDULER_COMMON_HPP
