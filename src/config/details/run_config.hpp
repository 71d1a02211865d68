#ifndef STITCH_CONFIG_RUN_CONFIG_HPP
#define STITCH_CONFIG_RUN_CONFIG_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "../../common/errors.hpp"
#include "../../common/save_load.hpp"
#include "../../common/shape.hpp"

namespace Stitch::Config::Details {
    inline constexpr std::array<std::string_view, 3> kOptimizerKinds{"adam", "adamw", "sgd"};
    inline constexpr std::array<std::string_view, 6> kSchedulerKinds{"none", "cosine", "step", "exponential", "plateau", "cosine_restart"};
    inline constexpr std::array<std::string_view, 4> kLossKinds{"dice", "focal", "cross_entropy", "dice_focal"};
    inline constexpr std::array<std::string_view, 2> kImportanceKinds{"constant", "gaussian"};
    inline constexpr std::array<std::string_view, 3> kFlipPresets{"identity", "single_axis", "exhaustive"};

    struct RunConfig {
        std::vector<std::int64_t> roi_size{96, 96, 96};
        double overlap{0.5};
        std::size_t sw_batch_size{4};
        std::string importance{"gaussian"};

        std::size_t max_epochs{100};
        std::size_t val_interval{1};
        std::optional<std::size_t> val_max_batches{};

        double learning_rate{1e-4};
        double weight_decay{1e-5};
        std::string optimizer_kind{"adamw"};
        std::string scheduler_kind{"cosine"};
        std::string loss_kind{"dice_focal"};
        std::optional<double> gradient_clip_max_norm{1.0};

        bool use_mixed_precision{false};
        bool use_tta{false};
        std::string tta_flips{"exhaustive"};

        std::int64_t num_classes{2};
        bool include_background{false};
        std::size_t early_stopping_patience{20};
        std::uint64_t seed{0};
        std::filesystem::path checkpoint_dir{"checkpoints"};
        std::string device{"auto"};

        // Raises ConfigurationError naming the first offending field.
        void validate() const;
    };

    namespace Detail {
        template <std::size_t N>
        void require_one_of(const std::string& field, const std::string& value, const std::array<std::string_view, N>& allowed)
        {
            if (std::find(allowed.begin(), allowed.end(), value) != allowed.end()) {
                return;
            }
            std::ostringstream message;
            message << "Unknown " << field << " '" << value << "'; expected one of:";
            for (const auto& option : allowed) {
                message << ' ' << option;
            }
            throw ConfigurationError(message.str());
        }
    }

    inline void RunConfig::validate() const
    {
        if (roi_size.size() != 2 && roi_size.size() != 3) {
            throw ConfigurationError("roi_size must have 2 or 3 entries, got " + Common::format_shape(roi_size) + '.');
        }
        if (std::any_of(roi_size.begin(), roi_size.end(), [](std::int64_t value) { return value <= 0; })) {
            throw ConfigurationError("roi_size " + Common::format_shape(roi_size) + " must be positive on every axis.");
        }
        if (!std::isfinite(overlap) || overlap < 0.0 || overlap >= 1.0) {
            throw ConfigurationError("overlap must lie in [0, 1).");
        }
        if (sw_batch_size == 0) {
            throw ConfigurationError("sw_batch_size must be at least 1.");
        }
        if (max_epochs == 0) {
            throw ConfigurationError("max_epochs must be at least 1.");
        }
        if (val_interval == 0) {
            throw ConfigurationError("val_interval must be at least 1.");
        }
        if (val_max_batches && *val_max_batches == 0) {
            throw ConfigurationError("val_max_batches must be at least 1 when set.");
        }
        if (!(learning_rate > 0.0) || !std::isfinite(learning_rate)) {
            throw ConfigurationError("learning_rate must be positive.");
        }
        if (weight_decay < 0.0 || !std::isfinite(weight_decay)) {
            throw ConfigurationError("weight_decay must be non-negative.");
        }
        if (gradient_clip_max_norm && !(*gradient_clip_max_norm > 0.0)) {
            throw ConfigurationError("gradient_clip_max_norm must be positive when set.");
        }
        if (num_classes < 2) {
            throw ConfigurationError("num_classes must be at least 2.");
        }
        Detail::require_one_of("optimizer_kind", optimizer_kind, kOptimizerKinds);
        Detail::require_one_of("scheduler_kind", scheduler_kind, kSchedulerKinds);
        Detail::require_one_of("loss_kind", loss_kind, kLossKinds);
        Detail::require_one_of("importance", importance, kImportanceKinds);
        Detail::require_one_of("tta_flips", tta_flips, kFlipPresets);
        if (checkpoint_dir.empty()) {
            throw ConfigurationError("checkpoint_dir must not be empty.");
        }
    }

    inline Common::SaveLoad::PropertyTree to_tree(const RunConfig& config)
    {
        using Common::SaveLoad::PropertyTree;
        PropertyTree tree;
        tree.add_child("roi_size", Common::SaveLoad::Detail::write_array(config.roi_size));
        tree.put("overlap", config.overlap);
        tree.put("sw_batch_size", config.sw_batch_size);
        tree.put("importance", config.importance);
        tree.put("max_epochs", config.max_epochs);
        tree.put("val_interval", config.val_interval);
        if (config.val_max_batches) {
            tree.put("val_max_batches", *config.val_max_batches);
        }
        tree.put("learning_rate", config.learning_rate);
        tree.put("weight_decay", config.weight_decay);
        tree.put("optimizer_kind", config.optimizer_kind);
        tree.put("scheduler_kind", config.scheduler_kind);
        tree.put("loss_kind", config.loss_kind);
        if (config.gradient_clip_max_norm) {
            tree.put("gradient_clip_max_norm", *config.gradient_clip_max_norm);
        }
        tree.put("use_mixed_precision", config.use_mixed_precision);
        tree.put("use_tta", config.use_tta);
        tree.put("tta_flips", config.tta_flips);
        tree.put("num_classes", config.num_classes);
        tree.put("include_background", config.include_background);
        tree.put("early_stopping_patience", config.early_stopping_patience);
        tree.put("seed", config.seed);
        tree.put("checkpoint_dir", config.checkpoint_dir.string());
        tree.put("device", config.device);
        return tree;
    }

    // Absent keys keep their defaults; `gradient_clip_max_norm: 0` disables clipping.
    inline RunConfig from_tree(const Common::SaveLoad::PropertyTree& tree)
    {
        using namespace Common::SaveLoad::Detail;
        const std::string context = "run configuration";
        RunConfig config{};

        if (auto roi = tree.get_child_optional("roi_size")) {
            config.roi_size = read_array<std::int64_t>(*roi, context);
        }
        auto number = [&](const std::string& key, auto& field) {
            using Field = std::decay_t<decltype(field)>;
            if (auto value = get_optional_numeric<Field>(tree, key, context)) {
                field = *value;
            }
        };
        auto text = [&](const std::string& key, std::string& field) {
            if (auto value = tree.get_optional<std::string>(key)) {
                field = to_lower(*value);
            }
        };
        auto flag = [&](const std::string& key, bool& field) {
            if (tree.get_child_optional(key)) {
                field = get_boolean(tree, key, context);
            }
        };

        number("overlap", config.overlap);
        number("sw_batch_size", config.sw_batch_size);
        text("importance", config.importance);
        number("max_epochs", config.max_epochs);
        number("val_interval", config.val_interval);
        config.val_max_batches = get_optional_numeric<std::size_t>(tree, "val_max_batches", context);
        number("learning_rate", config.learning_rate);
        number("weight_decay", config.weight_decay);
        text("optimizer_kind", config.optimizer_kind);
        text("scheduler_kind", config.scheduler_kind);
        text("loss_kind", config.loss_kind);
        if (auto clip = get_optional_numeric<double>(tree, "gradient_clip_max_norm", context)) {
            config.gradient_clip_max_norm = *clip > 0.0 ? std::optional<double>(*clip) : std::nullopt;
        }
        flag("use_mixed_precision", config.use_mixed_precision);
        flag("use_tta", config.use_tta);
        text("tta_flips", config.tta_flips);
        number("num_classes", config.num_classes);
        flag("include_background", config.include_background);
        number("early_stopping_patience", config.early_stopping_patience);
        number("seed", config.seed);
        if (auto directory = tree.get_optional<std::string>("checkpoint_dir")) {
            config.checkpoint_dir = *directory;
        }
        text("device", config.device);
        return config;
    }

    inline RunConfig read_json(const std::filesystem::path& path)
    {
        auto config = from_tree(Common::SaveLoad::read_json_file(path));
        config.validate();
        return config;
    }

    inline void write_json(const std::filesystem::path& path, const RunConfig& config)
    {
        Common::SaveLoad::write_json_file(path, to_tree(config));
    }
}

#endif // STITCH_CONFIG_RUN_CONFIG_HPP
