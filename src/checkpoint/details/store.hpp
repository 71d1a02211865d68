#ifndef STITCH_CHECKPOINT_STORE_HPP
#define STITCH_CHECKPOINT_STORE_HPP
/*
 * Checkpoint store.
 * ---------------------------------------------------------------------------
 *  - One torch archive per variant: `latest.ckpt` (every epoch) and
 *    `best.ckpt` (metric improvement only). Each archive holds the model and
 *    optimizer sub-archives and a JSON metadata record (epoch, best metric,
 *    history, run configuration, scheduler and loss-scaler state).
 *  - Writes go to `<name>.tmp` and are renamed over the target, so a crash
 *    mid-write leaves the previous checkpoint readable.
 *  - `latest` never moves backwards: saving an older epoch over a newer one
 *    is rejected.
 */
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/save_load.hpp"
#include "../../telemetry/telemetry.hpp"

namespace Stitch::Checkpoint::Details {
    using PropertyTree = Common::SaveLoad::PropertyTree;

    enum class Variant {
        Latest,
        Best
    };

    [[nodiscard]] constexpr std::string_view to_string(Variant variant) noexcept
    {
        return variant == Variant::Best ? "best" : "latest";
    }

    inline constexpr int kFormatVersion = 1;

    struct Metadata {
        std::size_t epoch{0};
        std::optional<double> best_metric{};
        std::optional<std::size_t> best_epoch{};
        std::vector<Telemetry::EpochRecord> history{};
        PropertyTree config{};
        std::optional<PropertyTree> scheduler{};
        std::optional<PropertyTree> scaler{};
    };

    inline PropertyTree to_tree(const Metadata& metadata, Variant variant)
    {
        PropertyTree tree;
        tree.put("format_version", kFormatVersion);
        tree.put("variant", std::string(to_string(variant)));
        tree.put("epoch", metadata.epoch);
        if (metadata.best_metric) {
            tree.put("best_metric", *metadata.best_metric);
        }
        if (metadata.best_epoch) {
            tree.put("best_epoch", *metadata.best_epoch);
        }
        tree.add_child("history", Telemetry::Details::history_to_tree(metadata.history));
        tree.add_child("config", metadata.config);
        if (metadata.scheduler) {
            tree.add_child("scheduler", *metadata.scheduler);
        }
        if (metadata.scaler) {
            tree.add_child("scaler", *metadata.scaler);
        }
        return tree;
    }

    inline Metadata metadata_from_tree(const PropertyTree& tree)
    {
        using namespace Common::SaveLoad::Detail;
        const std::string context = "checkpoint metadata";
        const auto version = get_numeric<int>(tree, "format_version", context);
        if (version != kFormatVersion) {
            throw Error(Stage::CheckpointRead, "Unsupported checkpoint format version " + std::to_string(version) + '.');
        }

        Metadata metadata{};
        metadata.epoch = get_numeric<std::size_t>(tree, "epoch", context);
        metadata.best_metric = get_optional_numeric<double>(tree, "best_metric", context);
        metadata.best_epoch = get_optional_numeric<std::size_t>(tree, "best_epoch", context);
        if (auto history = tree.get_child_optional("history")) {
            metadata.history = Telemetry::Details::history_from_tree(*history);
        }
        if (auto config = tree.get_child_optional("config")) {
            metadata.config = *config;
        }
        if (auto scheduler = tree.get_child_optional("scheduler")) {
            metadata.scheduler = *scheduler;
        }
        if (auto scaler = tree.get_child_optional("scaler")) {
            metadata.scaler = *scaler;
        }
        return metadata;
    }

    struct StoreOptions {
        std::string extension{".ckpt"};
        std::ostream* stream{nullptr};
    };

    class Store {
    public:
        explicit Store(std::filesystem::path directory, StoreOptions options = {})
            : directory_(std::move(directory)), options_(std::move(options))
        {
            if (directory_.empty()) {
                throw ConfigurationError("Checkpoint directory must not be empty.");
            }
        }

        [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

        [[nodiscard]] std::filesystem::path path(Variant variant) const
        {
            return directory_ / (std::string(to_string(variant)) + options_.extension);
        }

        [[nodiscard]] bool exists(Variant variant) const { return std::filesystem::exists(path(variant)); }

        [[nodiscard]] std::size_t writes(Variant variant) const noexcept
        {
            return variant == Variant::Best ? best_writes_ : latest_writes_;
        }

        void save(Variant variant,
                  torch::nn::Module& network,
                  torch::optim::Optimizer& optimizer,
                  const Metadata& metadata)
        {
            if (variant == Variant::Latest) {
                const auto previous = latest_epoch();
                if (previous && metadata.epoch < *previous) {
                    throw Error(Stage::CheckpointWrite,
                                "Refusing to overwrite latest checkpoint of epoch " + std::to_string(*previous)
                                    + " with older epoch " + std::to_string(metadata.epoch) + '.');
                }
            }

            const auto target = path(variant);
            auto temporary = target;
            temporary += ".tmp";

            try {
                std::filesystem::create_directories(directory_);

                torch::serialize::OutputArchive archive;
                torch::serialize::OutputArchive model_archive;
                network.save(model_archive);
                archive.write("model", model_archive);

                torch::serialize::OutputArchive optimizer_archive;
                optimizer.save(optimizer_archive);
                archive.write("optimizer", optimizer_archive);

                archive.write("metadata", c10::IValue(Common::SaveLoad::to_json_string(to_tree(metadata, variant))));
                archive.save_to(temporary.string());
                std::filesystem::rename(temporary, target);
            } catch (const c10::Error& error) {
                discard(temporary);
                throw Error(Stage::CheckpointWrite,
                            "Failed to write '" + target.string() + "': " + error.what_without_backtrace());
            } catch (const std::filesystem::filesystem_error& error) {
                discard(temporary);
                throw Error(Stage::CheckpointWrite, "Failed to write '" + target.string() + "': " + error.what());
            }

            if (variant == Variant::Latest) {
                latest_epoch_ = metadata.epoch;
                ++latest_writes_;
            } else {
                ++best_writes_;
            }
            if (options_.stream) {
                *options_.stream << "[Stitch] saved " << to_string(variant) << " checkpoint (epoch " << metadata.epoch
                                 << ") to " << target.string() << std::endl;
            }
        }

        // Restores parameters (and optimizer state when given). std::nullopt when
        // the variant has never been written.
        std::optional<Metadata> load(Variant variant, torch::nn::Module& network, torch::optim::Optimizer* optimizer = nullptr)
        {
            const auto source = path(variant);
            if (!std::filesystem::exists(source)) {
                return std::nullopt;
            }

            Metadata metadata{};
            try {
                torch::serialize::InputArchive archive;
                archive.load_from(source.string(), module_device(network));

                c10::IValue text;
                archive.read("metadata", text);
                metadata = metadata_from_tree(Common::SaveLoad::from_json_string(text.toStringRef(), Stage::CheckpointRead));

                torch::serialize::InputArchive model_archive;
                archive.read("model", model_archive);
                network.load(model_archive);

                if (optimizer) {
                    torch::serialize::InputArchive optimizer_archive;
                    archive.read("optimizer", optimizer_archive);
                    optimizer->load(optimizer_archive);
                }
            } catch (const c10::Error& error) {
                throw Error(Stage::CheckpointRead,
                            "Failed to read '" + source.string() + "': " + error.what_without_backtrace());
            }

            if (variant == Variant::Latest) {
                latest_epoch_ = metadata.epoch;
            }
            return metadata;
        }

        // Metadata only; parameters are left untouched.
        [[nodiscard]] std::optional<Metadata> peek(Variant variant) const
        {
            const auto source = path(variant);
            if (!std::filesystem::exists(source)) {
                return std::nullopt;
            }
            try {
                torch::serialize::InputArchive archive;
                archive.load_from(source.string());
                c10::IValue text;
                archive.read("metadata", text);
                return metadata_from_tree(Common::SaveLoad::from_json_string(text.toStringRef(), Stage::CheckpointRead));
            } catch (const c10::Error& error) {
                throw Error(Stage::CheckpointRead,
                            "Failed to read '" + source.string() + "': " + error.what_without_backtrace());
            }
        }

    private:
        std::optional<std::size_t> latest_epoch()
        {
            if (!latest_epoch_ && exists(Variant::Latest)) {
                latest_epoch_ = peek(Variant::Latest)->epoch;
            }
            return latest_epoch_;
        }

        static torch::Device module_device(const torch::nn::Module& network)
        {
            for (const auto& parameter : network.parameters()) {
                return parameter.device();
            }
            return torch::Device(torch::kCPU);
        }

        static void discard(const std::filesystem::path& temporary) noexcept
        {
            std::error_code ignored;
            std::filesystem::remove(temporary, ignored);
        }

        std::filesystem::path directory_;
        StoreOptions options_;
        std::optional<std::size_t> latest_epoch_{};
        std::size_t latest_writes_{0};
        std::size_t best_writes_{0};
    };
}

#endif // STITCH_CHECKPOINT_STORE_HPP
