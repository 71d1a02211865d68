#ifndef STITCH_TELEMETRY_RECORD_HPP
#define STITCH_TELEMETRY_RECORD_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../../common/save_load.hpp"

namespace Stitch::Telemetry::Details {
    struct EpochRecord {
        std::size_t epoch_index{0};
        double train_loss{0.0};
        std::optional<double> val_metric{};
        std::optional<double> val_loss{};
        double learning_rate{0.0};
        bool improved{false};
        double duration_seconds{0.0};
    };

    inline Common::SaveLoad::PropertyTree to_tree(const EpochRecord& record)
    {
        Common::SaveLoad::PropertyTree tree;
        tree.put("epoch", record.epoch_index);
        tree.put("train_loss", record.train_loss);
        if (record.val_metric) {
            tree.put("val_metric", *record.val_metric);
        }
        if (record.val_loss) {
            tree.put("val_loss", *record.val_loss);
        }
        tree.put("learning_rate", record.learning_rate);
        tree.put("improved", record.improved);
        tree.put("duration_seconds", record.duration_seconds);
        return tree;
    }

    inline EpochRecord record_from_tree(const Common::SaveLoad::PropertyTree& tree)
    {
        using namespace Common::SaveLoad::Detail;
        const std::string context = "epoch record";
        EpochRecord record{};
        record.epoch_index = get_numeric<std::size_t>(tree, "epoch", context);
        record.train_loss = get_numeric<double>(tree, "train_loss", context);
        record.val_metric = get_optional_numeric<double>(tree, "val_metric", context);
        record.val_loss = get_optional_numeric<double>(tree, "val_loss", context);
        record.learning_rate = get_numeric<double>(tree, "learning_rate", context);
        record.improved = get_boolean(tree, "improved", context);
        record.duration_seconds = get_numeric<double>(tree, "duration_seconds", context);
        return record;
    }

    inline Common::SaveLoad::PropertyTree history_to_tree(const std::vector<EpochRecord>& history)
    {
        Common::SaveLoad::PropertyTree array;
        for (const auto& record : history) {
            array.push_back({"", to_tree(record)});
        }
        return array;
    }

    inline std::vector<EpochRecord> history_from_tree(const Common::SaveLoad::PropertyTree& array)
    {
        std::vector<EpochRecord> history;
        history.reserve(array.size());
        for (const auto& child : array) {
            history.push_back(record_from_tree(child.second));
        }
        return history;
    }
}

#endif // STITCH_TELEMETRY_RECORD_HPP
