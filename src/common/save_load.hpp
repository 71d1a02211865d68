#ifndef STITCH_COMMON_SAVE_LOAD_HPP
#define STITCH_COMMON_SAVE_LOAD_HPP
// JSON persistence through Boost.PropertyTree. Run configs, epoch history and
// scheduler/scaler state all go through these helpers; every failure surfaces as
// a Stitch::Error tagged with the stage that asked for the document.
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "errors.hpp"

namespace Stitch::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        // Absent key -> nullopt; present but unconvertible -> ConfigurationError.
        // The stream translator wraps "-1" into an unsigned type, so a sign is
        // rejected before conversion.
        template <class T>
        std::optional<T> lookup(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return std::nullopt;
            }
            if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
                const auto& text = child->data();
                const auto first = text.find_first_not_of(" \t\r\n");
                if (first != std::string::npos && text[first] == '-') {
                    throw ConfigurationError("Field '" + key + "' in " + context + " must not be negative, got " + text + '.');
                }
            }
            auto value = child->get_value_optional<T>();
            if (!value) {
                throw ConfigurationError("Field '" + key + "' in " + context + " has the wrong type.");
            }
            return *value;
        }

        template <class T>
        T require(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            auto value = lookup<T>(tree, key, context);
            if (!value) {
                throw ConfigurationError("Field '" + key + "' is missing from " + context + '.');
            }
            return *value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>);
            return require<Numeric>(tree, key, context);
        }

        template <class Numeric>
        std::optional<Numeric> get_optional_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>);
            return lookup<Numeric>(tree, key, context);
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            return require<bool>(tree, key, context);
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            return require<std::string>(tree, key, context);
        }

        // JSON arrays are children with empty keys.
        template <class T>
        std::vector<T> read_array(const PropertyTree& array, const std::string& context)
        {
            std::vector<T> values;
            for (const auto& [key, element] : array) {
                auto value = element.template get_value_optional<T>();
                if (!key.empty() || !value) {
                    throw ConfigurationError("Expected an array of scalars in " + context + '.');
                }
                values.push_back(*value);
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put_value(value);
                array.push_back({"", element});
            }
            return array;
        }
    }

    inline std::string to_json_string(const PropertyTree& tree)
    {
        std::ostringstream stream;
        boost::property_tree::write_json(stream, tree, false);
        return stream.str();
    }

    inline PropertyTree from_json_string(const std::string& text, Stage stage)
    {
        std::istringstream stream(text);
        PropertyTree tree;
        try {
            boost::property_tree::read_json(stream, tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw Error(stage, std::string("Malformed JSON document: ") + error.what());
        }
        return tree;
    }

    // The document lands in "<path>.tmp" first and is renamed over path. The parent directory must exist.
    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree,
                                Stage stage = Stage::Configuration)
    {
        auto staging = path;
        staging += ".tmp";
        {
            std::ofstream stream(staging);
            if (stream) {
                boost::property_tree::write_json(stream, tree, true);
            }
            if (!stream.flush()) {
                throw Error(stage, "Could not write '" + staging.string() + "'.");
            }
        }
        std::error_code failure;
        std::filesystem::rename(staging, path, failure);
        if (failure) {
            throw Error(stage, "Could not move '" + staging.string() + "' into place: " + failure.message());
        }
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        if (!std::filesystem::is_regular_file(path)) {
            throw ConfigurationError("No configuration file at '" + path.string() + "'.");
        }
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw ConfigurationError("Could not parse '" + path.string() + "': " + error.what());
        }
        return tree;
    }
}
#endif // STITCH_COMMON_SAVE_LOAD_HPP
