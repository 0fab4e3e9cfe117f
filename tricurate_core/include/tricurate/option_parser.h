#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>

#include <magic_enum/magic_enum.hpp>

#include <yaml-cpp/yaml.h>

#include "tricurate/option.h"

namespace tricurate
{
    /// Reads option<T> values from a YAML map keyed by option name
    class option_parser
    {
    public:
        /**
         * @param option option holding the current value, which is kept if the key is absent
         * @param node YAML map of one options group
         * @return the option with the value from the node
         * @throws std::invalid_argument for an enum value that names no enumerator, e.g. mode: BEST
         */
        template <typename T>
        static auto parse_yaml(const option<T>& option, const YAML::Node& node) -> tricurate::option<T>
        {
            auto result = option;

            if (const auto n = node[option.name()])
            {
                result = convert<T>(option.name(), n);
            }

            return result;
        }

    private:
        template <typename T>
        static auto convert(const std::string& key, const YAML::Node& node) -> T
        {
            if constexpr (std::is_enum_v<T>)
            {
                const auto text = node.as<std::string>();

                if (const auto value = magic_enum::enum_cast<T>(text))
                    return *value;

                throw std::invalid_argument(key + ": '" + text + "' is not one of " + std::string(magic_enum::enum_type_name<T>()));
            }
            else
            {
                return node.as<T>();
            }
        }
    };
} // namespace tricurate
