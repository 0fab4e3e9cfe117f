#pragma once

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/program_options/option.hpp>
#include <boost/program_options/variables_map.hpp>

#include <magic_enum/magic_enum.hpp>

#include "tricurate/option.h"

namespace tricurate
{
    /**
     * @brief Reads option<T> values from parsed command line flags
     *
     * A flag is the group prefix followed by the option name with dashes for underscores,
     * e.g. reprojection_threshold under "curation.triangulation." is --curation.triangulation.reprojection-threshold.
     * Enums travel as their enumerator names.
     */
    class option_parser_cli
    {
    public:
        using options_map = std::map<std::string, boost::program_options::basic_option<char>>;

        static auto construct_flag_name(const std::string& prefix, const std::string& option_name) -> std::string
        {
            auto flag = prefix + option_name;
            std::ranges::replace(flag, '_', '-');
            return flag;
        }

        /// the option, overridden only if its flag was given explicitly
        template <typename T>
        static auto parse_cli
        (
            const option<T>&                             option,
            const std::string&                           prefix,
            const options_map&                           map,
            const boost::program_options::variables_map& vm
        ) -> tricurate::option<T>
        {
            auto       result = option;
            const auto flag   = construct_flag_name(prefix, option.name());

            if (!map.contains(flag) || !vm.contains(flag))
                return result;

            if constexpr (std::is_enum_v<T>)
            {
                const auto& text = vm.at(flag).as<std::string>();

                const auto value = magic_enum::enum_cast<T>(text);
                if (!value)
                {
                    throw std::invalid_argument("--" + flag + ": '" + text + "' is not one of " + std::string(magic_enum::enum_type_name<T>()));
                }

                result = *value;
            }
            else
            {
                result = vm.at(flag).template as<T>();
            }

            return result;
        }
    };
} // namespace tricurate
