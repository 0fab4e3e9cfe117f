#pragma once

#include <algorithm>
#include <concepts>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

#include <boost/program_options/option.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <magic_enum/magic_enum.hpp>

#include <spdlog/spdlog.h>

#include <yaml-cpp/yaml.h>

#include "tricurate/option_parser.h"
#include "tricurate/option_parser_cli.h"
#include "tricurate/option_printer.h"
#include "tricurate/utils/utils_std.h"

namespace tricurate
{
    /**
     * @brief Helper struct to hold compile-time string constants
     */
    template <size_t N>
    struct fixed_string
    {
        constexpr fixed_string(const char (&str)[N])
        {
            std::copy_n(str, N, value);
        }

        constexpr operator std::string_view() const
        {
            return std::string_view(value, N - 1);
        }

        char value[N];
    };

    /// A type that carries its own option list and YAML parser, i.e. another options_base
    template <typename T>
    concept options_group = requires(T group, const YAML::Node& node)
    {
        group.all_options();
        { T::parse_yaml(node) } -> std::same_as<T>;
    };

    /**
     * @brief CRTP base class providing parsing, printing and CLI description for option groups
     * @tparam Derived The derived options class (e.g., triangulation_options)
     * @tparam Name The name of this options group
     * @tparam Prefix The CLI prefix for these options (e.g., "triangulation"), dot is added automatically
     *
     * Derived classes must:
     * 1. Use TRICURATE_DEFINE_OPTIONS macro to define their options
     * 2. Implement validate() for custom validation logic
     *
     * Members that are themselves option groups are handled recursively: they are read from a nested
     * YAML map and exposed on the command line as prefix.member.option.
     */
    template <typename Derived, fixed_string Name, fixed_string Prefix>
    class options_base
    {
    public:
        using options_description = boost::program_options::options_description;
        using options_map         = std::map<std::string, boost::program_options::basic_option<char>>;

        static constexpr std::string_view name()
        {
            return Name;
        }

        static constexpr std::string_view prefix()
        {
            return Prefix;
        }

        /**
         * @brief Parse options from a YAML node
         * @param node The YAML node containing the options
         * @return A new instance of Derived; missing keys keep their defaults
         */
        static auto parse_yaml(const YAML::Node& node) -> Derived
        {
            Derived options;

            try
            {
                std::apply
                (
                    [&node](auto&... opts)
                    {
                        auto parse_opt = [&node](auto& opt)
                        {
                            using T = std::decay_t<decltype(opt.value())>;

                            if constexpr (options_group<T>)
                            {
                                if (const auto nested = node[opt.name()])
                                {
                                    opt = T::parse_yaml(nested);
                                }
                            }
                            else
                            {
                                opt = option_parser::parse_yaml(opt, node);
                            }
                        };

                        (parse_opt(opts), ...);
                    },
                    options.all_options()
                );
            }
            catch (const YAML::Exception& e)
            {
                SPDLOG_ERROR("Error parsing {} from YAML: {}", std::string(Derived::name()), e.what());
            }

            return options;
        }

        /**
         * @brief Apply command line overrides
         * @param options The options instance to update
         * @param map Map of CLI options that were given explicitly
         * @param vm Variables map from boost::program_options
         * @param prefix Flag prefix, defaults to this group's prefix
         */
        static void parse_cli
        (
            Derived&                                     options,
            const options_map&                           map,
            const boost::program_options::variables_map& vm,
            const std::string&                           prefix = std::string(Prefix)
        )
        {
            std::apply
            (
                [&map, &vm, &prefix](auto&... opts)
                {
                    auto parse_field = [&map, &vm, &prefix](auto& opt)
                    {
                        using T = std::decay_t<decltype(opt.value())>;

                        if constexpr (options_group<T>)
                        {
                            T::parse_cli(opt.value(), map, vm, prefix + "." + opt.name());
                        }
                        else
                        {
                            opt = option_parser_cli::parse_cli(opt, prefix + ".", map, vm);
                        }
                    };

                    (parse_field(opts), ...);
                },
                options.all_options()
            );
        }

        /**
         * @brief Print all options to the log
         */
        void print() const
        {
            const auto& derived = static_cast<const Derived&>(*this);

            std::apply
            (
                [](const auto&... opts)
                {
                    auto print_opt = [](const auto& opt)
                    {
                        using T = std::decay_t<decltype(opt.value())>;

                        if constexpr (options_group<T>)
                        {
                            SPDLOG_INFO("{}:", opt.name());
                            opt.value().print();
                        }
                        else
                        {
                            option_printer::print(opt);
                        }
                    };

                    (print_opt(opts), ...);
                },
                derived.all_options()
            );
        }

        /**
         * @brief Generate boost::program_options description for CLI
         * @param prefix Flag prefix, defaults to this group's prefix
         */
        static auto description(const std::string& prefix = std::string(Prefix)) -> options_description
        {
            const Derived       opts;
            options_description desc { std::string(Derived::name()) };

            auto add_option = [&desc, &prefix](const auto& opt)
            {
                using T = std::decay_t<decltype(opt.value())>;

                const auto flag_name = option_parser_cli::construct_flag_name(prefix + ".", opt.name());

                if constexpr (options_group<T>)
                {
                    desc.add(T::description(prefix + "." + opt.name()));
                }
                else if constexpr (std::is_enum_v<T>)
                {
                    const auto enum_desc = opt.description() + " - pick one of: " + utils::to_string(magic_enum::enum_names<T>());

                    desc.add_options()
                    (
                        flag_name.c_str(),
                        boost::program_options::value<std::string>()->default_value(std::string(magic_enum::enum_name(opt.value()))),
                        enum_desc.c_str()
                    );
                }
                else
                {
                    desc.add_options()
                    (
                        flag_name.c_str(),
                        boost::program_options::value<T>()->default_value(opt.value()),
                        opt.description().c_str()
                    );
                }
            };

            std::apply
            (
                [&add_option](const auto&... options)
                {
                    (add_option(options), ...);
                },
                opts.all_options()
            );

            return desc;
        }
    };
} // namespace tricurate
