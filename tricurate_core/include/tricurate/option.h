#pragma once

#include <string>
#include <tuple>
#include <utility>

#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/elem.hpp>

namespace tricurate
{
    /**
     * @brief One named, documented configuration value
     * @tparam T The type of the value; plain values or a nested options group
     *
     * Reads like a T: it converts implicitly and accepts assignment from T. The name is the YAML key
     * and, with dashes for underscores, the command line flag.
     */
    template <typename T>
    class option
    {
    public:
        option() = default;

        option(T value, std::string name = "", std::string description = "") :
            _value { std::move(value) },
            _name { std::move(name) },
            _description { std::move(description) }
        {
        }

        operator T&() { return _value; }
        operator const T&() const { return _value; }

        auto operator=(const T& value) -> option&
        {
            _value = value;
            return *this;
        }

        auto operator=(T&& value) -> option&
        {
            _value = std::move(value);
            return *this;
        }

        // nested groups: curation.triangulation->mode
        auto operator->() -> T* { return &_value; }
        auto operator->() const -> const T* { return &_value; }

        auto value() -> T& { return _value; }
        auto value() const -> const T& { return _value; }

        [[nodiscard]] auto name() const -> const std::string& { return _name; }
        [[nodiscard]] auto description() const -> const std::string& { return _description; }

    private:
        T           _value       = { };
        std::string _name        = { };
        std::string _description = { };
    };
} // namespace tricurate

// Each entry is ((type, name, default, "description")). TRICURATE_DEFINE_OPTIONS declares one
// option<type> member per entry and all_options(), a std::tie over the members in declaration order.

#define TRICURATE_OPTION_MEMBER(r, data, entry)                                    \
    tricurate::option<BOOST_PP_TUPLE_ELEM(0, entry)> BOOST_PP_TUPLE_ELEM(1, entry) = \
    {                                                                              \
        BOOST_PP_TUPLE_ELEM(2, entry),                                             \
        BOOST_PP_STRINGIZE(BOOST_PP_TUPLE_ELEM(1, entry)),                         \
        BOOST_PP_TUPLE_ELEM(3, entry)                                              \
    };

#define TRICURATE_OPTION_REFERENCE(s, data, entry) BOOST_PP_TUPLE_ELEM(1, entry)

#define TRICURATE_OPTION_LIST(seq) BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(TRICURATE_OPTION_REFERENCE, _, seq))

#define TRICURATE_DEFINE_OPTIONS(seq)                                     \
    BOOST_PP_SEQ_FOR_EACH(TRICURATE_OPTION_MEMBER, _, seq)                \
                                                                          \
    auto all_options() -> decltype(auto)                                  \
    {                                                                     \
        return std::tie(TRICURATE_OPTION_LIST(seq));                      \
    }                                                                     \
                                                                          \
    auto all_options() const -> decltype(auto)                            \
    {                                                                     \
        return std::tie(TRICURATE_OPTION_LIST(seq));                      \
    }
