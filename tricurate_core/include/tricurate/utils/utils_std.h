#pragma once

#include <algorithm>
#include <array>
#include <map>
#include <numeric>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <gsl/narrow>

// Helpers that need nothing beyond the standard library and GSL
namespace tricurate::utils
{
    template <typename K, typename V>
    auto invert(const std::map<K, V>& map) -> std::map<V, K>
    {
        std::map<V, K> result { };

        for (const auto& [key, value] : map)
        {
            result.emplace(value, key);
        }

        return result;
    }

    /// Concatenate the streamed elements of a range with a delimiter between them
    template <typename Range>
    auto join(const Range& range, const std::string& delimiter) -> std::string
    {
        std::ostringstream stream { };

        auto first = true;
        for (const auto& element : range)
        {
            if (!first)
                stream << delimiter;

            stream << element;
            first = false;
        }

        return stream.str();
    }

    /**
     * Arithmetic mean.
     *
     * @return mean of the values, 0 for an empty vector
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    auto mean(const std::vector<T>& values) -> double
    {
        if (values.empty())
            return 0.0;

        return std::accumulate(values.begin(), values.end(), 0.0) / gsl::narrow<double>(values.size());
    }

    /// median of the values, 0 for an empty vector
    template <typename T>
        requires std::is_arithmetic_v<T>
    auto median(std::vector<T> values) -> double
    {
        if (values.empty())
            return 0.0;

        const auto half = values.size() / 2;

        std::nth_element(values.begin(), values.begin() + half, values.end());
        const auto upper = static_cast<double>(values[half]);

        if (values.size() % 2 == 1)
            return upper;

        const auto lower = static_cast<double>(*std::max_element(values.begin(), values.begin() + half));
        return (lower + upper) / 2.0;
    }

    /**
     * Indices that sort values ascending; equal values keep their original order
     */
    template <typename T>
    auto argsort(const std::vector<T>& values) -> std::vector<size_t>
    {
        std::vector<size_t> indices(values.size());
        std::iota(indices.begin(), indices.end(), 0);
        std::ranges::stable_sort(indices, [&values](const size_t a, const size_t b) { return values[a] < values[b]; });
        return indices;
    }

    template <size_t N>
    auto to_string(const std::array<std::string_view, N>& names, const std::string& delimiter = ", ") -> std::string
    {
        return join(names, delimiter);
    }

    /// values with three decimals
    auto to_string(const std::vector<double>& values, const std::string& delimiter = ", ") -> std::string;
} // namespace tricurate::utils
