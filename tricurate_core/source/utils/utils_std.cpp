#include "tricurate/utils/utils_std.h"

#include <format>

auto tricurate::utils::to_string(const std::vector<double>& values, const std::string& delimiter) -> std::string
{
    std::vector<std::string> formatted { };
    formatted.reserve(values.size());

    for (const auto value : values)
    {
        formatted.push_back(std::format("{:.3f}", value));
    }

    return join(formatted, delimiter);
}
