#pragma once

#include <map>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "tricurate/utils/utils_std.h"

namespace tricurate::utils
{
    inline constexpr std::string_view version = "0.1.0";

    inline std::map<std::string, spdlog::level::level_enum> log_levels_from_string = {
        { "trace", spdlog::level::trace },
        { "debug", spdlog::level::debug },
        { "info", spdlog::level::info },
        { "warn", spdlog::level::warn },
        { "error", spdlog::level::err },
        { "critical", spdlog::level::critical },
        { "off", spdlog::level::off }
    };

    inline auto log_levels_to_string = invert(log_levels_from_string);
} // namespace tricurate::utils
