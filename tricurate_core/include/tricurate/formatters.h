#pragma once

#include <filesystem>
#include <string>
#include <type_traits>

#include <magic_enum/magic_enum.hpp>

#include <opencv2/core/affine.hpp>
#include <opencv2/core/types.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

// Pretty formatter for cv::Point3d for spdlog/fmt
template <>
struct fmt::formatter<cv::Point3d> : formatter<std::string>
{
    template <typename FormatContext>
    auto format(const cv::Point3d& value, FormatContext& context) const
    {
        return formatter<std::string>::format(fmt::format("[ {:+.4f}, {:+.4f}, {:+.4f} ]", value.x, value.y, value.z), context);
    }
};

// Pretty formatter for cv::Point2d for spdlog/fmt
template <>
struct fmt::formatter<cv::Point2d> : formatter<std::string>
{
    template <typename FormatContext>
    auto format(const cv::Point2d& value, FormatContext& context) const
    {
        return formatter<std::string>::format(fmt::format("[ {:.2f}, {:.2f} ]", value.x, value.y), context);
    }
};

// Camera center only; orientation is rarely useful in track diagnostics
template <>
struct fmt::formatter<cv::Affine3d> : formatter<std::string>
{
    template <typename FormatContext>
    auto format(const cv::Affine3d& value, FormatContext& context) const
    {
        const auto& t = value.translation();

        return formatter<std::string>::format(fmt::format("{{ x: {{ {:+.4f}, {:+.4f}, {:+.4f} }} }}", t[0], t[1], t[2]), context);
    }
};

/**
 * SPDLOG formatter for std::filesystem::path
 */
template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string>
{
    template <typename FormatContext>
    auto format(const std::filesystem::path& value, FormatContext& context) const
    {
        return formatter<std::string>::format(value.string(), context);
    }
};

/** SPDLOG formatter for enums using magic_enum */
template <typename E> requires std::is_enum_v<E>
struct fmt::formatter<E> : formatter<std::string>
{
    template <typename FormatContext>
    auto format(const E& value, FormatContext& context) const
    {
        return formatter<std::string>::format(std::string(magic_enum::enum_name(value)), context);
    }
};
