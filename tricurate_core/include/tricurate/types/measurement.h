#pragma once

#include <cstddef>

#include <opencv2/core/types.hpp>

namespace tricurate
{
    /// One 2D observation: the pixel at which camera_index saw the point
    struct measurement
    {
        size_t      camera_index = { };
        cv::Point2d pixel        = { };

        auto operator==(const measurement& other) const -> bool = default;
    };
}
