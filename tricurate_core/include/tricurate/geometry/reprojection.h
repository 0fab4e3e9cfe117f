#pragma once

#include <utility>
#include <vector>

#include <opencv2/core/types.hpp>

#include "tricurate/camera/camera_registry.h"
#include "tricurate/types/landmark.h"
#include "tricurate/types/track2d.h"

namespace tricurate::geometry
{
    /**
     * Pixel distance between a measurement and the projection of a point through the measuring camera.
     *
     * @return +infinity if the point does not project into the camera or the camera is not registered
     */
    auto reprojection_error(const camera_registry& registry, const cv::Point3d& point, const measurement& m) -> double;

    /**
     * Per-measurement reprojection errors of a point against a track, and their mean.
     *
     * @return errors in track order and their mean; the mean is 0 for an empty track
     */
    auto compute_point_reprojection_errors(const camera_registry& registry, const cv::Point3d& point, const track2d& track) -> std::pair<std::vector<double>, double>;

    auto compute_landmark_reprojection_errors(const camera_registry& registry, const landmark& lm) -> std::pair<std::vector<double>, double>;
}
