#include "tricurate/geometry/reprojection.h"

#include <cmath>
#include <limits>

#include "tricurate/utils/utils_std.h"

auto tricurate::geometry::reprojection_error(const camera_registry& registry, const cv::Point3d& point, const measurement& m) -> double
{
    const auto* cam = registry.find(m.camera_index);

    if (cam == nullptr)
        return std::numeric_limits<double>::infinity();

    const auto& [projected, success] = cam->project(point);

    if (!success)
        return std::numeric_limits<double>::infinity();

    const auto d = projected - m.pixel;
    return std::sqrt(d.dot(d));
}

auto tricurate::geometry::compute_point_reprojection_errors(const camera_registry& registry, const cv::Point3d& point, const track2d& track) -> std::pair<std::vector<double>, double>
{
    std::vector<double> errors { };
    errors.reserve(track.size());

    for (const auto& m : track)
    {
        errors.push_back(reprojection_error(registry, point, m));
    }

    const auto mean = utils::mean(errors);
    return { std::move(errors), mean };
}

auto tricurate::geometry::compute_landmark_reprojection_errors(const camera_registry& registry, const landmark& lm) -> std::pair<std::vector<double>, double>
{
    return compute_point_reprojection_errors(registry, lm.point(), lm.support());
}
