#include "tricurate/camera/camera.h"

#include <vector>

#include <opencv2/calib3d.hpp>

namespace
{
    // OpenCV stops refining an undistorted point once its reprojection moves less than this, in pixels
    const auto undistort_criteria = cv::TermCriteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS, 50, 1e-12);
}

tricurate::camera::camera(const cv::Vec2d& focal_length, const cv::Vec2d& principal_point, const cv::Affine3d& pose_in_world, const cv::Vec2d& radial_distortion) :
    focal_length(focal_length),
    principal_point(principal_point),
    radial_distortion(radial_distortion),
    pose_in_world(pose_in_world)
{
}

auto tricurate::camera::center() const -> cv::Point3d
{
    const auto& t = pose_in_world.translation();
    return { t[0], t[1], t[2] };
}

auto tricurate::camera::camera_matrix() const -> cv::Matx33d
{
    return { focal_length[0], 0.0, principal_point[0], 0.0, focal_length[1], principal_point[1], 0.0, 0.0, 1.0 };
}

auto tricurate::camera::distortion() const -> cv::Vec4d
{
    return { radial_distortion[0], radial_distortion[1], 0.0, 0.0 };
}

auto tricurate::camera::extrinsics() const -> cv::Matx34d
{
    return pose_in_world.inv().matrix.get_minor<3, 4>(0, 0);
}

auto tricurate::camera::project(const cv::Point3d& point_world) const -> std::pair<cv::Point2d, bool>
{
    if (depth(point_world) <= 0.0)
    {
        return { cv::Point2d { }, false };
    }

    const auto world_to_camera = pose_in_world.inv();

    std::vector<cv::Point2d> pixels { };
    cv::projectPoints(std::vector { point_world }, world_to_camera.rvec(), world_to_camera.translation(), camera_matrix(), distortion(), pixels);

    return { pixels.front(), true };
}

auto tricurate::camera::calibrate(const cv::Point2d& pixel) const -> cv::Point2d
{
    std::vector<cv::Point2d> normalized { };
    cv::undistortPoints(std::vector { pixel }, normalized, camera_matrix(), distortion(), cv::noArray(), cv::noArray(), undistort_criteria);

    return normalized.front();
}

auto tricurate::camera::depth(const cv::Point3d& point_world) const -> double
{
    return (pose_in_world.inv() * cv::Vec3d(point_world.x, point_world.y, point_world.z))[2];
}
