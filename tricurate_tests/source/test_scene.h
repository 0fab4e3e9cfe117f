#pragma once

#include <cmath>
#include <cstddef>

#include <opencv2/core.hpp>

#include <tricurate/camera/camera.h>
#include <tricurate/camera/camera_registry.h>
#include <tricurate/synthetic/scene_generator.h>
#include <tricurate/types/track2d.h>

// Small fixed geometry shared by the triangulation tests
namespace tricurate::test
{
    inline const auto focal_length    = cv::Vec2d(800.0, 800.0);
    inline const auto principal_point = cv::Vec2d(640.0, 480.0);

    inline auto make_camera(const cv::Point3d& center, const cv::Point3d& target = { 0.0, 0.0, 0.0 }) -> camera
    {
        return { focal_length, principal_point, synthetic::look_at(center, target) };
    }

    /// n cameras evenly spaced on a ring around the origin, all looking at it
    inline auto ring_registry(const size_t n, const double radius = 10.0, const double height = 1.0) -> camera_registry
    {
        camera_registry registry { };

        for (size_t i = 0; i < n; ++i)
        {
            const auto theta = 2.0 * CV_PI * static_cast<double>(i) / static_cast<double>(n);
            registry.insert(i, make_camera({ radius * std::cos(theta), radius * std::sin(theta), height }));
        }

        return registry;
    }

    /// pinhole projection that ignores the sign of the depth, for building points behind a camera
    inline auto project_ignoring_depth(const camera& cam, const cv::Point3d& point) -> cv::Point2d
    {
        const auto p = cam.extrinsics() * cv::Vec4d(point.x, point.y, point.z, 1.0);

        return
        {
            cam.focal_length[0] * p[0] / p[2] + cam.principal_point[0],
            cam.focal_length[1] * p[1] / p[2] + cam.principal_point[1]
        };
    }

    inline const auto scene_point = cv::Point3d(0.3, -0.2, 0.5);
}
