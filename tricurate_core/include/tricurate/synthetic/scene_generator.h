#pragma once

#include <vector>

#include <opencv2/core/affine.hpp>
#include <opencv2/core/types.hpp>

#include "tricurate/camera/camera_registry.h"
#include "tricurate/synthetic/scene_options.h"
#include "tricurate/types/track2d.h"

namespace tricurate::synthetic
{
    /// Generated scene with ground truth
    struct scene
    {
        camera_registry                cameras  = { };
        std::vector<cv::Point3d>       points   = { };
        std::vector<track2d>           tracks   = { }; // tracks[i] observes points[i]
        std::vector<std::vector<bool>> outliers = { }; // outliers[i][k] marks a corrupted measurement
    };

    /**
     * Camera-to-world pose of a camera at center looking at target, with image y pointing down along -z.
     */
    auto look_at(const cv::Point3d& center, const cv::Point3d& target) -> cv::Affine3d;

    /**
     * Project a point into the given cameras without noise.
     *
     * @return one measurement per camera in which the point projects
     */
    auto observe(const camera_registry& cameras, const cv::Point3d& point) -> track2d;

    auto generate_scene(const scene_options& options) -> scene;
}
