#pragma once

#include <vector>

#include <opencv2/core/types.hpp>

#include "tricurate/camera/camera.h"
#include "tricurate/camera/camera_registry.h"
#include "tricurate/geometry/exceptions.h"
#include "tricurate/types/track2d.h"

namespace tricurate::geometry
{
    /// Tuning of the N-view triangulation primitive
    struct triangulation_parameters
    {
        double rank_tolerance        = { 1e-9 };
        bool   refine                = { true };
        int    max_refine_iterations = { 10 };
    };

    /**
     * Triangulate one point from two or more calibrated views.
     *
     * Solves the homogeneous DLT system on undistorted, normalized coordinates and optionally refines
     * the result with Ceres (Levenberg-Marquardt) on pixel reprojection error, cameras held fixed.
     *
     * @param cameras contributing cameras
     * @param pixels observed pixel in each camera, same length as cameras
     * @param parameters primitive tuning
     * @return point in world coordinates
     * @throws std::invalid_argument fewer than two views or mismatched lengths
     * @throws underconstrained_exception rank deficient system or point at infinity
     * @throws cheirality_exception point has non-positive depth in a contributing camera
     */
    auto triangulate(const std::vector<camera>& cameras, const std::vector<cv::Point2d>& pixels, const triangulation_parameters& parameters = { }) -> cv::Point3d;

    /**
     * Triangulate the measurements of a track.
     *
     * @throws std::out_of_range a camera index missing from the registry
     */
    auto triangulate(const camera_registry& registry, const track2d& track, const triangulation_parameters& parameters = { }) -> cv::Point3d;
}
