#pragma once

#include <utility>

#include <opencv2/core/affine.hpp>
#include <opencv2/core/types.hpp>

namespace tricurate
{
    /** camera: calibrated pinhole camera with two-term radial distortion at a known pose.
     */
    class camera
    {
    public:
        camera() = default;
        camera(const cv::Vec2d& focal_length, const cv::Vec2d& principal_point, const cv::Affine3d& pose_in_world, const cv::Vec2d& radial_distortion = { 0.0, 0.0 });

        cv::Vec2d    focal_length      = { 1.0, 1.0 };
        cv::Vec2d    principal_point   = { 0.0, 0.0 };
        cv::Vec2d    radial_distortion = { 0.0, 0.0 }; // k1, k2
        cv::Affine3d pose_in_world     = { cv::Affine3d::Identity() };

        /** camera-to-world transform */
        [[nodiscard]] auto pose() const -> const cv::Affine3d& { return pose_in_world; }

        /** optical center in world coordinates */
        [[nodiscard]] auto center() const -> cv::Point3d;

        /** intrinsic matrix K */
        [[nodiscard]] auto camera_matrix() const -> cv::Matx33d;

        /** OpenCV distortion vector (k1, k2, 0, 0) */
        [[nodiscard]] auto distortion() const -> cv::Vec4d;

        /** world-to-camera [R|t], the projection matrix for normalized image coordinates */
        [[nodiscard]] auto extrinsics() const -> cv::Matx34d;

        /**
         * Project a world point into the image.
         *
         * @param point_world point in world coordinates
         * @return pixel coordinate and a success flag; the flag is false if the point is not in front of the camera
         */
        [[nodiscard]] auto project(const cv::Point3d& point_world) const -> std::pair<cv::Point2d, bool>;

        /**
         * Remove intrinsics and distortion from a pixel.
         *
         * @param pixel distorted pixel coordinate
         * @return normalized coordinate (x/z, y/z) in the camera frame
         */
        [[nodiscard]] auto calibrate(const cv::Point2d& pixel) const -> cv::Point2d;

        /** depth of a world point along the optical axis */
        [[nodiscard]] auto depth(const cv::Point3d& point_world) const -> double;
    };
}
