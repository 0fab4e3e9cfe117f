#include "tricurate/geometry/triangulation.h"

#include <array>
#include <cmath>
#include <stdexcept>

#include <ceres/ceres.h>

#include <gsl/util>

#include <opencv2/core.hpp>

#include <spdlog/spdlog.h>

namespace
{
    constexpr auto infinity_tolerance = 1e-12;

    // pixel residual of one view for a world point, with the camera's k1/k2 radial distortion
    struct reprojection_error
    {
        reprojection_error(const tricurate::camera& camera, const cv::Point2d& observed_pixel) :
            world_to_camera(camera.extrinsics()),
            observed_x(observed_pixel.x),
            observed_y(observed_pixel.y),
            fx(camera.focal_length[0]),
            fy(camera.focal_length[1]),
            cx(camera.principal_point[0]),
            cy(camera.principal_point[1]),
            k1(camera.radial_distortion[0]),
            k2(camera.radial_distortion[1])
        {
        }

        template <typename T>
        auto operator()(const T* const point_xyz, T* residuals) const -> bool
        {
            T point_camera[3] = { };

            for (auto r = 0; r < 3; ++r)
            {
                point_camera[r] = T(world_to_camera(r, 0)) * point_xyz[0] + T(world_to_camera(r, 1)) * point_xyz[1] + T(world_to_camera(r, 2)) * point_xyz[2] + T(world_to_camera(r, 3));
            }

            const T depth      = point_camera[2];
            const T safe_depth = depth > T(1e-9) ? depth : T(1e-9);

            const T x  = point_camera[0] / safe_depth;
            const T y  = point_camera[1] / safe_depth;
            const T r2 = x * x + y * y;
            const T d  = T(1.0) + T(k1) * r2 + T(k2) * r2 * r2;

            residuals[0] = T(fx) * d * x + T(cx) - T(observed_x);
            residuals[1] = T(fy) * d * y + T(cy) - T(observed_y);

            return true;
        }

        cv::Matx34d world_to_camera = { };

        double observed_x = 0.0;
        double observed_y = 0.0;
        double fx         = 0.0;
        double fy         = 0.0;
        double cx         = 0.0;
        double cy         = 0.0;
        double k1         = 0.0;
        double k2         = 0.0;
    };

    // Levenberg-Marquardt on the pixel residuals of every view, cameras held fixed
    auto refine(const std::vector<tricurate::camera>& cameras, const std::vector<cv::Point2d>& pixels, const cv::Point3d& initial, const int max_iterations) -> cv::Point3d
    {
        std::array<double, 3> xyz = { initial.x, initial.y, initial.z };

        ceres::Problem problem;

        for (size_t i = 0; i < cameras.size(); ++i)
        {
            auto* cost_function = new ceres::AutoDiffCostFunction<reprojection_error, 2, 3>(new reprojection_error(cameras[i], pixels[i]));

            problem.AddResidualBlock(cost_function, nullptr, xyz.data());
        }

        ceres::Solver::Options solver_options;
        solver_options.max_num_iterations           = max_iterations;
        solver_options.num_threads                  = 1;
        solver_options.linear_solver_type           = ceres::DENSE_QR;
        solver_options.trust_region_strategy_type   = ceres::LEVENBERG_MARQUARDT;
        solver_options.minimizer_progress_to_stdout = false;
        solver_options.logging_type                 = ceres::SILENT;

        ceres::Solver::Summary summary;
        ceres::Solve(solver_options, &problem, &summary);

        if (!summary.IsSolutionUsable() || summary.final_cost > summary.initial_cost)
        {
            SPDLOG_TRACE("triangulate: refinement discarded, {}", summary.BriefReport());
            return initial;
        }

        return { xyz[0], xyz[1], xyz[2] };
    }
}

auto tricurate::geometry::triangulate(const std::vector<camera>& cameras, const std::vector<cv::Point2d>& pixels, const triangulation_parameters& parameters) -> cv::Point3d
{
    if (cameras.size() != pixels.size())
    {
        throw std::invalid_argument("triangulate: cameras and pixels differ in length");
    }

    if (cameras.size() < 2)
    {
        throw std::invalid_argument("triangulate: at least two views are required");
    }

    // DLT: each view contributes x * P3 - P1 and y * P3 - P2
    cv::Mat A(gsl::narrow_cast<int>(2 * cameras.size()), 4, CV_64F);

    for (size_t i = 0; i < cameras.size(); ++i)
    {
        const auto& P = cameras[i].extrinsics();
        const auto& x = cameras[i].calibrate(pixels[i]);

        for (auto row = 0; row < 2; ++row)
        {
            const auto coordinate = row == 0 ? x.x : x.y;
            auto       a          = A.row(static_cast<int>(2 * i) + row);

            for (auto c = 0; c < 4; ++c)
            {
                a.at<double>(c) = coordinate * P(2, c) - P(row, c);
            }

            if (const auto n = cv::norm(a); n > 0.0)
            {
                a /= n;
            }
        }
    }

    cv::Mat w, u, vt;
    cv::SVD::compute(A, w, u, vt, cv::SVD::FULL_UV);

    if (w.at<double>(2) <= parameters.rank_tolerance)
    {
        throw underconstrained_exception("triangulate: rank deficient system");
    }

    const auto X = vt.row(3);
    const auto W = X.at<double>(3);

    if (std::abs(W) <= infinity_tolerance * cv::norm(X))
    {
        throw underconstrained_exception("triangulate: point at infinity");
    }

    auto point = cv::Point3d(X.at<double>(0) / W, X.at<double>(1) / W, X.at<double>(2) / W);

    const auto in_front = [&cameras](const cv::Point3d& p)
    {
        for (const auto& cam : cameras)
        {
            if (!(cam.depth(p) > 0.0))
                return false;
        }

        return true;
    };

    if (parameters.refine && parameters.max_refine_iterations > 0 && in_front(point))
    {
        // a refined point that leaves the front of any camera is not used
        if (const auto refined = refine(cameras, pixels, point, parameters.max_refine_iterations); in_front(refined))
        {
            point = refined;
        }
    }

    if (!in_front(point))
    {
        SPDLOG_TRACE("triangulate: cheirality failure at [{}, {}, {}]", point.x, point.y, point.z);
        throw cheirality_exception();
    }

    return point;
}

auto tricurate::geometry::triangulate(const camera_registry& registry, const track2d& track, const triangulation_parameters& parameters) -> cv::Point3d
{
    std::vector<camera>      cameras { };
    std::vector<cv::Point2d> pixels { };

    cameras.reserve(track.size());
    pixels.reserve(track.size());

    for (const auto& m : track)
    {
        cameras.push_back(registry.at(m.camera_index));
        pixels.push_back(m.pixel);
    }

    return triangulate(cameras, pixels, parameters);
}
