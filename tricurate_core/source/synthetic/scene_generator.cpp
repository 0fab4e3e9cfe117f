#include "tricurate/synthetic/scene_generator.h"

#include <cmath>
#include <random>

#include <opencv2/core.hpp>

#include <spdlog/spdlog.h>

auto tricurate::synthetic::look_at(const cv::Point3d& center, const cv::Point3d& target) -> cv::Affine3d
{
    const auto forward = cv::normalize(cv::Vec3d(target - center));
    const auto up      = cv::Vec3d(0.0, 0.0, 1.0);
    const auto right   = cv::normalize(forward.cross(up));
    const auto down    = forward.cross(right);

    // columns are the camera axes in world coordinates
    const cv::Matx33d R
    {
        right[0], down[0], forward[0],
        right[1], down[1], forward[1],
        right[2], down[2], forward[2]
    };

    return cv::Affine3d(R, cv::Vec3d(center.x, center.y, center.z));
}

auto tricurate::synthetic::observe(const camera_registry& cameras, const cv::Point3d& point) -> track2d
{
    track2d track { };

    for (const auto& [index, cam] : cameras)
    {
        if (const auto& [pixel, success] = cam.project(point); success)
        {
            track.add({ index, pixel });
        }
    }

    return track;
}

auto tricurate::synthetic::generate_scene(const scene_options& options) -> scene
{
    std::mt19937_64 rng { options.seed.value() };

    std::uniform_real_distribution<double> cube(-options.point_extent.value(), options.point_extent.value());
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> angle(0.0, 2.0 * CV_PI);
    std::normal_distribution<double>       noise(0.0, options.noise_sigma.value());

    scene result { };

    const auto num_cameras     = options.num_cameras.value();
    const auto num_registered  = num_cameras - options.num_unregistered_cameras.value();
    const auto principal_point = cv::Vec2d(options.image_width.value() / 2.0, options.image_height.value() / 2.0);

    std::vector<camera> all_cameras { };

    for (auto i = 0; i < num_cameras; ++i)
    {
        const auto theta  = 2.0 * CV_PI * i / num_cameras;
        const auto center = cv::Point3d(options.ring_radius.value() * std::cos(theta), options.ring_radius.value() * std::sin(theta), options.ring_height.value());

        all_cameras.emplace_back
        (
            cv::Vec2d(options.focal_length.value(), options.focal_length.value()),
            principal_point,
            look_at(center, { 0.0, 0.0, 0.0 }),
            cv::Vec2d(options.k1.value(), options.k2.value())
        );

        if (i < num_registered)
        {
            result.cameras.insert(static_cast<size_t>(i), all_cameras.back());
        }
    }

    const auto in_image = [&options](const cv::Point2d& pixel)
    {
        return pixel.x >= 0.0 && pixel.y >= 0.0 && pixel.x < options.image_width.value() && pixel.y < options.image_height.value();
    };

    for (auto j = 0; j < options.num_points.value(); ++j)
    {
        const auto point = cv::Point3d(cube(rng), cube(rng), cube(rng));

        track2d           track { };
        std::vector<bool> outliers { };

        for (size_t i = 0; i < all_cameras.size(); ++i)
        {
            if (unit(rng) >= options.visibility.value())
                continue;

            const auto& [projected, success] = all_cameras[i].project(point);

            if (!success || !in_image(projected))
                continue;

            auto       pixel   = projected + cv::Point2d(noise(rng), noise(rng));
            const auto outlier = unit(rng) < options.outlier_ratio.value();

            if (outlier)
            {
                const auto phi = angle(rng);
                pixel += options.outlier_offset.value() * cv::Point2d(std::cos(phi), std::sin(phi));
            }

            track.add({ i, pixel });
            outliers.push_back(outlier);
        }

        result.points.push_back(point);
        result.tracks.push_back(std::move(track));
        result.outliers.push_back(std::move(outliers));
    }

    SPDLOG_INFO("Generated {} cameras ({} registered) and {} tracks", num_cameras, num_registered, result.tracks.size());

    return result;
}
