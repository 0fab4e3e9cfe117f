#include "tricurate/synthetic/scene_options.h"

#include <stdexcept>

namespace tricurate
{
    void scene_options::validate() const
    {
        if (num_cameras.value() < 2)
        {
            throw std::invalid_argument("scene.num_cameras must be at least 2");
        }

        if (num_unregistered_cameras.value() < 0 || num_unregistered_cameras.value() > num_cameras.value())
        {
            throw std::invalid_argument("scene.num_unregistered_cameras must be between 0 and scene.num_cameras");
        }

        if (num_points.value() < 0)
        {
            throw std::invalid_argument("scene.num_points must be non-negative");
        }

        if (ring_radius.value() <= point_extent.value() * 2.0)
        {
            throw std::invalid_argument("scene.ring_radius must keep the cameras well outside the point cube");
        }

        if (focal_length.value() <= 0.0 || image_width.value() <= 0 || image_height.value() <= 0)
        {
            throw std::invalid_argument("scene intrinsics must be positive");
        }

        if (visibility.value() < 0.0 || visibility.value() > 1.0 || outlier_ratio.value() < 0.0 || outlier_ratio.value() > 1.0)
        {
            throw std::invalid_argument("scene.visibility and scene.outlier_ratio must lie in [0, 1]");
        }

        if (noise_sigma.value() < 0.0)
        {
            throw std::invalid_argument("scene.noise_sigma must be non-negative");
        }
    }
}
