#pragma once

#include <cstdint>

#include "tricurate/option.h"
#include "tricurate/options_base.h"

namespace tricurate
{
    /// Synthetic scene: cameras on a ring looking at a cube of points, with pixel noise and outliers
    class scene_options : public options_base<scene_options, "scene options", "scene">
    {
    public:
        TRICURATE_DEFINE_OPTIONS
        (
            ((int, num_cameras, 8, "Number of cameras on the ring"))
            ((int, num_unregistered_cameras, 0, "Cameras that observe points but are missing from the registry"))
            ((int, num_points, 500, "Number of scene points"))
            ((double, ring_radius, 10.0, "Radius of the camera ring"))
            ((double, ring_height, 2.0, "Height of the camera ring above the points"))
            ((double, point_extent, 2.0, "Points are drawn from a cube of this half size around the origin"))
            ((double, focal_length, 800.0, "Focal length in pixels"))
            ((int, image_width, 1280, "Image width in pixels"))
            ((int, image_height, 960, "Image height in pixels"))
            ((double, k1, 0.0, "First radial distortion coefficient"))
            ((double, k2, 0.0, "Second radial distortion coefficient"))
            ((double, visibility, 0.8, "Probability that a camera observes a point"))
            ((double, noise_sigma, 0.5, "Standard deviation of pixel noise"))
            ((double, outlier_ratio, 0.1, "Fraction of measurements replaced by outliers"))
            ((double, outlier_offset, 40.0, "Pixel offset of an outlier measurement"))
            ((std::uint64_t, seed, 42, "Random seed of the scene"))
        )

        void validate() const;
    };
}
