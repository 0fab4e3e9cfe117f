#pragma once

#include <cstdint>

#include "tricurate/option.h"
#include "tricurate/options_base.h"
#include "tricurate/geometry/triangulation.h"

namespace tricurate
{
    /// Outlier-rejection strategy of the robust point triangulator
    enum class triangulation_mode
    {
        NO_ROBUST,
        SAMPLE_UNIFORM,
        SAMPLE_BIASED_BY_BASELINE,
        TOPK_BASELINE,
        TRIPLET_GROWTH
    };

    /// Per-track robust triangulation configuration
    class triangulation_options : public options_base<triangulation_options, "triangulation options", "triangulation">
    {
    public:
        TRICURATE_DEFINE_OPTIONS
        (
            ((triangulation_mode, mode, triangulation_mode::SAMPLE_BIASED_BY_BASELINE, "Outlier rejection strategy"))
            ((double, reprojection_threshold, 4.0, "Maximum reprojection error in pixels for a measurement to count as an inlier"))
            ((int, num_hypotheses, 20, "Maximum number of two-view hypotheses evaluated per track"))
            ((std::uint64_t, seed, 0, "Base seed for hypothesis sampling, combined with the track index"))
            ((double, rank_tolerance, 1e-9, "Singular values at or below this make the linear system rank deficient"))
            ((bool, refine, true, "Refine the linear solution by nonlinear least squares on reprojection error"))
            ((int, max_refine_iterations, 10, "Solver iteration limit for the refinement, 0 disables it"))
        )

        [[nodiscard]] auto parameters() const -> geometry::triangulation_parameters;

        void validate() const;
    };
}
