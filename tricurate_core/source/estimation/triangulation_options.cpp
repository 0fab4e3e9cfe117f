#include "tricurate/estimation/triangulation_options.h"

#include <stdexcept>

namespace tricurate
{
    auto triangulation_options::parameters() const -> geometry::triangulation_parameters
    {
        return { rank_tolerance, refine, max_refine_iterations };
    }

    void triangulation_options::validate() const
    {
        if (reprojection_threshold.value() <= 0.0)
        {
            throw std::invalid_argument("triangulation.reprojection_threshold must be positive");
        }

        if (num_hypotheses.value() < 1)
        {
            throw std::invalid_argument("triangulation.num_hypotheses must be at least 1");
        }

        if (rank_tolerance.value() < 0.0)
        {
            throw std::invalid_argument("triangulation.rank_tolerance must be non-negative");
        }

        if (max_refine_iterations.value() < 0)
        {
            throw std::invalid_argument("triangulation.max_refine_iterations must be non-negative");
        }
    }
}
