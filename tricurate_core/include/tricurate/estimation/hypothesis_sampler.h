#pragma once

#include <cstddef>
#include <random>
#include <utility>
#include <vector>

#include "tricurate/camera/camera_registry.h"
#include "tricurate/estimation/triangulation_options.h"
#include "tricurate/types/track2d.h"

namespace tricurate
{
    /** hypothesis_sampler: chooses which two-view minimal samples of a track are triangulated.
     *
     * A hypothesis is an unordered pair of measurement positions. Pairs are weighted according to the
     * triangulation mode and then drawn, either at random without replacement or deterministically by
     * descending weight.
     */
    class hypothesis_sampler
    {
    public:
        using measurement_pair = std::pair<size_t, size_t>;

        /** every unordered pair (i, j), i < j, of n measurements in lexicographic order */
        static auto generate_measurement_pairs(size_t n) -> std::vector<measurement_pair>;

        /**
         * Sampling weight of each pair.
         *
         * SAMPLE_UNIFORM weighs every pair 1; SAMPLE_BIASED_BY_BASELINE and TOPK_BASELINE weigh a pair by
         * the distance between its two camera centers.
         *
         * @throws std::invalid_argument for a mode that does not sample pairs
         */
        static auto compute_pair_weights
        (
            const camera_registry&               registry,
            const track2d&                       track,
            const std::vector<measurement_pair>& pairs,
            triangulation_mode                   mode
        ) -> std::vector<double>;

        /**
         * Choose up to num_hypotheses pair indices.
         *
         * Random modes draw without replacement with probability proportional to the remaining weights
         * and stop early once the remaining weight is exhausted. For a fixed rng state the draws for a
         * smaller budget are a prefix of the draws for a larger one. TOPK_BASELINE takes the largest
         * weights, lower index first on ties.
         *
         * @throws configuration_error if the weights do not sum to a positive value
         */
        static auto sample(const std::vector<double>& weights, size_t num_hypotheses, triangulation_mode mode, std::mt19937_64& rng) -> std::vector<size_t>;
    };
}
