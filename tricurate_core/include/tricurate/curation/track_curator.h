#pragma once

#include <cstdint>
#include <vector>

#include "tricurate/camera/camera_registry.h"
#include "tricurate/curation/curation_options.h"
#include "tricurate/curation/curation_report.h"
#include "tricurate/estimation/point_triangulator.h"
#include "tricurate/types/landmark.h"
#include "tricurate/types/track2d.h"

namespace tricurate
{
    /// Hand-off to refinement: the registry snapshot and the landmarks in input track order
    struct curation_result
    {
        camera_registry       cameras       = { };
        std::vector<landmark> landmarks     = { };
        std::vector<size_t>   track_indices = { }; // input track of each landmark
        curation_report       report        = { };
    };

    /** track_curator: triangulates every track and applies the global minimum-support policy.
     *
     * Tracks are independent. The list is split across worker threads and each track draws its
     * hypotheses from a generator seeded by the base seed and its own index, so the result does not
     * depend on the number of threads.
     */
    class track_curator
    {
    public:
        track_curator(const camera_registry& registry, curation_options options);

        /**
         * Run one curation pass.
         *
         * @param tracks 2D tracks from track assembly
         * @return accepted landmarks with outcome statistics
         * @throws configuration_error from any track, which stops the pass
         */
        [[nodiscard]] auto run(const std::vector<track2d>& tracks) const -> curation_result;

        /**
         * Curate a single track, the unit of work of run().
         */
        [[nodiscard]] auto curate(const track2d& track, size_t track_index) const -> triangulation_result;

        /** splitmix64 mix of the base seed and a track index */
        static auto seed_for_track(std::uint64_t seed, size_t track_index) -> std::uint64_t;

    private:
        const camera_registry&    _registry;
        curation_options          _options      = { };
        robust_point_triangulator _triangulator;

        [[nodiscard]] auto worker_count(size_t num_tracks) const -> size_t;
    };
}
