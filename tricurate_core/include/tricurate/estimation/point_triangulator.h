#pragma once

#include <optional>
#include <random>
#include <vector>

#include "tricurate/camera/camera_registry.h"
#include "tricurate/estimation/hypothesis_sampler.h"
#include "tricurate/estimation/triangulation_options.h"
#include "tricurate/types/landmark.h"
#include "tricurate/types/track2d.h"

namespace tricurate
{
    /// Why a track did or did not become a landmark
    enum class track_outcome
    {
        ACCEPTED,
        UNDER_DETERMINED,
        CHEIRALITY_FAILURE,
        REPROJECTION_REJECTION,
        INSUFFICIENT_SUPPORT
    };

    /// Result of robustly triangulating one track
    struct triangulation_result
    {
        std::optional<landmark> track              = { };
        std::optional<double>   mean_error         = { };
        bool                    cheirality_failure = { false };
        track_outcome           outcome            = { track_outcome::UNDER_DETERMINED };

        [[nodiscard]] auto accepted() const -> bool { return outcome == track_outcome::ACCEPTED; }

        static auto rejected(track_outcome outcome) -> triangulation_result;
    };

    /** robust_point_triangulator: turns one 2D track into a landmark while rejecting outlier measurements.
     *
     * The triangulator is stateless apart from its configuration; every call to triangulate() depends only
     * on the track, the camera registry and the random generator passed in, so one instance can serve
     * several threads.
     */
    class robust_point_triangulator
    {
    public:
        robust_point_triangulator(const camera_registry& registry, triangulation_options options);

        [[nodiscard]] auto options() const -> const triangulation_options& { return _options; }

        /**
         * Triangulate a track according to the configured mode.
         *
         * Measurements from cameras missing in the registry are dropped first.
         *
         * @param track measurements of one physical point
         * @param rng random source for the sampling modes
         * @throws configuration_error if the hypothesis weights do not sum to a positive value
         */
        [[nodiscard]] auto triangulate(const track2d& track, std::mt19937_64& rng) const -> triangulation_result;

        /**
         * Score the given two-view hypotheses against all measurements of a track.
         *
         * A measurement is an inlier of a hypothesis if its reprojection error is below the threshold. The
         * hypothesis with most inliers wins, the lower mean inlier error breaks ties; hypotheses that do not
         * triangulate are skipped.
         *
         * @param track measurements to score
         * @param pairs candidate measurement pairs
         * @param samples indices into pairs, evaluated in order
         * @return inlier mask of the winning hypothesis, all false if none has an inlier
         */
        [[nodiscard]] auto select_inliers
        (
            const track2d&                                           track,
            const std::vector<hypothesis_sampler::measurement_pair>& pairs,
            const std::vector<size_t>&                               samples
        ) const -> std::vector<bool>;

    private:
        const camera_registry& _registry;
        triangulation_options  _options = { };

        [[nodiscard]] auto registered_measurements(const track2d& track) const -> track2d;
        [[nodiscard]] auto execute_ransac_variant(const track2d& track, std::mt19937_64& rng) const -> std::vector<bool>;
        [[nodiscard]] auto accept(const track2d& inliers) const -> triangulation_result;
        [[nodiscard]] auto grow_from_best_triplet(const track2d& track) const -> triangulation_result;
        [[nodiscard]] auto accept_on_mean_error(const track2d& accepted) const -> triangulation_result;
    };
}
