#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <vector>

#include "tricurate/estimation/point_triangulator.h"

namespace tricurate
{
    /// Outcome statistics of one curation pass
    struct curation_report
    {
        size_t total_tracks            = { };
        size_t accepted                = { };
        size_t under_determined        = { };
        size_t cheirality_failures     = { };
        size_t reprojection_rejections = { };
        size_t insufficient_support    = { };

        std::map<size_t, size_t> track_length_histogram = { }; // accepted landmarks by number of measurements

        double mean_reprojection_error   = { };
        double median_reprojection_error = { };

        std::chrono::steady_clock::duration elapsed = { };

        [[nodiscard]] auto count(track_outcome outcome) const -> size_t;

        /** fraction of tracks that became landmarks, 0 for an empty pass */
        [[nodiscard]] auto acceptance_rate() const -> double;

        void record(track_outcome outcome);

        /**
         * Fill the error statistics from the mean reprojection error of every accepted landmark.
         */
        void summarize_errors(const std::vector<double>& mean_errors);

        auto print() const -> void;
    };
}
