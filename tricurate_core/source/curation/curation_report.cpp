#include "tricurate/curation/curation_report.h"

#include <gsl/narrow>

#include <spdlog/spdlog.h>

#include "tricurate/utils/utils_std.h"

namespace tricurate
{
    auto curation_report::count(const track_outcome outcome) const -> size_t
    {
        switch (outcome)
        {
            case track_outcome::ACCEPTED:
                return accepted;
            case track_outcome::UNDER_DETERMINED:
                return under_determined;
            case track_outcome::CHEIRALITY_FAILURE:
                return cheirality_failures;
            case track_outcome::REPROJECTION_REJECTION:
                return reprojection_rejections;
            case track_outcome::INSUFFICIENT_SUPPORT:
                return insufficient_support;
        }

        return 0;
    }

    auto curation_report::acceptance_rate() const -> double
    {
        return total_tracks == 0 ? 0.0 : gsl::narrow<double>(accepted) / gsl::narrow<double>(total_tracks);
    }

    void curation_report::record(const track_outcome outcome)
    {
        total_tracks++;

        switch (outcome)
        {
            case track_outcome::ACCEPTED:
                accepted++;
                break;
            case track_outcome::UNDER_DETERMINED:
                under_determined++;
                break;
            case track_outcome::CHEIRALITY_FAILURE:
                cheirality_failures++;
                break;
            case track_outcome::REPROJECTION_REJECTION:
                reprojection_rejections++;
                break;
            case track_outcome::INSUFFICIENT_SUPPORT:
                insufficient_support++;
                break;
        }
    }

    void curation_report::summarize_errors(const std::vector<double>& mean_errors)
    {
        mean_reprojection_error   = utils::mean(mean_errors);
        median_reprojection_error = utils::median(mean_errors);
    }

    auto curation_report::print() const -> void
    {
        SPDLOG_INFO("");
        SPDLOG_INFO("Curation Report:");
        SPDLOG_INFO("  Tracks:                  {:6}", total_tracks);
        SPDLOG_INFO("  Accepted:                {:6} ({:.1f}%)", accepted, acceptance_rate() * 100.0);
        SPDLOG_INFO("  Under-determined:        {:6}", under_determined);
        SPDLOG_INFO("  Cheirality failures:     {:6}", cheirality_failures);
        SPDLOG_INFO("  Reprojection rejections: {:6}", reprojection_rejections);
        SPDLOG_INFO("  Insufficient support:    {:6}", insufficient_support);
        SPDLOG_INFO("");
        SPDLOG_INFO("Accepted Track Lengths:");
        for (const auto& [length, n] : track_length_histogram)
        {
            SPDLOG_INFO("  {:3} measurements:        {:6}", length, n);
        }
        SPDLOG_INFO("");
        SPDLOG_INFO("Reprojection Error:");
        SPDLOG_INFO("  Mean:                    {:.3f} px", mean_reprojection_error);
        SPDLOG_INFO("  Median:                  {:.3f} px", median_reprojection_error);
        SPDLOG_INFO("  Elapsed:                 {:.4f} s", std::chrono::duration<double>(elapsed).count());
    }
}
