#include "tricurate/curation/track_curator.h"

#include <algorithm>
#include <exception>
#include <future>
#include <random>
#include <thread>
#include <utility>

#include <gsl/narrow>

#include <spdlog/spdlog.h>

#include "tricurate/formatters.h"
#include "tricurate/geometry/exceptions.h"
#include "tricurate/time_this.h"

tricurate::track_curator::track_curator(const camera_registry& registry, curation_options options) :
    _registry(registry),
    _options(std::move(options)),
    _triangulator(registry, _options.triangulation.value())
{
}

auto tricurate::track_curator::run(const std::vector<track2d>& tracks) const -> curation_result
{
    curation_result result { _registry, { }, { }, { } };

    {
        time_this timer { result.report.elapsed };

        std::vector<triangulation_result> results(tracks.size());

        const auto workers = worker_count(tracks.size());

        SPDLOG_INFO("Curating {} tracks with {} workers in {} mode", tracks.size(), workers, _options.triangulation->mode.value());

        {
            std::vector<std::future<void>> futures { };
            futures.reserve(workers);

            // worker w handles tracks w, w + workers, w + 2 * workers, ...
            for (size_t w = 0; w < workers; ++w)
            {
                futures.push_back
                (
                    std::async
                    (
                        std::launch::async,
                        [this, &tracks, &results, w, workers]()
                        {
                            for (auto i = w; i < tracks.size(); i += workers)
                            {
                                results[i] = curate(tracks[i], i);
                            }
                        }
                    )
                );
            }

            // collect every worker before rethrowing the first failure
            std::exception_ptr failure { };
            for (auto& future : futures)
            {
                try
                {
                    future.get();
                }
                catch (const configuration_error&)
                {
                    if (!failure)
                        failure = std::current_exception();
                }
            }

            if (failure)
            {
                std::rethrow_exception(failure);
            }
        }

        std::vector<double> mean_errors { };

        for (size_t i = 0; i < results.size(); ++i)
        {
            auto& track_result = results[i];

            result.report.record(track_result.outcome);

            if (track_result.accepted())
            {
                result.track_indices.push_back(i);
                result.report.track_length_histogram[track_result.track->size()]++;
                mean_errors.push_back(track_result.mean_error.value());
                result.landmarks.push_back(std::move(track_result.track.value()));
            }
        }

        result.report.summarize_errors(mean_errors);
    }

    return result;
}

auto tricurate::track_curator::curate(const track2d& track, const size_t track_index) const -> triangulation_result
{
    std::mt19937_64 rng { seed_for_track(_options.triangulation->seed.value(), track_index) };

    auto result = _triangulator.triangulate(track, rng);

    if (!result.accepted())
    {
        SPDLOG_TRACE("track {} rejected: {}", track_index, result.outcome);
        return result;
    }

    const auto required = gsl::narrow<size_t>(_options.min_track_length.value());

    if (result.track->size() < required)
    {
        SPDLOG_WARN("track {} dropped: {} supporting measurements, {} required", track_index, result.track->size(), required);
        return triangulation_result::rejected(track_outcome::INSUFFICIENT_SUPPORT);
    }

    return result;
}

auto tricurate::track_curator::seed_for_track(const std::uint64_t seed, const size_t track_index) -> std::uint64_t
{
    auto z = seed + (static_cast<std::uint64_t>(track_index) + 1) * 0x9E3779B97F4A7C15ULL;
    z      = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z      = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

auto tricurate::track_curator::worker_count(const size_t num_tracks) const -> size_t
{
    auto workers = gsl::narrow<size_t>(_options.num_threads.value());

    if (workers == 0)
    {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }

    return std::max<size_t>(1, std::min(workers, num_tracks));
}
