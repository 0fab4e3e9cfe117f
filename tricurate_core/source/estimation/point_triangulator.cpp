#include "tricurate/estimation/point_triangulator.h"

#include <algorithm>
#include <array>
#include <limits>
#include <optional>
#include <set>
#include <utility>

#include <gsl/narrow>

#include <spdlog/spdlog.h>

#include "tricurate/formatters.h"
#include "tricurate/geometry/exceptions.h"
#include "tricurate/geometry/reprojection.h"
#include "tricurate/geometry/triangulation.h"
#include "tricurate/utils/utils_std.h"

namespace
{
    struct estimate
    {
        cv::Point3d point      = { };
        double      mean_error = { };
    };

    // triangulation scored by mean reprojection error only; nullopt on any geometric failure
    auto triangulate_unbounded(const tricurate::camera_registry& registry, const tricurate::track2d& track, const tricurate::geometry::triangulation_parameters& parameters) -> std::optional<estimate>
    {
        try
        {
            const auto point = tricurate::geometry::triangulate(registry, track, parameters);
            return estimate { point, tricurate::geometry::compute_point_reprojection_errors(registry, point, track).second };
        }
        catch (const tricurate::triangulation_exception& e)
        {
            SPDLOG_TRACE("subset of {} measurements does not triangulate: {}", track.size(), e.what());
            return std::nullopt;
        }
    }

    auto distinct_cameras(const tricurate::track2d& track) -> size_t
    {
        const auto& indices = track.camera_indices();
        return std::set(indices.begin(), indices.end()).size();
    }
}

auto tricurate::triangulation_result::rejected(const track_outcome outcome) -> triangulation_result
{
    triangulation_result result { };
    result.outcome            = outcome;
    result.cheirality_failure = outcome == track_outcome::CHEIRALITY_FAILURE;
    return result;
}

tricurate::robust_point_triangulator::robust_point_triangulator(const camera_registry& registry, triangulation_options options) :
    _registry(registry),
    _options(std::move(options))
{
}

auto tricurate::robust_point_triangulator::triangulate(const track2d& track, std::mt19937_64& rng) const -> triangulation_result
{
    const auto& usable = registered_measurements(track);

    if (usable.size() < 2 || distinct_cameras(usable) < 2)
    {
        SPDLOG_DEBUG("track with {} usable measurements from {} cameras is under-determined", usable.size(), distinct_cameras(usable));
        return triangulation_result::rejected(track_outcome::UNDER_DETERMINED);
    }

    switch (_options.mode.value())
    {
        case triangulation_mode::NO_ROBUST:
            return accept(usable);

        case triangulation_mode::TRIPLET_GROWTH:
            return grow_from_best_triplet(usable);

        case triangulation_mode::SAMPLE_UNIFORM:
        case triangulation_mode::SAMPLE_BIASED_BY_BASELINE:
        case triangulation_mode::TOPK_BASELINE:
        {
            const auto& inlier_mask = execute_ransac_variant(usable, rng);

            std::vector<size_t> inlier_indices { };
            for (size_t k = 0; k < inlier_mask.size(); ++k)
            {
                if (inlier_mask[k])
                    inlier_indices.push_back(k);
            }

            if (inlier_indices.size() < 2)
            {
                SPDLOG_DEBUG("best hypothesis has {} inliers of {}", inlier_indices.size(), usable.size());
                return triangulation_result::rejected(track_outcome::REPROJECTION_REJECTION);
            }

            return accept(usable.select_subset(inlier_indices));
        }
    }

    return triangulation_result::rejected(track_outcome::UNDER_DETERMINED);
}

auto tricurate::robust_point_triangulator::select_inliers
(
    const track2d&                                           track,
    const std::vector<hypothesis_sampler::measurement_pair>& pairs,
    const std::vector<size_t>&                               samples
) const -> std::vector<bool>
{
    const auto threshold = _options.reprojection_threshold.value();

    auto              best_votes   = size_t { 0 };
    auto              best_error   = std::numeric_limits<double>::infinity();
    std::vector<bool> best_inliers(track.size(), false);

    for (const auto s : samples)
    {
        const auto& [k1, k2] = pairs.at(s);
        const auto& m1       = track.measurement(k1);
        const auto& m2       = track.measurement(k2);

        if (!_registry.contains(m1.camera_index) || !_registry.contains(m2.camera_index))
        {
            SPDLOG_WARN("unregistered camera at index {} or {}, skipping hypothesis", m1.camera_index, m2.camera_index);
            continue;
        }

        const std::vector<camera>      cameras { _registry.at(m1.camera_index), _registry.at(m2.camera_index) };
        const std::vector<cv::Point2d> pixels { m1.pixel, m2.pixel };

        cv::Point3d point { };
        try
        {
            point = geometry::triangulate(cameras, pixels, _options.parameters());
        }
        catch (const triangulation_exception& e)
        {
            SPDLOG_TRACE("skipping hypothesis ({}, {}): {}", k1, k2, e.what());
            continue;
        }

        const auto& errors = geometry::compute_point_reprojection_errors(_registry, point, track).first;

        std::vector<bool> is_inlier(errors.size(), false);
        auto              votes = size_t { 0 };
        auto              sum   = 0.0;

        for (size_t k = 0; k < errors.size(); ++k)
        {
            if (errors[k] < threshold)
            {
                is_inlier[k] = true;
                votes++;
                sum += errors[k];
            }
        }

        if (votes == 0)
            continue;

        const auto mean = sum / gsl::narrow<double>(votes);

        if (votes > best_votes || (votes == best_votes && mean < best_error))
        {
            best_votes   = votes;
            best_error   = mean;
            best_inliers = std::move(is_inlier);
        }
    }

    return best_inliers;
}

auto tricurate::robust_point_triangulator::registered_measurements(const track2d& track) const -> track2d
{
    track2d usable { };

    for (const auto& m : track)
    {
        if (_registry.contains(m.camera_index))
        {
            usable.add(m);
        }
        else
        {
            SPDLOG_WARN("camera {} is not registered, dropping its measurement at {}", m.camera_index, m.pixel);
        }
    }

    return usable;
}

auto tricurate::robust_point_triangulator::execute_ransac_variant(const track2d& track, std::mt19937_64& rng) const -> std::vector<bool>
{
    const auto& pairs   = hypothesis_sampler::generate_measurement_pairs(track.size());
    const auto& weights = hypothesis_sampler::compute_pair_weights(_registry, track, pairs, _options.mode);
    const auto& samples = hypothesis_sampler::sample(weights, gsl::narrow<size_t>(_options.num_hypotheses.value()), _options.mode, rng);

    return select_inliers(track, pairs, samples);
}

auto tricurate::robust_point_triangulator::accept(const track2d& inliers) const -> triangulation_result
{
    if (inliers.size() < 2 || !inliers.has_unique_cameras())
    {
        return triangulation_result::rejected(track_outcome::UNDER_DETERMINED);
    }

    cv::Point3d point { };
    try
    {
        point = geometry::triangulate(_registry, inliers, _options.parameters());
    }
    catch (const cheirality_exception&)
    {
        return triangulation_result::rejected(track_outcome::CHEIRALITY_FAILURE);
    }
    catch (const underconstrained_exception&)
    {
        return triangulation_result::rejected(track_outcome::UNDER_DETERMINED);
    }

    const auto& [errors, mean_error] = geometry::compute_point_reprojection_errors(_registry, point, inliers);
    const auto  threshold            = _options.reprojection_threshold.value();

    if (!std::ranges::all_of(errors, [threshold](const double error) { return error < threshold; }))
    {
        SPDLOG_DEBUG("rejecting point {} with errors [{}]", point, utils::to_string(errors));
        return triangulation_result::rejected(track_outcome::REPROJECTION_REJECTION);
    }

    return { landmark(point, inliers), mean_error, false, track_outcome::ACCEPTED };
}

auto tricurate::robust_point_triangulator::grow_from_best_triplet(const track2d& track) const -> triangulation_result
{
    if (track.size() < 2)
    {
        return triangulation_result::rejected(track_outcome::UNDER_DETERMINED);
    }

    if (track.size() == 2)
    {
        // a pair is triangulated as in NO_ROBUST, with every error under the threshold
        return accept(track);
    }

    const auto threshold = _options.reprojection_threshold.value();

    std::optional<estimate> best { };
    auto                    any_triplet    = false;
    auto                    any_cheirality = false;

    for (size_t k1 = 0; k1 < track.size(); ++k1)
    {
        for (auto k2 = k1 + 1; k2 < track.size(); ++k2)
        {
            for (auto k3 = k2 + 1; k3 < track.size(); ++k3)
            {
                const auto& triplet = track.select_subset({ k1, k2, k3 });

                if (!triplet.has_unique_cameras())
                    continue;

                any_triplet = true;

                try
                {
                    const auto point = geometry::triangulate(_registry, triplet, _options.parameters());
                    const auto error = geometry::compute_point_reprojection_errors(_registry, point, triplet).second;

                    // strict comparison keeps the lexicographically first triplet on ties
                    if (!best || error < best->mean_error)
                    {
                        best = estimate { point, error };
                    }
                }
                catch (const cheirality_exception&)
                {
                    any_cheirality = true;
                }
                catch (const underconstrained_exception&)
                {
                    // degenerate triplet, e.g. collinear centers
                }
            }
        }
    }

    if (!best)
    {
        SPDLOG_DEBUG("no triplet of {} measurements triangulates", track.size());

        return triangulation_result::rejected
        (
            any_triplet && any_cheirality ? track_outcome::CHEIRALITY_FAILURE : track_outcome::UNDER_DETERMINED
        );
    }

    if (best->mean_error > threshold)
    {
        SPDLOG_DEBUG("best triplet error {:.3f} exceeds threshold {:.3f}", best->mean_error, threshold);
        return triangulation_result::rejected(track_outcome::REPROJECTION_REJECTION);
    }

    const auto& errors = geometry::compute_point_reprojection_errors(_registry, best->point, track).first;
    const auto& order  = utils::argsort(errors);

    std::vector<tricurate::measurement> accepted { };
    std::set<size_t>                    accepted_cameras { };

    for (const auto k : order)
    {
        const auto& m = track.measurement(k);

        if (accepted.empty())
        {
            accepted.push_back(m);
            accepted_cameras.insert(m.camera_index);
            continue;
        }

        if (accepted_cameras.contains(m.camera_index))
            continue;

        auto candidate = accepted;
        candidate.push_back(m);

        if (const auto& grown = triangulate_unbounded(_registry, track2d(candidate), _options.parameters()); grown && grown->mean_error < threshold)
        {
            accepted = std::move(candidate);
            accepted_cameras.insert(m.camera_index);
        }
    }

    SPDLOG_TRACE("grew {} of {} measurements from the best triplet", accepted.size(), track.size());

    return accept_on_mean_error(track2d(std::move(accepted)));
}

auto tricurate::robust_point_triangulator::accept_on_mean_error(const track2d& accepted) const -> triangulation_result
{
    if (accepted.size() < 2 || !accepted.has_unique_cameras())
    {
        return triangulation_result::rejected(track_outcome::UNDER_DETERMINED);
    }

    cv::Point3d point { };
    try
    {
        point = geometry::triangulate(_registry, accepted, _options.parameters());
    }
    catch (const cheirality_exception&)
    {
        return triangulation_result::rejected(track_outcome::CHEIRALITY_FAILURE);
    }
    catch (const underconstrained_exception&)
    {
        return triangulation_result::rejected(track_outcome::UNDER_DETERMINED);
    }

    const auto mean_error = geometry::compute_point_reprojection_errors(_registry, point, accepted).second;

    if (!(mean_error < _options.reprojection_threshold.value()))
    {
        return triangulation_result::rejected(track_outcome::REPROJECTION_REJECTION);
    }

    return { landmark(point, accepted), mean_error, false, track_outcome::ACCEPTED };
}
