#include "tricurate/estimation/hypothesis_sampler.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <string>

#include <magic_enum/magic_enum.hpp>

#include <spdlog/spdlog.h>

#include "tricurate/geometry/exceptions.h"

namespace tricurate
{
    auto hypothesis_sampler::generate_measurement_pairs(const size_t n) -> std::vector<measurement_pair>
    {
        std::vector<measurement_pair> pairs { };
        pairs.reserve(n < 2 ? 0 : n * (n - 1) / 2);

        for (size_t i = 0; i < n; ++i)
        {
            for (auto j = i + 1; j < n; ++j)
            {
                pairs.emplace_back(i, j);
            }
        }

        return pairs;
    }

    auto hypothesis_sampler::compute_pair_weights
    (
        const camera_registry&               registry,
        const track2d&                       track,
        const std::vector<measurement_pair>& pairs,
        const triangulation_mode             mode
    ) -> std::vector<double>
    {
        switch (mode)
        {
            case triangulation_mode::SAMPLE_UNIFORM:
                return std::vector(pairs.size(), 1.0);

            case triangulation_mode::SAMPLE_BIASED_BY_BASELINE:
            case triangulation_mode::TOPK_BASELINE:
            {
                std::vector<double> weights { };
                weights.reserve(pairs.size());

                for (const auto& [k1, k2] : pairs)
                {
                    const auto& baseline = registry.at(track.measurement(k1).camera_index).center() - registry.at(track.measurement(k2).camera_index).center();
                    weights.push_back(std::sqrt(baseline.dot(baseline)));
                }

                return weights;
            }

            default:
                throw std::invalid_argument("pair weights are undefined for mode " + std::string(magic_enum::enum_name(mode)));
        }
    }

    auto hypothesis_sampler::sample(const std::vector<double>& weights, const size_t num_hypotheses, const triangulation_mode mode, std::mt19937_64& rng) -> std::vector<size_t>
    {
        if (const auto total = std::accumulate(weights.begin(), weights.end(), 0.0); !(total > 0.0))
        {
            throw configuration_error("total hypothesis sampling weight must be positive, got " + std::to_string(total));
        }

        const auto budget = std::min(num_hypotheses, weights.size());

        std::vector<size_t> samples { };
        samples.reserve(budget);

        if (mode == triangulation_mode::TOPK_BASELINE)
        {
            std::vector<size_t> order(weights.size());
            std::iota(order.begin(), order.end(), 0);
            std::ranges::stable_sort(order, [&weights](const size_t a, const size_t b) { return weights[a] > weights[b]; });

            samples.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(budget));
            return samples;
        }

        auto remaining = weights;

        while (samples.size() < budget)
        {
            if (!(std::accumulate(remaining.begin(), remaining.end(), 0.0) > 0.0))
            {
                SPDLOG_TRACE("sampling weight exhausted after {} of {} hypotheses", samples.size(), budget);
                break;
            }

            std::discrete_distribution<size_t> distribution(remaining.begin(), remaining.end());

            const auto index = distribution(rng);
            samples.push_back(index);
            remaining[index] = 0.0;
        }

        return samples;
    }
}
