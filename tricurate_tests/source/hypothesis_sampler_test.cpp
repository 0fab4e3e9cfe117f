#include <catch2/catch_all.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <vector>

#include <tricurate/estimation/hypothesis_sampler.h>
#include <tricurate/geometry/exceptions.h>
#include <tricurate/synthetic/scene_generator.h>

#include "test_scene.h"

TEST_CASE("measurement pairs", "[sampler]")
{
    using tricurate::hypothesis_sampler;

    SECTION("all unordered pairs in lexicographic order")
    {
        const auto& pairs = hypothesis_sampler::generate_measurement_pairs(4);

        REQUIRE(pairs.size() == 6);
        REQUIRE(pairs.front() == hypothesis_sampler::measurement_pair { 0, 1 });
        REQUIRE(pairs[2] == hypothesis_sampler::measurement_pair { 0, 3 });
        REQUIRE(pairs.back() == hypothesis_sampler::measurement_pair { 2, 3 });
    }

    SECTION("fewer than two measurements have no pairs")
    {
        REQUIRE(hypothesis_sampler::generate_measurement_pairs(0).empty());
        REQUIRE(hypothesis_sampler::generate_measurement_pairs(1).empty());
    }
}

TEST_CASE("pair weights", "[sampler]")
{
    using namespace tricurate;

    const auto& registry = test::ring_registry(4);
    const auto& track    = synthetic::observe(registry, test::scene_point);
    const auto& pairs    = hypothesis_sampler::generate_measurement_pairs(track.size());

    SECTION("uniform")
    {
        const auto& weights = hypothesis_sampler::compute_pair_weights(registry, track, pairs, triangulation_mode::SAMPLE_UNIFORM);

        REQUIRE(weights == std::vector(6, 1.0));
    }

    SECTION("baseline is the distance between camera centers")
    {
        const auto& weights = hypothesis_sampler::compute_pair_weights(registry, track, pairs, triangulation_mode::SAMPLE_BIASED_BY_BASELINE);

        // neighbours on a ring of radius 10 are 10 * sqrt(2) apart, opposite cameras 20
        REQUIRE(weights[0] == Catch::Approx(10.0 * std::sqrt(2.0)));
        REQUIRE(weights[1] == Catch::Approx(20.0));
        REQUIRE(hypothesis_sampler::compute_pair_weights(registry, track, pairs, triangulation_mode::TOPK_BASELINE) == weights);
    }

    SECTION("non-sampling modes have no weights")
    {
        REQUIRE_THROWS_AS(hypothesis_sampler::compute_pair_weights(registry, track, pairs, triangulation_mode::TRIPLET_GROWTH), std::invalid_argument);
    }
}

TEST_CASE("hypothesis sampling", "[sampler]")
{
    using namespace tricurate;

    SECTION("top-k takes the largest weights, lower index first on ties")
    {
        std::mt19937_64 rng { 1 };

        const auto& samples = hypothesis_sampler::sample({ 1.0, 3.0, 3.0, 2.0 }, 3, triangulation_mode::TOPK_BASELINE, rng);

        REQUIRE(samples == std::vector<size_t> { 1, 2, 3 });
    }

    SECTION("budget is limited by the number of pairs")
    {
        std::mt19937_64 rng { 1 };

        REQUIRE(hypothesis_sampler::sample(std::vector(3, 1.0), 10, triangulation_mode::TOPK_BASELINE, rng).size() == 3);
        REQUIRE(hypothesis_sampler::sample(std::vector(3, 1.0), 10, triangulation_mode::SAMPLE_UNIFORM, rng).size() == 3);
    }

    SECTION("random draws are without replacement")
    {
        std::mt19937_64 rng { 7 };

        const auto& samples = hypothesis_sampler::sample(std::vector(15, 1.0), 10, triangulation_mode::SAMPLE_UNIFORM, rng);

        REQUIRE(samples.size() == 10);
        REQUIRE(std::set(samples.begin(), samples.end()).size() == 10);
        REQUIRE(std::ranges::all_of(samples, [](const size_t s) { return s < 15; }));
    }

    SECTION("zero weight pairs are never drawn and exhaust the sampling early")
    {
        std::mt19937_64 rng { 3 };

        const auto& samples = hypothesis_sampler::sample({ 0.0, 2.0, 0.0, 1.0 }, 4, triangulation_mode::SAMPLE_BIASED_BY_BASELINE, rng);

        REQUIRE(std::set(samples.begin(), samples.end()) == std::set<size_t> { 1, 3 });
    }

    SECTION("same seed gives the same draws and a smaller budget is a prefix")
    {
        const std::vector weights { 1.0, 5.0, 2.0, 0.5, 3.0, 4.0, 1.5, 2.5 };

        std::mt19937_64 rng_a { 11 };
        std::mt19937_64 rng_b { 11 };
        std::mt19937_64 rng_c { 11 };

        const auto& a = hypothesis_sampler::sample(weights, 8, triangulation_mode::SAMPLE_BIASED_BY_BASELINE, rng_a);
        const auto& b = hypothesis_sampler::sample(weights, 8, triangulation_mode::SAMPLE_BIASED_BY_BASELINE, rng_b);
        const auto& c = hypothesis_sampler::sample(weights, 3, triangulation_mode::SAMPLE_BIASED_BY_BASELINE, rng_c);

        REQUIRE(a == b);
        REQUIRE(std::equal(c.begin(), c.end(), a.begin()));
    }

    SECTION("non-positive total weight is a configuration error")
    {
        std::mt19937_64 rng { 1 };

        REQUIRE_THROWS_AS(hypothesis_sampler::sample({ 0.0, 0.0 }, 2, triangulation_mode::SAMPLE_UNIFORM, rng), configuration_error);
        REQUIRE_THROWS_AS(hypothesis_sampler::sample({ }, 2, triangulation_mode::TOPK_BASELINE, rng), configuration_error);
    }
}
