#include <catch2/catch_all.hpp>

#include <algorithm>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <yaml-cpp/yaml.h>

#include <tricurate/curation/track_curator.h>
#include <tricurate/geometry/exceptions.h>
#include <tricurate/synthetic/scene_generator.h>
#include <tricurate/yaml_emitters.h>

#include "test_scene.h"

using namespace tricurate;

namespace
{
    auto make_options(const triangulation_mode mode, const int min_track_length, const int num_threads) -> curation_options
    {
        curation_options options { };
        options.min_track_length          = min_track_length;
        options.num_threads               = num_threads;
        options.triangulation->mode       = mode;
        options.triangulation->seed       = 1234;
        options.triangulation->reprojection_threshold = 3.0;
        return options;
    }
}

TEST_CASE("curator applies the minimum track length", "[curator]")
{
    const auto& registry = test::ring_registry(6);
    const auto& full     = synthetic::observe(registry, test::scene_point);

    const std::vector tracks { full.select_subset({ 0, 1, 2 }), full.select_subset({ 0, 1, 2, 3, 4 }) };

    const track_curator curator { registry, make_options(triangulation_mode::NO_ROBUST, 4, 1) };
    const auto&         result = curator.run(tracks);

    REQUIRE(result.landmarks.size() == 1);
    REQUIRE(result.landmarks.front().size() == 5);
    REQUIRE(result.track_indices == std::vector<size_t> { 1 });
    REQUIRE(result.report.insufficient_support == 1);
    REQUIRE(result.report.accepted == 1);
    REQUIRE(result.report.track_length_histogram.at(5) == 1);
}

TEST_CASE("a track dropped for insufficient support is logged as a warning", "[curator]")
{
    const auto& registry = test::ring_registry(6);
    const auto& full     = synthetic::observe(registry, test::scene_point);

    const auto sink     = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    const auto logger   = std::make_shared<spdlog::logger>("curator_test", sink);
    const auto previous = spdlog::default_logger();

    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);

    const track_curator curator { registry, make_options(triangulation_mode::NO_ROBUST, 4, 1) };
    const auto&         result = curator.run({ full.select_subset({ 0, 1, 2 }) });

    spdlog::set_default_logger(previous);

    REQUIRE(result.report.insufficient_support == 1);

    const auto& messages = sink->last_raw();

    REQUIRE(std::ranges::any_of(messages, [](const spdlog::details::log_msg_buffer& msg)
    {
        const auto payload = std::string(msg.payload.data(), msg.payload.size());
        return msg.level == spdlog::level::warn && payload.find("3 supporting measurements, 4 required") != std::string::npos;
    }));
}

TEST_CASE("one failing track does not affect the others", "[curator]")
{
    const auto& registry = test::ring_registry(4);
    const auto& good     = synthetic::observe(registry, test::scene_point);
    const auto  pixel    = good.measurement(0).pixel;

    const std::vector tracks
    {
        track2d { },
        good,
        track2d { { 0, pixel }, { 0, pixel } },
        track2d { { 0, pixel }, { 99, pixel } },
        good
    };

    const track_curator curator { registry, make_options(triangulation_mode::SAMPLE_UNIFORM, 2, 2) };
    const auto&         result = curator.run(tracks);

    REQUIRE(result.landmarks.size() == 2);
    REQUIRE(result.track_indices == std::vector<size_t> { 1, 4 });
    REQUIRE(result.report.total_tracks == 5);
    REQUIRE(result.report.under_determined == 3);
    REQUIRE(result.report.accepted == 2);
    REQUIRE(result.report.count(track_outcome::ACCEPTED) == 2);
    REQUIRE(result.cameras.size() == registry.size());
}

TEST_CASE("curation result does not depend on the thread count", "[curator]")
{
    scene_options scene { };
    scene.num_points    = 120;
    scene.outlier_ratio = 0.2;

    const auto& generated = synthetic::generate_scene(scene);

    for (const auto mode : { triangulation_mode::SAMPLE_UNIFORM, triangulation_mode::SAMPLE_BIASED_BY_BASELINE })
    {
        const track_curator single { generated.cameras, make_options(mode, 2, 1) };
        const track_curator multi { generated.cameras, make_options(mode, 2, 4) };

        const auto& a = single.run(generated.tracks);
        const auto& b = multi.run(generated.tracks);

        REQUIRE(a.track_indices == b.track_indices);
        REQUIRE(a.landmarks.size() == b.landmarks.size());

        for (size_t k = 0; k < a.landmarks.size(); ++k)
        {
            REQUIRE(a.landmarks[k].point() == b.landmarks[k].point());
            REQUIRE(a.landmarks[k].measurements() == b.landmarks[k].measurements());
        }

        REQUIRE(a.report.accepted == b.report.accepted);
        REQUIRE(a.report.reprojection_rejections == b.report.reprojection_rejections);
    }
}

TEST_CASE("report counts every track once", "[curator]")
{
    scene_options scene { };
    scene.num_points  = 80;
    scene.visibility  = 0.4;
    scene.noise_sigma = 1.0;

    const auto& generated = synthetic::generate_scene(scene);

    const track_curator curator { generated.cameras, make_options(triangulation_mode::TRIPLET_GROWTH, 3, 0) };
    const auto&         result = curator.run(generated.tracks);
    const auto&         report = result.report;

    REQUIRE(report.total_tracks == generated.tracks.size());
    REQUIRE(report.accepted + report.under_determined + report.cheirality_failures + report.reprojection_rejections + report.insufficient_support == report.total_tracks);

    const auto histogram_total = std::accumulate(report.track_length_histogram.begin(), report.track_length_histogram.end(), size_t { 0 }, [](const size_t sum, const auto& entry) { return sum + entry.second; });

    REQUIRE(histogram_total == report.accepted);
    REQUIRE(result.landmarks.size() == report.accepted);
    REQUIRE(report.median_reprojection_error <= 3.0);

    for (const auto& lm : result.landmarks)
    {
        REQUIRE(lm.size() >= 3);
    }

    SECTION("report and landmarks serialize to YAML")
    {
        YAML::Emitter emitter { };
        emitter << YAML::BeginMap;
        emitter << YAML::Key << "report" << YAML::Value << report;
        emitter << YAML::Key << "landmarks" << YAML::Value << result.landmarks;
        emitter << YAML::EndMap;

        REQUIRE(emitter.good());

        const auto node = YAML::Load(emitter.c_str());

        REQUIRE(node["report"]["total_tracks"].as<size_t>() == report.total_tracks);
        REQUIRE(node["landmarks"].size() == result.landmarks.size());
    }
}

TEST_CASE("configuration errors stop the pass", "[curator]")
{
    const auto& cam = test::make_camera({ 10.0, 0.0, 1.0 });

    camera_registry registry { };
    registry.insert(0, cam);
    registry.insert(1, cam);

    const std::vector tracks(8, track2d { { 0, { 600.0, 470.0 } }, { 1, { 610.0, 480.0 } } });

    const track_curator curator { registry, make_options(triangulation_mode::SAMPLE_BIASED_BY_BASELINE, 2, 3) };

    REQUIRE_THROWS_AS(curator.run(tracks), configuration_error);
}

TEST_CASE("per-track seeds", "[curator]")
{
    REQUIRE(track_curator::seed_for_track(7, 3) == track_curator::seed_for_track(7, 3));
    REQUIRE(track_curator::seed_for_track(7, 3) != track_curator::seed_for_track(7, 4));
    REQUIRE(track_curator::seed_for_track(7, 3) != track_curator::seed_for_track(8, 3));
}

TEST_CASE("empty input gives an empty result", "[curator]")
{
    const auto&         registry = test::ring_registry(3);
    const track_curator curator { registry, curation_options { } };

    const auto& result = curator.run({ });

    REQUIRE(result.landmarks.empty());
    REQUIRE(result.report.total_tracks == 0);
    REQUIRE(result.report.acceptance_rate() == 0.0);
}
