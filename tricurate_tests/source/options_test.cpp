#include <catch2/catch_all.hpp>

#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include <tricurate/options.h>

TEST_CASE("Options validation", "[options]")
{
    using tricurate::options;

    SECTION("Defaults pass validation")
    {
        auto opts = options { };
        REQUIRE_NOTHROW(opts.validate());
        REQUIRE_NOTHROW(opts.curation.validate());
        REQUIRE_NOTHROW(opts.scene.validate());
    }

    SECTION("Invalid threshold throws")
    {
        auto opts = options { };
        opts.curation.triangulation->reprojection_threshold = 0.0;
        REQUIRE_THROWS_AS(opts.curation.validate(), std::invalid_argument);
    }

    SECTION("Invalid hypothesis count throws")
    {
        auto opts = options { };
        opts.curation.triangulation->num_hypotheses = 0;
        REQUIRE_THROWS_AS(opts.validate(), std::invalid_argument);
    }

    SECTION("Minimum track length below two throws")
    {
        auto opts = options { };
        opts.curation.min_track_length = 1;
        REQUIRE_THROWS_AS(opts.curation.validate(), std::invalid_argument);
    }

    SECTION("Negative thread count throws")
    {
        auto opts = options { };
        opts.curation.num_threads = -1;
        REQUIRE_THROWS_AS(opts.curation.validate(), std::invalid_argument);
    }

    SECTION("Invalid scene throws")
    {
        auto opts = options { };
        opts.scene.num_cameras = 1;
        REQUIRE_THROWS_AS(opts.scene.validate(), std::invalid_argument);

        opts.scene.num_cameras   = 8;
        opts.scene.outlier_ratio = 1.5;
        REQUIRE_THROWS_AS(opts.scene.validate(), std::invalid_argument);
    }
}

TEST_CASE("Options from YAML", "[options]")
{
    using namespace tricurate;

    SECTION("Nested groups and enums by name")
    {
        const auto node = YAML::Load
        (
            "min_track_length: 3\n"
            "triangulation:\n"
            "  mode: TRIPLET_GROWTH\n"
            "  reprojection_threshold: 2.5\n"
            "  seed: 99\n"
        );

        const auto& curation = curation_options::parse_yaml(node);

        REQUIRE(curation.min_track_length.value() == 3);
        REQUIRE(curation.num_threads.value() == 0);
        REQUIRE(curation.triangulation->mode.value() == triangulation_mode::TRIPLET_GROWTH);
        REQUIRE(curation.triangulation->reprojection_threshold.value() == 2.5);
        REQUIRE(curation.triangulation->seed.value() == 99);
        REQUIRE(curation.triangulation->num_hypotheses.value() == 20);
    }

    SECTION("Unknown mode throws")
    {
        const auto node = YAML::Load("mode: EVERYTHING\n");
        REQUIRE_THROWS_AS(triangulation_options::parse_yaml(node), std::invalid_argument);
    }

    SECTION("Options file")
    {
        const auto path = std::filesystem::temp_directory_path() / "tricurate_options_test.yaml";

        {
            std::ofstream file { path };
            file << "application:\n"
                 << "  log_level: debug\n"
                 << "curation:\n"
                 << "  num_threads: 2\n"
                 << "  triangulation:\n"
                 << "    mode: TOPK_BASELINE\n"
                 << "scene:\n"
                 << "  num_points: 25\n";
        }

        const auto& opts = options::parse(path);

        REQUIRE(opts.file == path);
        REQUIRE(opts.log_level == spdlog::level::debug);
        REQUIRE(opts.curation.num_threads.value() == 2);
        REQUIRE(opts.curation.triangulation->mode.value() == triangulation_mode::TOPK_BASELINE);
        REQUIRE(opts.scene.num_points.value() == 25);
        REQUIRE(opts.scene.num_cameras.value() == 8);

        std::filesystem::remove(path);
    }

    SECTION("Missing file keeps defaults")
    {
        const auto& opts = options::parse(std::filesystem::path("does/not/exist.yaml"));

        REQUIRE(opts.curation.triangulation->mode.value() == triangulation_mode::SAMPLE_BIASED_BY_BASELINE);
        REQUIRE_NOTHROW(opts.validate());
    }
}

TEST_CASE("Options from the command line", "[options]")
{
    using namespace tricurate;

    SECTION("Nested flags override defaults")
    {
        std::array argv
        {
            const_cast<char*>("tricurate_app"),
            const_cast<char*>("--curation.triangulation.mode"),
            const_cast<char*>("TRIPLET_GROWTH"),
            const_cast<char*>("--curation.triangulation.reprojection-threshold"),
            const_cast<char*>("1.5"),
            const_cast<char*>("--curation.min-track-length"),
            const_cast<char*>("4"),
            const_cast<char*>("--scene.num-points"),
            const_cast<char*>("10"),
            const_cast<char*>("--log-level"),
            const_cast<char*>("warn")
        };

        const auto& opts = options::parse(static_cast<int>(argv.size()), argv.data());

        REQUIRE(opts.verb == verb::RUN);
        REQUIRE(opts.log_level == spdlog::level::warn);
        REQUIRE(opts.curation.triangulation->mode.value() == triangulation_mode::TRIPLET_GROWTH);
        REQUIRE(opts.curation.triangulation->reprojection_threshold.value() == 1.5);
        REQUIRE(opts.curation.min_track_length.value() == 4);
        REQUIRE(opts.scene.num_points.value() == 10);
        REQUIRE(opts.curation.num_threads.value() == 0);
    }

    SECTION("No arguments asks for help")
    {
        std::array argv { const_cast<char*>("tricurate_app") };

        REQUIRE(options::parse(static_cast<int>(argv.size()), argv.data()).verb == verb::HELP);
    }

    SECTION("Version flag")
    {
        std::array argv { const_cast<char*>("tricurate_app"), const_cast<char*>("--version") };

        REQUIRE(options::parse(static_cast<int>(argv.size()), argv.data()).verb == verb::VERSION);
    }

    SECTION("Invalid mode throws")
    {
        std::array argv { const_cast<char*>("tricurate_app"), const_cast<char*>("--curation.triangulation.mode"), const_cast<char*>("BEST") };

        REQUIRE_THROWS_AS(options::parse(static_cast<int>(argv.size()), argv.data()), std::invalid_argument);
    }

    SECTION("Description lists nested flags")
    {
        std::ostringstream stream { };
        stream << options::description();

        const auto text = stream.str();

        REQUIRE(text.find("curation.triangulation.num-hypotheses") != std::string::npos);
        REQUIRE(text.find("curation.min-track-length") != std::string::npos);
        REQUIRE(text.find("scene.noise-sigma") != std::string::npos);
        REQUIRE(text.find("TRIPLET_GROWTH") != std::string::npos);
    }
}
