#include <cmath>
#include <fstream>
#include <iostream>
#include <vector>

#include <spdlog/spdlog.h>

#include <yaml-cpp/yaml.h>

#include <tricurate/curation/track_curator.h>
#include <tricurate/formatters.h>
#include <tricurate/options.h>
#include <tricurate/synthetic/scene_generator.h>
#include <tricurate/utils/utils.h>
#include <tricurate/yaml_emitters.h>

int main(const int argc, char** argv)
{
    spdlog::set_level(spdlog::level::info);

    try
    {
        const auto& options = tricurate::options::parse(argc, argv);

        if (options.verb == tricurate::verb::HELP)
        {
            std::cout << tricurate::options::description() << "\n";
            return 0;
        }

        if (options.verb == tricurate::verb::VERSION)
        {
            std::cout << tricurate::utils::version << "\n";
            return 0;
        }

        spdlog::set_level(options.log_level);
        spdlog::set_pattern(options.log_pattern);

        options.validate();
        options.print();

        const auto& scene   = tricurate::synthetic::generate_scene(options.scene);
        const auto  curator = tricurate::track_curator { scene.cameras, options.curation };
        const auto& result  = curator.run(scene.tracks);

        result.report.print();

        // distance of every landmark to the point that generated its track
        std::vector<double> position_errors { };
        for (size_t k = 0; k < result.landmarks.size(); ++k)
        {
            const auto d = result.landmarks[k].point() - scene.points[result.track_indices[k]];
            position_errors.push_back(std::sqrt(d.dot(d)));
        }

        SPDLOG_INFO("");
        SPDLOG_INFO("Ground Truth:");
        SPDLOG_INFO("  Position Error Mean:     {:.4f}", tricurate::utils::mean(position_errors));
        SPDLOG_INFO("  Position Error Median:   {:.4f}", tricurate::utils::median(position_errors));

        if (!options.output_file.empty())
        {
            YAML::Emitter emitter { };
            emitter << YAML::BeginMap;
            emitter << YAML::Key << "report" << YAML::Value << result.report;
            emitter << YAML::Key << "landmarks" << YAML::Value << result.landmarks;
            emitter << YAML::EndMap;

            std::ofstream output { options.output_file };
            if (!output)
            {
                SPDLOG_ERROR("Cannot write {}", options.output_file);
                return 1;
            }

            output << emitter.c_str() << "\n";
            SPDLOG_INFO("Wrote {} landmarks to {}", result.landmarks.size(), options.output_file);
        }

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
