#include "tricurate/options.h"

#include <map>
#include <stdexcept>

#include <boost/program_options.hpp>

#include <magic_enum/magic_enum.hpp>

#include <spdlog/spdlog.h>

#include <yaml-cpp/yaml.h>

#include "tricurate/formatters.h"
#include "tricurate/utils/utils.h"

namespace
{
    auto log_level_from_string(const std::string& text) -> spdlog::level::level_enum
    {
        const auto it = tricurate::utils::log_levels_from_string.find(text);

        if (it == tricurate::utils::log_levels_from_string.end())
        {
            throw std::invalid_argument("unknown log level: " + text);
        }

        return it->second;
    }
}

boost::program_options::options_description tricurate::options::description()
{
    const options options;

    boost::program_options::options_description description { "options" };

    description.add_options()
            (
                "options-file",
                boost::program_options::value<std::string>()->default_value(options.file.string()),
                "options file"
            )
            (
                "log-level",
                boost::program_options::value<std::string>()->default_value(utils::log_levels_to_string[options.log_level]),
                ("log level - pick one of: " + utils::to_string(magic_enum::enum_names<spdlog::level::level_enum>())).c_str()
            )
            (
                "log-pattern",
                boost::program_options::value<std::string>()->default_value(options.log_pattern),
                "spdlog pattern"
            )
            (
                "output-file",
                boost::program_options::value<std::string>()->default_value(options.output_file.string()),
                "YAML file receiving the curation report and landmarks, empty to skip"
            )
            ("help,h", "Show help")("version,v", "Show version");

    description.add(curation_options::description());
    description.add(scene_options::description());

    return description;
}

tricurate::options tricurate::options::parse(const int argc, char** argv)
{
    options options { };

    const auto& description = options::description();
    const auto& parsed      = parse_command_line(argc, argv, description);
    auto        map         = boost::program_options::variables_map();

    store(parsed, map);
    notify(map);

    std::map<std::string, boost::program_options::basic_option<char>> options_map { };
    for (auto& option : parsed.options)
    {
        options_map[option.string_key] = option;
    }

    if (options_map.contains("options-file"))
    {
        options = parse(std::filesystem::path(map["options-file"].as<std::string>()));
    }

    if (parsed.options.empty() || map.contains("help"))
    {
        options.verb = tricurate::verb::HELP;
    }

    if (map.contains("version"))
    {
        options.verb = tricurate::verb::VERSION;
    }

    if (options_map.contains("log-level"))
    {
        options.log_level = log_level_from_string(map["log-level"].as<std::string>());
    }

    if (options_map.contains("log-pattern"))
    {
        options.log_pattern = map["log-pattern"].as<std::string>();
    }

    if (options_map.contains("output-file"))
    {
        options.output_file = map["output-file"].as<std::string>();
    }

    curation_options::parse_cli(options.curation, options_map, map);
    scene_options::parse_cli(options.scene, options_map, map);

    return options;
}

tricurate::options tricurate::options::parse(const std::filesystem::path& path)
{
    options options { };

    options.file = path;

    try
    {
        const auto config = YAML::LoadFile(path.string());

        if (const auto& application = config["application"])
        {
            if (const auto x = application["log_level"]) options.log_level = log_level_from_string(x.as<std::string>());
            if (const auto x = application["log_pattern"]) options.log_pattern = x.as<std::string>();
            if (const auto x = application["output_file"]) options.output_file = x.as<std::string>();
        }

        if (const auto& curation = config[std::string(curation_options::prefix())])
        {
            options.curation = curation_options::parse_yaml(curation);
        }

        if (const auto& scene = config[std::string(scene_options::prefix())])
        {
            options.scene = scene_options::parse_yaml(scene);
        }
    }
    catch (const YAML::Exception& e)
    {
        SPDLOG_ERROR("Failed to load options file {}: {}", path, e.what());
    }

    return options;
}

void tricurate::options::print() const
{
    SPDLOG_INFO("options file: {}", file);
    SPDLOG_INFO("log level: {}", utils::log_levels_to_string[log_level]);
    SPDLOG_INFO("log pattern: {}", log_pattern);
    SPDLOG_INFO("output file: {}", output_file);
    SPDLOG_INFO("");
    SPDLOG_INFO("{}:", curation_options::name());
    curation.print();
    SPDLOG_INFO("");
    SPDLOG_INFO("{}:", scene_options::name());
    scene.print();
}

void tricurate::options::validate() const
{
    curation.validate();
    scene.validate();
}
