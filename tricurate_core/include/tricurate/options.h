#pragma once

#include <filesystem>
#include <string>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>

#include <spdlog/common.h>

#include "tricurate/verb.h"
#include "tricurate/curation/curation_options.h"
#include "tricurate/synthetic/scene_options.h"

namespace tricurate
{
    /// Application options: logging and output plus the curation and scene groups
    class options
    {
    public:
        using options_description = boost::program_options::options_description;

        static options_description description();

        /**
         * Parse the command line. An options file given by --options-file is read first, flags on the
         * command line override its values.
         */
        static options parse(int argc, char** argv);
        static options parse(const std::filesystem::path& path);

        std::filesystem::path     file        = { "options.yaml" };
        spdlog::level::level_enum log_level   = { spdlog::level::info };
        std::string               log_pattern = { "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v" };
        std::filesystem::path     output_file = { };
        tricurate::verb           verb        = { tricurate::verb::RUN };

        curation_options curation = { };
        scene_options    scene    = { };

        void print() const;
        void validate() const;
    };
} // namespace tricurate
