#pragma once

#include <vector>

#include <yaml-cpp/yaml.h>

#include "tricurate/curation/curation_report.h"
#include "tricurate/types/landmark.h"

namespace tricurate
{
    YAML::Emitter& operator<<(YAML::Emitter& emitter, const curation_report& report);
    YAML::Emitter& operator<<(YAML::Emitter& emitter, const landmark& landmark);
    YAML::Emitter& operator<<(YAML::Emitter& emitter, const std::vector<landmark>& landmarks);
}
