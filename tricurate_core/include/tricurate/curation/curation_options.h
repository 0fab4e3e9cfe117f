#pragma once

#include "tricurate/option.h"
#include "tricurate/options_base.h"
#include "tricurate/estimation/triangulation_options.h"

namespace tricurate
{
    /// Track curation configuration: the support policy plus the per-track robust triangulation
    class curation_options : public options_base<curation_options, "curation options", "curation">
    {
    public:
        TRICURATE_DEFINE_OPTIONS
        (
            ((int, min_track_length, 2, "Minimum number of supporting measurements for a landmark to be kept"))
            ((int, num_threads, 0, "Worker threads, 0 uses the hardware concurrency"))
            ((triangulation_options, triangulation, triangulation_options { }, "Robust triangulation"))
        )

        void validate() const;
    };
}
