#include "tricurate/curation/curation_options.h"

#include <stdexcept>

namespace tricurate
{
    void curation_options::validate() const
    {
        if (min_track_length.value() < 2)
        {
            throw std::invalid_argument("curation.min_track_length must be at least 2");
        }

        if (num_threads.value() < 0)
        {
            throw std::invalid_argument("curation.num_threads must be non-negative");
        }

        triangulation->validate();
    }
}
