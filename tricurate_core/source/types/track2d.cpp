#include "tricurate/types/track2d.h"

#include <set>
#include <utility>

namespace tricurate
{
    track2d::track2d(std::vector<tricurate::measurement> measurements) :
        _measurements(std::move(measurements))
    {
    }

    track2d::track2d(const std::initializer_list<tricurate::measurement> measurements) :
        _measurements(measurements)
    {
    }

    auto track2d::select_subset(const std::vector<size_t>& indices) const -> track2d
    {
        std::vector<tricurate::measurement> subset { };
        subset.reserve(indices.size());

        for (const auto k : indices)
        {
            subset.push_back(_measurements.at(k));
        }

        return track2d(std::move(subset));
    }

    auto track2d::has_unique_cameras() const -> bool
    {
        std::set<size_t> seen { };

        for (const auto& m : _measurements)
        {
            if (!seen.insert(m.camera_index).second)
            {
                return false;
            }
        }

        return true;
    }

    auto track2d::camera_indices() const -> std::vector<size_t>
    {
        std::vector<size_t> indices { };
        indices.reserve(_measurements.size());

        for (const auto& m : _measurements)
        {
            indices.push_back(m.camera_index);
        }

        return indices;
    }

    void track2d::add(const tricurate::measurement& m)
    {
        _measurements.push_back(m);
    }
}
