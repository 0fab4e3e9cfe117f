#pragma once

#include <cstddef>
#include <initializer_list>
#include <vector>

#include "tricurate/types/measurement.h"

namespace tricurate
{
    /** track2d: the 2D observations of one physical point across several images, in upstream order.
     */
    class track2d
    {
    public:
        track2d() = default;
        explicit track2d(std::vector<tricurate::measurement> measurements);
        track2d(std::initializer_list<tricurate::measurement> measurements);

        [[nodiscard]] auto size() const -> size_t { return _measurements.size(); }
        [[nodiscard]] auto empty() const -> bool { return _measurements.empty(); }

        [[nodiscard]] auto measurement(size_t k) const -> const tricurate::measurement& { return _measurements.at(k); }
        [[nodiscard]] auto measurements() const -> const std::vector<tricurate::measurement>& { return _measurements; }

        auto begin() const { return _measurements.begin(); }
        auto end() const { return _measurements.end(); }

        /**
         * Derive a sub-track from measurement positions.
         *
         * @param indices positions into this track, in the order they should appear
         * @return track holding the selected measurements
         */
        [[nodiscard]] auto select_subset(const std::vector<size_t>& indices) const -> track2d;

        /** true if no camera contributes more than one measurement */
        [[nodiscard]] auto has_unique_cameras() const -> bool;

        [[nodiscard]] auto camera_indices() const -> std::vector<size_t>;

        void add(const tricurate::measurement& m);

    private:
        std::vector<tricurate::measurement> _measurements = { };
    };
}
