#pragma once

#include <cstddef>
#include <map>

#include "tricurate/camera/camera.h"

namespace tricurate
{
    /** camera_registry: read-only lookup from camera index to calibrated camera.
     *
     * Owned by the caller; the triangulator and curator only read it, so one registry can be
     * shared by every worker thread.
     */
    class camera_registry
    {
    public:
        using container      = std::map<size_t, camera>;
        using const_iterator = container::const_iterator;

        camera_registry() = default;
        explicit camera_registry(container cameras);

        [[nodiscard]] auto contains(size_t camera_index) const -> bool;

        /** throws std::out_of_range for an unknown index */
        [[nodiscard]] auto at(size_t camera_index) const -> const camera&;

        /** nullptr for an unknown index */
        [[nodiscard]] auto find(size_t camera_index) const -> const camera*;

        [[nodiscard]] auto size() const -> size_t { return _cameras.size(); }
        [[nodiscard]] auto empty() const -> bool { return _cameras.empty(); }

        auto begin() const -> const_iterator { return _cameras.begin(); }
        auto end() const -> const_iterator { return _cameras.end(); }

        void insert(size_t camera_index, const camera& cam);

    private:
        container _cameras = { };
    };
}
