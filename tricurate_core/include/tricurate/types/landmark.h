#pragma once

#include <vector>

#include <opencv2/core/types.hpp>

#include "tricurate/types/track2d.h"

namespace tricurate
{
    /** landmark: a triangulated 3D point together with the measurements that support it.
     *
     * This is the hand-off format for bundle adjustment. Landmarks produced by the
     * robust triangulator always carry at least two measurements from distinct cameras.
     */
    class landmark
    {
    public:
        landmark() = default;
        landmark(const cv::Point3d& point, track2d support);

        [[nodiscard]] auto point() const -> const cv::Point3d& { return _point; }
        [[nodiscard]] auto support() const -> const track2d& { return _support; }

        [[nodiscard]] auto size() const -> size_t { return _support.size(); }
        [[nodiscard]] auto measurement(const size_t k) const -> const tricurate::measurement& { return _support.measurement(k); }
        [[nodiscard]] auto measurements() const -> const std::vector<tricurate::measurement>& { return _support.measurements(); }

    private:
        cv::Point3d _point   = { };
        track2d     _support = { };
    };
}
