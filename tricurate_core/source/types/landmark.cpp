#include "tricurate/types/landmark.h"

#include <utility>

tricurate::landmark::landmark(const cv::Point3d& point, track2d support) :
    _point(point),
    _support(std::move(support))
{
}
