#include "tricurate/camera/camera_registry.h"

#include <utility>

tricurate::camera_registry::camera_registry(container cameras) :
    _cameras(std::move(cameras))
{
}

auto tricurate::camera_registry::contains(const size_t camera_index) const -> bool
{
    return _cameras.contains(camera_index);
}

auto tricurate::camera_registry::at(const size_t camera_index) const -> const camera&
{
    return _cameras.at(camera_index);
}

auto tricurate::camera_registry::find(const size_t camera_index) const -> const camera*
{
    const auto it = _cameras.find(camera_index);
    return it == _cameras.end() ? nullptr : &it->second;
}

void tricurate::camera_registry::insert(const size_t camera_index, const camera& cam)
{
    _cameras.insert_or_assign(camera_index, cam);
}
