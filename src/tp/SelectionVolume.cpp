#include "tp/SelectionVolume.h"

#include <glm/common.hpp>

#include <algorithm>
#include <cmath>

namespace tp
{

SelectionVolume SelectionVolume::fromCorners(const glm::dvec3& a, const glm::dvec3& b)
{
    SelectionVolume volume;
    volume.min = glm::min(a, b);
    volume.max = glm::max(a, b);
    return volume;
}

SelectionVolume SelectionVolume::enclosing(const common::Bounds& bounds, double padding)
{
    SelectionVolume volume = fromCorners(common::toDVec3(bounds.min), common::toDVec3(bounds.max));
    const double pad = std::max(padding, kMinExtent);
    for (int axis = 0; axis < 3; ++axis)
    {
        if (volume.max[axis] - volume.min[axis] < kMinExtent)
        {
            volume.min[axis] -= pad;
            volume.max[axis] += pad;
        }
    }
    return volume;
}

double SelectionVolume::volume() const noexcept
{
    const glm::dvec3 extent = size();
    return extent.x * extent.y * extent.z;
}

bool SelectionVolume::isValid() const noexcept
{
    const glm::dvec3 extent = size();
    return std::isfinite(extent.x) && std::isfinite(extent.y) && std::isfinite(extent.z)
           && extent.x >= kMinExtent && extent.y >= kMinExtent && extent.z >= kMinExtent;
}

bool SelectionVolume::contains(const glm::dvec3& point) const noexcept
{
    return point.x >= min.x && point.x <= max.x
           && point.y >= min.y && point.y <= max.y
           && point.z >= min.z && point.z <= max.z;
}

} // namespace tp
