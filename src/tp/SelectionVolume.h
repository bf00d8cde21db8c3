#pragma once

#include "common/math.h"

#include <glm/vec3.hpp>

namespace tp
{

struct SelectionVolume
{
    static constexpr double kMinExtent = 0.1;

    glm::dvec3 min{0.0};
    glm::dvec3 max{0.0};

    // Normalizes two arbitrary opposite corners into a min/max box.
    [[nodiscard]] static SelectionVolume fromCorners(const glm::dvec3& a, const glm::dvec3& b);

    // Box around `bounds`. Every axis thinner than kMinExtent gains `padding` (at least
    // kMinExtent) on both sides, so a flat mesh gets one layer over its surface and one
    // under it.
    [[nodiscard]] static SelectionVolume enclosing(const common::Bounds& bounds, double padding);

    [[nodiscard]] glm::dvec3 size() const noexcept { return max - min; }
    [[nodiscard]] double volume() const noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    [[nodiscard]] bool contains(const glm::dvec3& point) const noexcept;
};

} // namespace tp
