#pragma once

#include <QtGui/QVector3D>

#include <glm/vec3.hpp>

namespace common
{

struct Bounds
{
    QVector3D min{0.0f, 0.0f, 0.0f};
    QVector3D max{0.0f, 0.0f, 0.0f};

    [[nodiscard]] QVector3D center() const
    {
        return (min + max) * 0.5f;
    }

    [[nodiscard]] QVector3D size() const
    {
        return max - min;
    }
};

struct BoundingSphere
{
    QVector3D center{0.0f, 0.0f, 0.0f};
    float radius{0.0f};
};

inline glm::dvec3 toDVec3(const QVector3D& v)
{
    return {static_cast<double>(v.x()), static_cast<double>(v.y()), static_cast<double>(v.z())};
}

} // namespace common
