// Model.cpp keeps the derived bounding volumes next to the vertex buffers; they are
// recomputed whenever the buffers are replaced and never mutated afterwards.
#include "mesh/Model.h"

#include "common/Enforce.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace mesh
{

void Model::setName(QString name)
{
    m_name = std::move(name);
}

const QString& Model::name() const
{
    return m_name;
}

void Model::setMeshData(std::vector<QVector3D> positions, std::vector<QVector3D> normals)
{
    m_positions = std::move(positions);
    m_normals = std::move(normals);
    updateBounds();
}

const std::vector<QVector3D>& Model::positions() const
{
    return m_positions;
}

const std::vector<QVector3D>& Model::normals() const
{
    return m_normals;
}

bool Model::isValid() const
{
    return triangleCount() > 0;
}

Triangle Model::triangle(std::size_t index) const
{
    STLCAM_ENFORCE(index < triangleCount(), "Triangle index out of range.");

    const std::size_t base = index * 3;
    Triangle tri;
    tri.v0 = m_positions[base];
    tri.v1 = m_positions[base + 1];
    tri.v2 = m_positions[base + 2];
    if (base < m_normals.size())
    {
        tri.normal = m_normals[base];
    }
    return tri;
}

common::Bounds Model::bounds() const
{
    return m_bounds;
}

common::BoundingSphere Model::boundingSphere() const
{
    return m_sphere;
}

MeshStats Model::stats() const
{
    MeshStats result;
    result.triangleCount = triangleCount();
    result.vertexCount = vertexCount();
    result.extent = m_bounds.size();
    result.center = m_bounds.center();
    result.min = m_bounds.min;
    result.max = m_bounds.max;
    return result;
}

void Model::updateBounds()
{
    m_bounds = common::Bounds{};
    m_sphere = common::BoundingSphere{};
    if (m_positions.empty())
    {
        return;
    }

    QVector3D minPoint(std::numeric_limits<float>::max(),
                       std::numeric_limits<float>::max(),
                       std::numeric_limits<float>::max());
    QVector3D maxPoint(std::numeric_limits<float>::lowest(),
                       std::numeric_limits<float>::lowest(),
                       std::numeric_limits<float>::lowest());

    for (const QVector3D& position : m_positions)
    {
        minPoint.setX(std::min(minPoint.x(), position.x()));
        minPoint.setY(std::min(minPoint.y(), position.y()));
        minPoint.setZ(std::min(minPoint.z(), position.z()));

        maxPoint.setX(std::max(maxPoint.x(), position.x()));
        maxPoint.setY(std::max(maxPoint.y(), position.y()));
        maxPoint.setZ(std::max(maxPoint.z(), position.z()));
    }

    m_bounds.min = minPoint;
    m_bounds.max = maxPoint;

    m_sphere.center = m_bounds.center();
    float maxDistanceSq = 0.0f;
    for (const QVector3D& position : m_positions)
    {
        maxDistanceSq = std::max(maxDistanceSq, (position - m_sphere.center).lengthSquared());
    }
    m_sphere.radius = std::sqrt(maxDistanceSq);
}

} // namespace mesh
