#pragma once

#include "common/math.h"

#include <QtCore/QString>
#include <QtGui/QVector3D>

#include <cstddef>
#include <vector>

namespace mesh
{

struct Triangle
{
    QVector3D v0;
    QVector3D v1;
    QVector3D v2;
    QVector3D normal;
};

struct MeshStats
{
    std::size_t triangleCount{0};
    std::size_t vertexCount{0};
    QVector3D extent;
    QVector3D center;
    QVector3D min;
    QVector3D max;
};

// Flat triangle soup: every three consecutive positions form one triangle. The
// normals buffer runs parallel to the positions but may be shorter when a text
// source lists vertices before any facet normal.
class Model
{
public:
    Model() = default;

    void setName(QString name);
    [[nodiscard]] const QString& name() const;

    void setMeshData(std::vector<QVector3D> positions, std::vector<QVector3D> normals);

    [[nodiscard]] const std::vector<QVector3D>& positions() const;
    [[nodiscard]] const std::vector<QVector3D>& normals() const;
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] std::size_t vertexCount() const noexcept { return m_positions.size(); }
    [[nodiscard]] std::size_t triangleCount() const noexcept { return m_positions.size() / 3; }
    [[nodiscard]] Triangle triangle(std::size_t index) const;

    [[nodiscard]] common::Bounds bounds() const;
    [[nodiscard]] common::BoundingSphere boundingSphere() const;
    [[nodiscard]] MeshStats stats() const;

private:
    void updateBounds();

    QString m_name;
    std::vector<QVector3D> m_positions;
    std::vector<QVector3D> m_normals;
    common::Bounds m_bounds;
    common::BoundingSphere m_sphere;
};

} // namespace mesh
