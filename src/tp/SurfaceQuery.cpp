#include "tp/SurfaceQuery.h"

#include "common/log.h"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>

namespace tp
{

namespace
{

constexpr double kParallelEpsilon = 1e-15;
constexpr double kBarycentricEpsilon = 1e-9;

// Grid cells sized from the triangle count keep each cell to a handful of candidates.
constexpr double kAutoCellSize = 0.0;

} // namespace

SurfaceQuery::SurfaceQuery(const mesh::Model& model)
    : m_grid(model, kAutoCellSize)
{
    m_candidates.reserve(64);
    m_hits.reserve(16);

    if (m_grid.degenerateCount() > 0)
    {
        STLCAM_LOG_INFO(Tp, QStringLiteral("SurfaceQuery: skipped %1 degenerate triangles")
                         .arg(static_cast<qulonglong>(m_grid.degenerateCount())));
    }
    STLCAM_LOG_INFO(Tp, QStringLiteral("SurfaceQuery: %1 triangles in %2x%3 cells")
                     .arg(static_cast<qulonglong>(m_grid.triangleCount()))
                     .arg(m_grid.cellsX())
                     .arg(m_grid.cellsY()));
}

// Möller–Trumbore specialised for the direction (0, 0, -1); both windings hit.
bool SurfaceQuery::intersectDown(const TriangleGrid::Triangle& tri,
                                 double x,
                                 double y,
                                 double originZ,
                                 double& distanceOut,
                                 double& zOut)
{
    const glm::dvec3 direction{0.0, 0.0, -1.0};
    const glm::dvec3 pvec = glm::cross(direction, tri.edge2);
    const double det = glm::dot(tri.edge1, pvec);
    if (std::abs(det) <= kParallelEpsilon)
    {
        return false;
    }

    const double invDet = 1.0 / det;
    const glm::dvec3 tvec = glm::dvec3{x, y, originZ} - tri.v0;
    const double u = glm::dot(tvec, pvec) * invDet;
    if (u < -kBarycentricEpsilon || u > 1.0 + kBarycentricEpsilon)
    {
        return false;
    }

    const glm::dvec3 qvec = glm::cross(tvec, tri.edge1);
    const double v = glm::dot(direction, qvec) * invDet;
    if (v < -kBarycentricEpsilon || u + v > 1.0 + kBarycentricEpsilon)
    {
        return false;
    }

    const double t = glm::dot(tri.edge2, qvec) * invDet;
    if (t < 0.0)
    {
        return false;
    }

    distanceOut = t;
    // Interpolating the corners keeps flat facets at their exact height.
    zOut = tri.v0.z + u * tri.edge1.z + v * tri.edge2.z;
    return true;
}

std::optional<double> SurfaceQuery::heightAt(double x, double y, double ceilingZ, double floorZ) const
{
    m_grid.gatherCandidatesXY(x, y, m_candidates);
    if (m_candidates.empty())
    {
        return std::nullopt;
    }

    const double originZ = ceilingZ + kRayMargin;
    m_hits.clear();
    for (const std::uint32_t index : m_candidates)
    {
        const TriangleGrid::Triangle& tri = m_grid.triangle(index);
        if (x < tri.bboxMin.x - kBarycentricEpsilon || x > tri.bboxMax.x + kBarycentricEpsilon
            || y < tri.bboxMin.y - kBarycentricEpsilon || y > tri.bboxMax.y + kBarycentricEpsilon
            || tri.minZ > originZ)
        {
            continue;
        }

        Hit hit;
        hit.triangle = index;
        if (intersectDown(tri, x, y, originZ, hit.distance, hit.z))
        {
            m_hits.push_back(hit);
        }
    }

    std::sort(m_hits.begin(), m_hits.end(), [](const Hit& lhs, const Hit& rhs) {
        if (lhs.distance != rhs.distance)
        {
            return lhs.distance < rhs.distance;
        }
        return lhs.triangle < rhs.triangle;
    });

    for (const Hit& hit : m_hits)
    {
        if (hit.z <= ceilingZ && hit.z >= floorZ)
        {
            return hit.z;
        }
    }
    return std::nullopt;
}

} // namespace tp
