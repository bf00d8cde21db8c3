#include "tp/TriangleGrid.h"

#include "common/math.h"

#include <glm/common.hpp>
#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace
{

constexpr double kEpsilon = 1e-9;
constexpr double kDegenerateAreaSq = 1e-24;
constexpr double kCellPad = 1e-6;
constexpr int kMaxCellsPerAxis = 2048;

} // namespace

namespace tp
{

TriangleGrid::TriangleGrid(const mesh::Model& model, double targetCellSizeMm)
{
    build(model, targetCellSizeMm);
}

void TriangleGrid::reset()
{
    m_triangles.clear();
    m_cellRanges.clear();
    m_cellIndices.clear();
    m_degenerateCount = 0;
    m_boundsMin = glm::dvec2(0.0);
    m_boundsMax = glm::dvec2(0.0);
    m_cellsX = 1;
    m_cellsY = 1;
    m_invCellSizeX = 0.0;
    m_invCellSizeY = 0.0;
}

void TriangleGrid::build(const mesh::Model& model, double targetCellSizeMm)
{
    reset();

    const std::size_t sourceCount = model.triangleCount();
    m_triangles.reserve(sourceCount);

    glm::dvec2 boundsMin(std::numeric_limits<double>::max());
    glm::dvec2 boundsMax(std::numeric_limits<double>::lowest());

    for (std::size_t i = 0; i < sourceCount; ++i)
    {
        const mesh::Triangle source = model.triangle(i);
        const glm::dvec3 v0 = common::toDVec3(source.v0);
        const glm::dvec3 v1 = common::toDVec3(source.v1);
        const glm::dvec3 v2 = common::toDVec3(source.v2);

        Triangle tri;
        tri.v0 = v0;
        tri.edge1 = v1 - v0;
        tri.edge2 = v2 - v0;

        const glm::dvec3 areaVector = glm::cross(tri.edge1, tri.edge2);
        if (!(glm::dot(areaVector, areaVector) > kDegenerateAreaSq))
        {
            ++m_degenerateCount;
            continue;
        }

        const glm::dvec3 lo = glm::min(glm::min(v0, v1), v2);
        const glm::dvec3 hi = glm::max(glm::max(v0, v1), v2);
        tri.bboxMin = glm::dvec2(lo.x, lo.y);
        tri.bboxMax = glm::dvec2(hi.x, hi.y);
        tri.minZ = lo.z;
        tri.maxZ = hi.z;
        tri.sourceIndex = static_cast<std::uint32_t>(i);

        boundsMin = glm::min(boundsMin, tri.bboxMin);
        boundsMax = glm::max(boundsMax, tri.bboxMax);
        m_triangles.push_back(tri);
    }

    if (m_triangles.empty())
    {
        return;
    }

    m_boundsMin = boundsMin;
    m_boundsMax = boundsMax;

    const double spanX = std::max(m_boundsMax.x - m_boundsMin.x, kEpsilon);
    const double spanY = std::max(m_boundsMax.y - m_boundsMin.y, kEpsilon);

    if (targetCellSizeMm > kEpsilon)
    {
        m_cellsX = static_cast<int>(std::ceil(spanX / targetCellSizeMm));
        m_cellsY = static_cast<int>(std::ceil(spanY / targetCellSizeMm));
    }
    else
    {
        const double approx = std::sqrt(static_cast<double>(m_triangles.size()));
        const int base = std::max(1, static_cast<int>(std::round(approx)));
        const double aspect = spanX / spanY;
        if (aspect >= 1.0)
        {
            m_cellsX = base;
            m_cellsY = static_cast<int>(std::round(base / aspect));
        }
        else
        {
            m_cellsY = base;
            m_cellsX = static_cast<int>(std::round(base * aspect));
        }
    }

    m_cellsX = std::clamp(m_cellsX, 1, kMaxCellsPerAxis);
    m_cellsY = std::clamp(m_cellsY, 1, kMaxCellsPerAxis);
    m_invCellSizeX = static_cast<double>(m_cellsX) / spanX;
    m_invCellSizeY = static_cast<double>(m_cellsY) / spanY;

    const std::size_t cellCount = static_cast<std::size_t>(m_cellsX) * static_cast<std::size_t>(m_cellsY);
    std::vector<std::uint32_t> cellCounts(cellCount, 0);

    // Two passes over the same footprints: count, then scatter into one flat index array.
    const auto forEachCell = [&](const Triangle& tri, auto&& visit) {
        const int ixMin = cellX(tri.bboxMin.x - kCellPad);
        const int ixMax = cellX(tri.bboxMax.x + kCellPad);
        const int iyMin = cellY(tri.bboxMin.y - kCellPad);
        const int iyMax = cellY(tri.bboxMax.y + kCellPad);
        for (int iy = iyMin; iy <= iyMax; ++iy)
        {
            for (int ix = ixMin; ix <= ixMax; ++ix)
            {
                visit(static_cast<std::size_t>(iy) * static_cast<std::size_t>(m_cellsX)
                      + static_cast<std::size_t>(ix));
            }
        }
    };

    for (const Triangle& tri : m_triangles)
    {
        forEachCell(tri, [&](std::size_t cell) { ++cellCounts[cell]; });
    }

    std::vector<std::uint32_t> offsets(cellCount, 0);
    std::exclusive_scan(cellCounts.begin(), cellCounts.end(), offsets.begin(), 0u);

    m_cellIndices.resize(offsets.back() + cellCounts.back());
    m_cellRanges.resize(cellCount);

    std::vector<std::uint32_t> writeCursor = offsets;
    for (std::uint32_t triIndex = 0; triIndex < static_cast<std::uint32_t>(m_triangles.size()); ++triIndex)
    {
        forEachCell(m_triangles[triIndex], [&](std::size_t cell) {
            m_cellIndices[writeCursor[cell]++] = triIndex;
        });
    }

    for (std::size_t cell = 0; cell < cellCount; ++cell)
    {
        m_cellRanges[cell] = CellRange{offsets[cell], cellCounts[cell]};
    }
}

int TriangleGrid::clampIndex(int value, int maxExclusive)
{
    if (maxExclusive <= 1 || value < 0)
    {
        return 0;
    }
    if (value >= maxExclusive)
    {
        return maxExclusive - 1;
    }
    return value;
}

int TriangleGrid::cellX(double x) const
{
    return clampIndex(static_cast<int>(std::floor((x - m_boundsMin.x) * m_invCellSizeX)), m_cellsX);
}

int TriangleGrid::cellY(double y) const
{
    return clampIndex(static_cast<int>(std::floor((y - m_boundsMin.y) * m_invCellSizeY)), m_cellsY);
}

void TriangleGrid::gatherCandidatesXY(double x, double y, std::vector<std::uint32_t>& out) const
{
    out.clear();
    if (m_triangles.empty())
    {
        return;
    }

    if (x < m_boundsMin.x - kCellPad || x > m_boundsMax.x + kCellPad || y < m_boundsMin.y - kCellPad
        || y > m_boundsMax.y + kCellPad)
    {
        return;
    }

    const std::size_t cell = static_cast<std::size_t>(cellY(y)) * static_cast<std::size_t>(m_cellsX)
                             + static_cast<std::size_t>(cellX(x));
    const CellRange& range = m_cellRanges[cell];
    const std::uint32_t* begin = m_cellIndices.data() + range.offset;
    out.assign(begin, begin + range.count);
}

} // namespace tp
