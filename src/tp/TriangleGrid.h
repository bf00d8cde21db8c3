#pragma once

#include "mesh/Model.h"

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tp
{

// Buckets mesh triangles by their XY footprint so a vertical ray only visits the
// triangles whose box covers the ray's (x, y).
class TriangleGrid
{
public:
    struct Triangle
    {
        glm::dvec3 v0{0.0};
        glm::dvec3 edge1{0.0};
        glm::dvec3 edge2{0.0};
        glm::dvec2 bboxMin{0.0};
        glm::dvec2 bboxMax{0.0};
        double minZ{0.0};
        double maxZ{0.0};
        std::uint32_t sourceIndex{0};
    };

    TriangleGrid() = default;
    TriangleGrid(const mesh::Model& model, double targetCellSizeMm);

    void build(const mesh::Model& model, double targetCellSizeMm);

    [[nodiscard]] bool empty() const noexcept { return m_triangles.empty(); }
    [[nodiscard]] std::size_t triangleCount() const noexcept { return m_triangles.size(); }
    [[nodiscard]] std::size_t degenerateCount() const noexcept { return m_degenerateCount; }
    [[nodiscard]] const Triangle& triangle(std::uint32_t index) const { return m_triangles[index]; }

    [[nodiscard]] const glm::dvec2& boundsMin() const noexcept { return m_boundsMin; }
    [[nodiscard]] const glm::dvec2& boundsMax() const noexcept { return m_boundsMax; }
    [[nodiscard]] int cellsX() const noexcept { return m_cellsX; }
    [[nodiscard]] int cellsY() const noexcept { return m_cellsY; }

    // Fills `out` with the triangles of the cell holding (x, y), in ascending index order.
    void gatherCandidatesXY(double x, double y, std::vector<std::uint32_t>& out) const;

private:
    struct CellRange
    {
        std::uint32_t offset{0};
        std::uint32_t count{0};
    };

    [[nodiscard]] static int clampIndex(int value, int maxExclusive);
    [[nodiscard]] int cellX(double x) const;
    [[nodiscard]] int cellY(double y) const;
    void reset();

    std::vector<Triangle> m_triangles;
    std::size_t m_degenerateCount{0};
    glm::dvec2 m_boundsMin{0.0};
    glm::dvec2 m_boundsMax{0.0};
    int m_cellsX{1};
    int m_cellsY{1};
    double m_invCellSizeX{0.0};
    double m_invCellSizeY{0.0};
    std::vector<CellRange> m_cellRanges;
    std::vector<std::uint32_t> m_cellIndices;
};

} // namespace tp
