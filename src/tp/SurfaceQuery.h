#pragma once

#include "mesh/Model.h"
#include "tp/TriangleGrid.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tp
{

// Height-field sampling by vertical ray casting. A query is not reentrant: the
// scratch buffers are shared, so one instance serves one thread.
class SurfaceQuery
{
public:
    // Distance above the ceiling from which every ray starts.
    static constexpr double kRayMargin = 100.0;

    explicit SurfaceQuery(const mesh::Model& model);

    // Casts a ray downwards from (x, y, ceilingZ + kRayMargin), orders every hit by
    // distance from the origin and returns the Z of the first hit that lies within
    // [floorZ, ceilingZ]. This is the first in-range hit from above, not the highest
    // in-range hit.
    [[nodiscard]] std::optional<double> heightAt(double x, double y, double ceilingZ, double floorZ) const;

    [[nodiscard]] std::size_t triangleCount() const noexcept { return m_grid.triangleCount(); }
    [[nodiscard]] std::size_t degenerateCount() const noexcept { return m_grid.degenerateCount(); }

private:
    struct Hit
    {
        double distance{0.0};
        double z{0.0};
        std::uint32_t triangle{0};
    };

    [[nodiscard]] static bool intersectDown(const TriangleGrid::Triangle& tri,
                                            double x,
                                            double y,
                                            double originZ,
                                            double& distanceOut,
                                            double& zOut);

    TriangleGrid m_grid;
    mutable std::vector<std::uint32_t> m_candidates;
    mutable std::vector<Hit> m_hits;
};

} // namespace tp
