#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tp/SurfaceQuery.h"
#include "tp/TriangleGrid.h"
#include "test_helpers.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

using test_helpers::Facet;

namespace
{

mesh::Model stackedPlates()
{
    std::vector<Facet> facets = test_helpers::plateFacets(10.0f, 0.0f);
    const std::vector<Facet> upper = test_helpers::plateFacets(5.0f, 2.0f);
    facets.insert(facets.end(), upper.begin(), upper.end());
    return test_helpers::makeModel(facets);
}

} // namespace

TEST_CASE("Flat plate answers its height anywhere inside its footprint")
{
    const mesh::Model plate = test_helpers::makePlateModel(10.0f, 0.0f);
    const tp::SurfaceQuery query(plate);
    CHECK(query.triangleCount() == 2);

    const std::vector<std::pair<double, double>> samples{{0.0, 0.0}, {3.3, -2.1}, {-9.9, 9.9}, {7.0, 7.0}};
    for (const auto& sample : samples)
    {
        CAPTURE(sample.first);
        CAPTURE(sample.second);
        const std::optional<double> z = query.heightAt(sample.first, sample.second, 5.0, -5.0);
        REQUIRE(z.has_value());
        CHECK(*z == doctest::Approx(0.0));
    }
}

TEST_CASE("Points on the shared diagonal and on the rim are hit")
{
    const mesh::Model plate = test_helpers::makePlateModel(10.0f, 1.5f);
    const tp::SurfaceQuery query(plate);

    const auto onDiagonal = query.heightAt(2.5, 2.5, 5.0, 0.0);
    REQUIRE(onDiagonal.has_value());
    CHECK(*onDiagonal == doctest::Approx(1.5));

    const auto onRim = query.heightAt(10.0, 0.0, 5.0, 0.0);
    REQUIRE(onRim.has_value());
    CHECK(*onRim == doctest::Approx(1.5));
}

TEST_CASE("No height outside the mesh footprint")
{
    const mesh::Model plate = test_helpers::makePlateModel(10.0f, 0.0f);
    const tp::SurfaceQuery query(plate);
    CHECK_FALSE(query.heightAt(50.0, 50.0, 5.0, -5.0).has_value());
    CHECK_FALSE(query.heightAt(10.5, 0.0, 5.0, -5.0).has_value());
}

TEST_CASE("Hits outside the Z window are discarded")
{
    const mesh::Model plate = test_helpers::makePlateModel(10.0f, 0.0f);
    const tp::SurfaceQuery query(plate);

    CHECK_FALSE(query.heightAt(0.0, 0.0, -1.0, -5.0).has_value());
    CHECK_FALSE(query.heightAt(0.0, 0.0, 5.0, 1.0).has_value());

    const auto atCeiling = query.heightAt(0.0, 0.0, 0.0, -5.0);
    REQUIRE(atCeiling.has_value());
    CHECK(*atCeiling == doctest::Approx(0.0));

    const auto atFloor = query.heightAt(0.0, 0.0, 5.0, 0.0);
    REQUIRE(atFloor.has_value());
    CHECK(*atFloor == doctest::Approx(0.0));
}

TEST_CASE("Stacked surfaces report the first hit inside the window")
{
    const mesh::Model model = stackedPlates();
    const tp::SurfaceQuery query(model);

    const auto both = query.heightAt(0.0, 0.0, 5.0, -1.0);
    REQUIRE(both.has_value());
    CHECK(*both == doctest::Approx(2.0));

    // The upper plate lies above this ceiling, so the ray falls through to the lower one.
    const auto belowUpper = query.heightAt(0.0, 0.0, 1.0, -1.0);
    REQUIRE(belowUpper.has_value());
    CHECK(*belowUpper == doctest::Approx(0.0));

    // Only the lower plate covers (8, 8).
    const auto outerRing = query.heightAt(8.0, 8.0, 5.0, -1.0);
    REQUIRE(outerRing.has_value());
    CHECK(*outerRing == doctest::Approx(0.0));
}

TEST_CASE("Sloped triangles are interpolated")
{
    // z = 0.5 * x over the triangle (0,0) (4,0) (4,4)
    const mesh::Model ramp = test_helpers::makeModel({
        Facet{{-0.447f, 0.0f, 0.894f}, {0.0f, 0.0f, 0.0f}, {4.0f, 0.0f, 2.0f}, {4.0f, 4.0f, 2.0f}},
    });
    const tp::SurfaceQuery query(ramp);

    const auto z = query.heightAt(2.0, 1.0, 10.0, -10.0);
    REQUIRE(z.has_value());
    CHECK(*z == doctest::Approx(1.0));

    const auto z2 = query.heightAt(3.5, 0.5, 10.0, -10.0);
    REQUIRE(z2.has_value());
    CHECK(*z2 == doctest::Approx(1.75));
}

TEST_CASE("Winding order does not matter")
{
    const QVector3D down(0.0f, 0.0f, -1.0f);
    const mesh::Model flipped = test_helpers::makeModel({
        Facet{down, {-5.0f, -5.0f, 3.0f}, {5.0f, 5.0f, 3.0f}, {5.0f, -5.0f, 3.0f}},
    });
    const tp::SurfaceQuery query(flipped);

    const auto z = query.heightAt(2.0, -1.0, 10.0, 0.0);
    REQUIRE(z.has_value());
    CHECK(*z == doctest::Approx(3.0));
}

TEST_CASE("Degenerate triangles are dropped without affecting queries")
{
    std::vector<Facet> facets = test_helpers::plateFacets(10.0f, 0.0f);
    facets.push_back(Facet{{0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 4.0f}, {1.0f, 1.0f, 4.0f}, {2.0f, 2.0f, 4.0f}});
    facets.push_back(Facet{{0.0f, 0.0f, 1.0f}, {3.0f, 3.0f, 4.0f}, {3.0f, 3.0f, 4.0f}, {3.0f, 3.0f, 4.0f}});
    const mesh::Model model = test_helpers::makeModel(facets);

    const tp::SurfaceQuery query(model);
    CHECK(query.triangleCount() == 2);
    CHECK(query.degenerateCount() == 2);

    const auto z = query.heightAt(1.0, 1.0, 10.0, -1.0);
    REQUIRE(z.has_value());
    CHECK(*z == doctest::Approx(0.0));
}

TEST_CASE("Grid cells return every triangle whose footprint covers the query")
{
    const mesh::Model model = stackedPlates();
    const tp::TriangleGrid grid(model, 1.0);
    CHECK(grid.triangleCount() == 4);
    CHECK(grid.cellsX() >= 1);
    CHECK(grid.cellsY() >= 1);

    std::vector<std::uint32_t> candidates;
    grid.gatherCandidatesXY(0.1, 0.2, candidates);
    CHECK(candidates.size() >= 2);
    CHECK(std::is_sorted(candidates.begin(), candidates.end()));

    grid.gatherCandidatesXY(40.0, 0.0, candidates);
    CHECK(candidates.empty());
}
