#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "io/StlReader.h"
#include "test_helpers.h"

#include <QtCore/QByteArray>

#include <vector>

using test_helpers::Facet;

namespace
{

std::vector<Facet> sampleFacets()
{
    return {
        Facet{{0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f}, {10.0f, 0.0f, 0.0f}, {10.0f, 10.0f, 0.0f}},
        Facet{{0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f}, {10.0f, 10.0f, 0.0f}, {0.0f, 10.0f, 0.0f}},
        Facet{{1.0f, 0.0f, 0.0f}, {10.0f, 0.0f, 0.0f}, {10.0f, 10.0f, 0.0f}, {10.0f, 5.0f, 4.5f}},
    };
}

void checkMatchesFacets(const mesh::Model& model, const std::vector<Facet>& facets)
{
    REQUIRE(model.triangleCount() == facets.size());
    REQUIRE(model.vertexCount() == facets.size() * 3);
    REQUIRE(model.normals().size() == facets.size() * 3);
    for (std::size_t i = 0; i < facets.size(); ++i)
    {
        const mesh::Triangle tri = model.triangle(i);
        CHECK(tri.v0 == facets[i].v0);
        CHECK(tri.v1 == facets[i].v1);
        CHECK(tri.v2 == facets[i].v2);
        CHECK(tri.normal == facets[i].normal);
        for (std::size_t v = 0; v < 3; ++v)
        {
            CHECK(model.normals()[i * 3 + v] == facets[i].normal);
        }
    }
}

} // namespace

TEST_CASE("Binary STL decodes vertices and replicates each facet normal")
{
    const auto facets = sampleFacets();
    const QByteArray data = test_helpers::makeBinaryStl(facets);
    REQUIRE(data.size() == 84 + 3 * 50);

    const mesh::Model model = io::StlReader::read(data);
    checkMatchesFacets(model, facets);

    const mesh::MeshStats stats = model.stats();
    CHECK(stats.triangleCount == 3);
    CHECK(stats.vertexCount == 9);
    CHECK(stats.min == QVector3D(0.0f, 0.0f, 0.0f));
    CHECK(stats.max == QVector3D(10.0f, 10.0f, 4.5f));
    CHECK(stats.extent == QVector3D(10.0f, 10.0f, 4.5f));
    CHECK(stats.center == QVector3D(5.0f, 5.0f, 2.25f));
}

TEST_CASE("Header text is ignored even when it starts with 'solid'")
{
    const auto facets = sampleFacets();
    const QByteArray data = test_helpers::makeBinaryStl(facets, "solid exported_by_cad");

    CHECK(io::StlReader::detectEncoding(data) == io::StlEncoding::Binary);
    checkMatchesFacets(io::StlReader::read(data), facets);
}

TEST_CASE("Encoding is binary exactly when the length matches the declared count")
{
    for (std::size_t count : {0u, 1u, 2u, 7u})
    {
        std::vector<Facet> facets(count, sampleFacets().front());
        QByteArray data = test_helpers::makeBinaryStl(facets);
        CAPTURE(count);
        CHECK(io::StlReader::detectEncoding(data) == io::StlEncoding::Binary);

        QByteArray longer = data;
        longer.append('\n');
        CHECK(io::StlReader::detectEncoding(longer) == io::StlEncoding::Ascii);

        QByteArray shorter = data;
        shorter.chop(1);
        CHECK(io::StlReader::detectEncoding(shorter) == io::StlEncoding::Ascii);
    }

    CHECK(io::StlReader::detectEncoding(QByteArray()) == io::StlEncoding::Ascii);
    CHECK(io::StlReader::detectEncoding(QByteArray(83, '\0')) == io::StlEncoding::Ascii);
}

TEST_CASE("Binary STL with zero triangles yields an empty model")
{
    const QByteArray data = test_helpers::makeBinaryStl({});
    const mesh::Model model = io::StlReader::read(data);
    CHECK(model.triangleCount() == 0);
    CHECK_FALSE(model.isValid());
}

TEST_CASE("ASCII STL yields the same geometry as its binary twin")
{
    const auto facets = sampleFacets();
    const mesh::Model fromAscii = io::StlReader::read(test_helpers::makeAsciiStl(facets));
    const mesh::Model fromBinary = io::StlReader::read(test_helpers::makeBinaryStl(facets));

    checkMatchesFacets(fromAscii, facets);
    CHECK(fromAscii.positions() == fromBinary.positions());
    CHECK(fromAscii.normals() == fromBinary.normals());
}

TEST_CASE("ASCII STL tolerates CRLF line endings, tabs and extra blanks")
{
    const QByteArray text =
        "solid messy\r\n"
        "\tfacet   normal 0 0 1\r\n"
        "  outer loop\r\n"
        "     vertex  0 0 0\r\n"
        "vertex 1\t0  0\r\n"
        "   vertex 0 1 0   \r\n"
        "  endloop\r\n"
        " endfacet\r\n"
        "endsolid messy\r\n";

    const mesh::Model model = io::StlReader::readAscii(text);
    REQUIRE(model.triangleCount() == 1);
    const mesh::Triangle tri = model.triangle(0);
    CHECK(tri.v1 == QVector3D(1.0f, 0.0f, 0.0f));
    CHECK(tri.v2 == QVector3D(0.0f, 1.0f, 0.0f));
    CHECK(tri.normal == QVector3D(0.0f, 0.0f, 1.0f));
}

TEST_CASE("ASCII vertices before any facet normal are kept without normals")
{
    const QByteArray text =
        "solid bare\n"
        "vertex 0 0 0\n"
        "vertex 1 0 0\n"
        "vertex 0 1 0\n"
        "endsolid bare\n";

    const mesh::Model model = io::StlReader::readAscii(text);
    CHECK(model.triangleCount() == 1);
    CHECK(model.normals().empty());
    CHECK(model.triangle(0).normal == QVector3D());
}

TEST_CASE("ASCII STL with a trailing partial facet ignores the leftover vertices")
{
    const QByteArray text =
        "solid partial\n"
        "facet normal 0 0 1\n"
        "vertex 0 0 0\n"
        "vertex 1 0 0\n"
        "vertex 0 1 0\n"
        "facet normal 0 0 1\n"
        "vertex 5 5 5\n"
        "endsolid partial\n";

    const mesh::Model model = io::StlReader::readAscii(text);
    CHECK(model.vertexCount() == 4);
    CHECK(model.triangleCount() == 1);
}

TEST_CASE("Malformed ASCII numbers raise ParseError")
{
    SUBCASE("non-numeric vertex field")
    {
        const QByteArray text = "solid bad\nfacet normal 0 0 1\nvertex 0 zero 0\nendsolid bad\n";
        CHECK_THROWS_AS(io::StlReader::read(text), io::ParseError);
    }
    SUBCASE("missing vertex field")
    {
        const QByteArray text = "solid bad\nvertex 0 0\nendsolid bad\n";
        CHECK_THROWS_AS(io::StlReader::readAscii(text), io::ParseError);
    }
    SUBCASE("malformed normal")
    {
        const QByteArray text = "solid bad\nfacet normal 0 0 up\nendsolid bad\n";
        CHECK_THROWS_AS(io::StlReader::readAscii(text), io::ParseError);
    }
}

TEST_CASE("ParseError reports the offending line number")
{
    const QByteArray text = "solid bad\nfacet normal 0 0 1\nvertex 0 0 0\nvertex 1 x 0\n";
    try
    {
        (void)io::StlReader::readAscii(text);
        FAIL("expected ParseError");
    }
    catch (const io::ParseError& e)
    {
        CHECK(std::string(e.what()).find("line 4") != std::string::npos);
    }
}

TEST_CASE("Truncated binary data raises ParseError when decoded as binary")
{
    QByteArray data = test_helpers::makeBinaryStl(sampleFacets());
    data.chop(60);
    CHECK_THROWS_AS(io::StlReader::readBinary(data), io::ParseError);
    CHECK_THROWS_AS(io::StlReader::readBinary(QByteArray(40, '\0')), io::ParseError);
}

TEST_CASE("Reading a cut-short binary stream reports the missing records")
{
    QByteArray data = test_helpers::makeBinaryStl(sampleFacets());
    data.chop(60);
    REQUIRE(io::StlReader::detectEncoding(data) == io::StlEncoding::Ascii);

    try
    {
        (void)io::StlReader::read(data);
        FAIL("expected ParseError");
    }
    catch (const io::ParseError& e)
    {
        const std::string message = e.what();
        CHECK(message.find("declares 3 triangles") != std::string::npos);
        CHECK(message.find("only 174 bytes") != std::string::npos);
    }
}

TEST_CASE("Text without geometry is not mistaken for a cut-short binary")
{
    const mesh::Model model = io::StlReader::read(QByteArray("solid empty\nendsolid empty\n"));
    CHECK(model.vertexCount() == 0);
}

TEST_CASE("Bounding sphere encloses every vertex")
{
    const mesh::Model model = io::StlReader::read(test_helpers::makeBinaryStl(sampleFacets()));
    const common::BoundingSphere sphere = model.boundingSphere();
    CHECK(sphere.center == QVector3D(5.0f, 5.0f, 2.25f));
    for (const QVector3D& p : model.positions())
    {
        CHECK((p - sphere.center).length() <= sphere.radius + 1e-4f);
    }
}
