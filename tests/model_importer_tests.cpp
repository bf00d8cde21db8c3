#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "io/ModelImporter.h"
#include "test_helpers.h"

#include <QtCore/QByteArray>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

#include <filesystem>
#include <string>

namespace
{

std::filesystem::path writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& contents)
{
    const QString filePath = dir.filePath(name);
    QFile file(filePath);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(contents) == contents.size());
    file.close();
    return std::filesystem::path(filePath.toStdString());
}

} // namespace

TEST_CASE("Binary STL files import with their file name")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto file = writeFile(dir, QStringLiteral("plate.stl"),
                                test_helpers::makeBinaryStl(test_helpers::plateFacets(10.0f, 0.0f)));

    io::ModelImporter importer;
    mesh::Model model;
    std::string error;
    REQUIRE(importer.load(file, model, error));
    CHECK(error.empty());
    CHECK(model.name() == QStringLiteral("plate.stl"));
    CHECK(model.triangleCount() == 2);
    CHECK(model.bounds().min == QVector3D(-10.0f, -10.0f, 0.0f));
    CHECK(model.bounds().max == QVector3D(10.0f, 10.0f, 0.0f));
}

TEST_CASE("ASCII STL files import regardless of extension case")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto file = writeFile(dir, QStringLiteral("PLATE.STL"),
                                test_helpers::makeAsciiStl(test_helpers::plateFacets(5.0f, 1.0f)));

    io::ModelImporter importer;
    mesh::Model model;
    std::string error;
    REQUIRE(importer.load(file, model, error));
    CHECK(model.triangleCount() == 2);
    CHECK(model.bounds().max.z() == doctest::Approx(1.0));
}

TEST_CASE("Malformed STL text is reported as an import error")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto file = writeFile(dir, QStringLiteral("broken.stl"),
                                QByteArray("solid broken\nfacet normal 0 0 1\nvertex 0 0 nope\nendsolid broken\n"));

    io::ModelImporter importer;
    mesh::Model model;
    std::string error;
    CHECK_FALSE(importer.load(file, model, error));
    CHECK(error.find("line 3") != std::string::npos);
    CHECK(model.triangleCount() == 0);
}

TEST_CASE("A cut-short binary STL fails to import")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QByteArray data = test_helpers::makeBinaryStl(test_helpers::plateFacets(10.0f, 0.0f));
    data.chop(30);
    const auto file = writeFile(dir, QStringLiteral("cut.stl"), data);

    io::ModelImporter importer;
    mesh::Model model;
    std::string error;
    CHECK_FALSE(importer.load(file, model, error));
    CHECK(error.find("declares 2 triangles") != std::string::npos);
    CHECK(model.triangleCount() == 0);
}

TEST_CASE("An STL without triangles fails to import")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto file = writeFile(dir, QStringLiteral("empty.stl"), test_helpers::makeBinaryStl({}));

    io::ModelImporter importer;
    mesh::Model model;
    std::string error;
    CHECK_FALSE(importer.load(file, model, error));
    CHECK(error == "Model contains no triangles.");
}

TEST_CASE("OBJ files are triangulated through assimp")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto file = writeFile(dir, QStringLiteral("quad.obj"),
                                QByteArray("o quad\n"
                                           "v 0 0 0\n"
                                           "v 4 0 0\n"
                                           "v 4 4 0\n"
                                           "v 0 4 0\n"
                                           "f 1 2 3 4\n"));

    io::ModelImporter importer;
    mesh::Model model;
    std::string error;
    REQUIRE_MESSAGE(importer.load(file, model, error), error);
    CHECK(model.name() == QStringLiteral("quad.obj"));
    CHECK(model.triangleCount() == 2);
    CHECK(model.normals().size() == model.vertexCount());
    CHECK(model.bounds().size() == QVector3D(4.0f, 4.0f, 0.0f));
}

TEST_CASE("Missing files and unsupported formats are rejected")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    io::ModelImporter importer;

    SUBCASE("missing file")
    {
        mesh::Model model;
        std::string error;
        CHECK_FALSE(importer.load(std::filesystem::path(dir.filePath(QStringLiteral("absent.stl")).toStdString()),
                                  model, error));
        CHECK(error == "File does not exist.");
    }

    SUBCASE("unsupported extension")
    {
        const auto file = writeFile(dir, QStringLiteral("part.ply"), QByteArray("ply\n"));
        mesh::Model model;
        std::string error;
        CHECK_FALSE(importer.load(file, model, error));
        CHECK(error.find(".ply") != std::string::npos);
    }
}
