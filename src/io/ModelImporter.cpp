#include "io/ModelImporter.h"

#include "common/Enforce.h"
#include "common/log.h"
#include "io/StlReader.h"

#include <assimp/Importer.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

#include <QtCore/QByteArray>
#include <QtCore/QFile>
#include <QtCore/QString>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <utility>
#include <vector>

namespace io
{

namespace
{

// Faces are expanded into a flat soup afterwards, so no vertex welding here.
constexpr unsigned int kPostProcessFlags =
    aiProcess_Triangulate |
    aiProcess_PreTransformVertices |
    aiProcess_SortByPType;

constexpr std::uintmax_t kMaxFileSizeBytes = 200 * 1024ull * 1024ull; // 200 MB
constexpr std::size_t kMaxTriangleCount = 5'000'000; // guard against runaway imports

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUtf8Path(const std::filesystem::path& path)
{
    const auto utf8Raw = path.u8string();
    std::string utf8Path;
    utf8Path.reserve(utf8Raw.size());
    for (char8_t ch : utf8Raw)
    {
        utf8Path.push_back(static_cast<char>(ch));
    }
    return utf8Path;
}

QVector3D faceNormal(const QVector3D& a, const QVector3D& b, const QVector3D& c)
{
    QVector3D normal = QVector3D::crossProduct(b - a, c - a);
    if (normal.isNull())
    {
        return {0.0f, 0.0f, 1.0f};
    }
    normal.normalize();
    return normal;
}

bool loadStl(const std::filesystem::path& file, mesh::Model& outModel, std::string& error)
{
    QFile input(QString::fromStdString(toUtf8Path(file)));
    if (!input.open(QIODevice::ReadOnly))
    {
        error = "Unable to open file: " + input.errorString().toStdString();
        return false;
    }

    const QByteArray data = input.readAll();
    try
    {
        outModel = StlReader::read(data);
    }
    catch (const ParseError& parseError)
    {
        error = parseError.what();
        return false;
    }

    if (!outModel.isValid())
    {
        outModel = mesh::Model{};
        error = "Model contains no triangles.";
        return false;
    }
    return true;
}

bool loadWithAssimp(const std::filesystem::path& file, mesh::Model& outModel, std::string& error)
{
    Assimp::Importer importer;
    const aiScene* scene = importer.ReadFile(toUtf8Path(file), kPostProcessFlags);
    if (scene == nullptr || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) != 0 || !scene->HasMeshes())
    {
        const char* reason = importer.GetErrorString();
        error = (reason != nullptr && reason[0] != '\0') ? std::string("Assimp import failed: ") + reason
                                                        : "Assimp import produced no meshes.";
        return false;
    }

    std::vector<QVector3D> positions;
    std::vector<QVector3D> normals;

    for (unsigned int meshIndex = 0; meshIndex < scene->mNumMeshes; ++meshIndex)
    {
        const aiMesh* source = scene->mMeshes[meshIndex];
        if (source == nullptr || (source->mPrimitiveTypes & aiPrimitiveType_TRIANGLE) == 0)
        {
            continue;
        }

        for (unsigned int faceIndex = 0; faceIndex < source->mNumFaces; ++faceIndex)
        {
            const aiFace& face = source->mFaces[faceIndex];
            if (face.mNumIndices != 3)
            {
                continue;
            }

            QVector3D corners[3];
            for (unsigned int k = 0; k < 3; ++k)
            {
                const aiVector3D& p = source->mVertices[face.mIndices[k]];
                corners[k] = QVector3D(p.x, p.y, p.z);
            }

            const QVector3D normal = faceNormal(corners[0], corners[1], corners[2]);
            for (const QVector3D& corner : corners)
            {
                positions.push_back(corner);
                normals.push_back(normal);
            }

            if (positions.size() / 3 > kMaxTriangleCount)
            {
                error = "Mesh exceeds triangle safety limit (5M faces).";
                return false;
            }
        }
    }

    if (positions.empty())
    {
        error = "Model contains no triangles.";
        return false;
    }

    outModel.setMeshData(std::move(positions), std::move(normals));
    return true;
}

} // namespace

bool ModelImporter::load(const std::filesystem::path& file,
                         mesh::Model& outModel,
                         std::string& error) const
{
    namespace fs = std::filesystem;

    error.clear();
    STLCAM_ENFORCE(outModel.positions().empty(), "Destination model must be empty before import.");

    if (!fs::exists(file) || !fs::is_regular_file(file))
    {
        error = "File does not exist.";
        return false;
    }

    std::error_code ec;
    const std::uintmax_t fileSize = fs::file_size(file, ec);
    if (!ec && fileSize > kMaxFileSizeBytes)
    {
        error = "File too large for import safeguard (limit 200 MB).";
        return false;
    }

    const std::string extension = toLower(file.extension().string());

    bool ok = false;
    if (extension == ".stl")
    {
        ok = loadStl(file, outModel, error);
    }
    else if (extension == ".obj")
    {
        ok = loadWithAssimp(file, outModel, error);
    }
    else
    {
        error = "Unsupported file extension '" + extension + "' (expected .stl or .obj).";
    }

    if (ok && outModel.triangleCount() > kMaxTriangleCount)
    {
        outModel = mesh::Model{};
        error = "Mesh exceeds triangle safety limit (5M faces).";
        ok = false;
    }

    if (!ok)
    {
        STLCAM_LOG_WARN(Io, QStringLiteral("Import of %1 failed: %2")
                         .arg(QString::fromStdString(toUtf8Path(file)), QString::fromStdString(error)));
        return false;
    }

    outModel.setName(QString::fromStdString(toUtf8Path(file.filename())));
    STLCAM_LOG_INFO(Io, QStringLiteral("Imported %1 (%2 triangles)")
                     .arg(outModel.name())
                     .arg(static_cast<qulonglong>(outModel.triangleCount())));
    return true;
}

} // namespace io
