#include "io/StlReader.h"

#include "common/log.h"

#include <QtCore/QRegularExpression>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QtEndian>

#include <bit>
#include <optional>
#include <utility>
#include <vector>

namespace io
{

namespace
{

std::uint32_t readU32(const char* bytes)
{
    return qFromLittleEndian<quint32>(bytes);
}

float readF32(const char* bytes)
{
    return std::bit_cast<float>(readU32(bytes));
}

QVector3D readVector(const char* bytes)
{
    return {readF32(bytes), readF32(bytes + 4), readF32(bytes + 8)};
}

std::uint64_t expectedBinarySize(std::uint32_t triangleCount)
{
    return static_cast<std::uint64_t>(StlReader::kPreambleSize)
           + static_cast<std::uint64_t>(triangleCount) * StlReader::kRecordSize;
}

const QRegularExpression& fieldSeparator()
{
    static const QRegularExpression separator(QStringLiteral("\\s+"));
    return separator;
}

// Parses three numeric fields starting at `first`; the line number is 1-based.
QVector3D parseTriple(const QStringList& parts, int first, int lineNumber, const char* keyword)
{
    if (parts.size() < first + 3)
    {
        throw ParseError("ASCII STL line " + std::to_string(lineNumber) + ": '" + keyword
                         + "' expects three numeric fields.");
    }

    float values[3] = {0.0f, 0.0f, 0.0f};
    for (int i = 0; i < 3; ++i)
    {
        bool ok = false;
        values[i] = parts.at(first + i).toFloat(&ok);
        if (!ok)
        {
            throw ParseError("ASCII STL line " + std::to_string(lineNumber) + ": invalid number '"
                             + parts.at(first + i).toStdString() + "' in '" + keyword + "'.");
        }
    }
    return {values[0], values[1], values[2]};
}

} // namespace

const char* encodingName(StlEncoding encoding)
{
    switch (encoding)
    {
    case StlEncoding::Binary: return "binary";
    case StlEncoding::Ascii: return "ascii";
    }
    return "unknown";
}

StlEncoding StlReader::detectEncoding(const QByteArray& data)
{
    const auto size = static_cast<std::uint64_t>(data.size());
    if (size < kPreambleSize)
    {
        return StlEncoding::Ascii;
    }

    const std::uint32_t count = readU32(data.constData() + kHeaderSize);
    return (size == expectedBinarySize(count)) ? StlEncoding::Binary : StlEncoding::Ascii;
}

mesh::Model StlReader::read(const QByteArray& data)
{
    const StlEncoding encoding = detectEncoding(data);
    mesh::Model model = (encoding == StlEncoding::Binary) ? readBinary(data) : readAscii(data);

    // No text geometry and a header promising more records than the stream holds:
    // a binary file cut short, not an empty text file.
    const auto size = static_cast<std::uint64_t>(data.size());
    if (encoding == StlEncoding::Ascii && model.vertexCount() == 0 && size >= kPreambleSize)
    {
        const std::uint32_t count = readU32(data.constData() + kHeaderSize);
        const std::uint64_t required = expectedBinarySize(count);
        if (required > size)
        {
            throw ParseError("Binary STL declares " + std::to_string(count) + " triangles ("
                             + std::to_string(required) + " bytes) but only " + std::to_string(size)
                             + " bytes are available.");
        }
    }

    STLCAM_LOG_INFO(Io, QStringLiteral("STL parsed as %1: %2 triangles, %3 vertices")
                     .arg(QString::fromLatin1(encodingName(encoding)))
                     .arg(static_cast<qulonglong>(model.triangleCount()))
                     .arg(static_cast<qulonglong>(model.vertexCount())));
    return model;
}

mesh::Model StlReader::readBinary(const QByteArray& data)
{
    const auto size = static_cast<std::uint64_t>(data.size());
    if (size < kPreambleSize)
    {
        throw ParseError("Binary STL is " + std::to_string(size) + " bytes, shorter than the "
                         + std::to_string(kPreambleSize) + "-byte header.");
    }

    const char* bytes = data.constData();
    const std::uint32_t count = readU32(bytes + kHeaderSize);
    const std::uint64_t required = expectedBinarySize(count);
    if (size < required)
    {
        throw ParseError("Binary STL declares " + std::to_string(count) + " triangles ("
                         + std::to_string(required) + " bytes) but only " + std::to_string(size)
                         + " bytes are available.");
    }

    std::vector<QVector3D> positions;
    std::vector<QVector3D> normals;
    positions.reserve(static_cast<std::size_t>(count) * 3);
    normals.reserve(static_cast<std::size_t>(count) * 3);

    const char* record = bytes + kPreambleSize;
    for (std::uint32_t i = 0; i < count; ++i, record += kRecordSize)
    {
        const QVector3D normal = readVector(record);
        for (int v = 0; v < 3; ++v)
        {
            positions.push_back(readVector(record + 12 + v * 12));
            normals.push_back(normal);
        }
        // Two attribute bytes trail every record and carry nothing we use.
    }

    mesh::Model model;
    model.setMeshData(std::move(positions), std::move(normals));
    return model;
}

mesh::Model StlReader::readAscii(const QByteArray& data)
{
    const QString text = QString::fromUtf8(data);
    const QStringList lines = text.split(QLatin1Char('\n'));

    std::vector<QVector3D> positions;
    std::vector<QVector3D> normals;
    std::optional<QVector3D> currentNormal;

    int lineNumber = 0;
    for (const QString& rawLine : lines)
    {
        ++lineNumber;
        const QString line = rawLine.trimmed();

        if (line.startsWith(QLatin1String("facet normal")))
        {
            const QStringList parts = line.split(fieldSeparator(), Qt::SkipEmptyParts);
            currentNormal = parseTriple(parts, 2, lineNumber, "facet normal");
        }
        else if (line.startsWith(QLatin1String("vertex")))
        {
            const QStringList parts = line.split(fieldSeparator(), Qt::SkipEmptyParts);
            positions.push_back(parseTriple(parts, 1, lineNumber, "vertex"));
            if (currentNormal)
            {
                normals.push_back(*currentNormal);
            }
        }
    }

    if (normals.size() != positions.size())
    {
        STLCAM_LOG_WARN(Io, QStringLiteral("ASCII STL lists %1 vertices but only %2 carry a facet normal")
                         .arg(static_cast<qulonglong>(positions.size()))
                         .arg(static_cast<qulonglong>(normals.size())));
    }
    if (positions.size() % 3 != 0)
    {
        STLCAM_LOG_WARN(Io, QStringLiteral("ASCII STL vertex count %1 is not a multiple of three; the trailing "
                                    "partial facet is ignored")
                         .arg(static_cast<qulonglong>(positions.size())));
    }

    mesh::Model model;
    model.setMeshData(std::move(positions), std::move(normals));
    return model;
}

} // namespace io
