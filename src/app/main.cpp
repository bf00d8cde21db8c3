#include "common/log.h"
#include "common/logging.h"
#include "io/ModelImporter.h"
#include "mesh/Model.h"
#include "tp/GCodeEmitter.h"
#include "tp/GCodeExporter.h"
#include "tp/MachiningParams.h"
#include "tp/PathGenerator.h"
#include "tp/SelectionVolume.h"

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QStringList>
#include <QtCore/QTextStream>

#include <glm/vec3.hpp>

#include <filesystem>
#include <exception>
#include <optional>
#include <string>

namespace
{

struct NumericOption
{
    QCommandLineOption option;
    std::optional<double> tp::MachiningParamsUpdate::*field;
};

std::optional<tp::SelectionVolume> parseSelection(const QString& text, QString& error)
{
    const QStringList parts = text.split(QLatin1Char(','), Qt::SkipEmptyParts);
    if (parts.size() != 6)
    {
        error = QStringLiteral("--selection expects six comma-separated numbers, got \"%1\".").arg(text);
        return std::nullopt;
    }

    double values[6] = {};
    for (int i = 0; i < 6; ++i)
    {
        bool ok = false;
        values[i] = parts.at(i).trimmed().toDouble(&ok);
        if (!ok)
        {
            error = QStringLiteral("--selection value \"%1\" is not a number.").arg(parts.at(i));
            return std::nullopt;
        }
    }

    return tp::SelectionVolume::fromCorners(glm::dvec3(values[0], values[1], values[2]),
                                            glm::dvec3(values[3], values[4], values[5]));
}

QString formatVector(const QVector3D& v)
{
    return QStringLiteral("%1, %2, %3").arg(v.x(), 0, 'f', 3).arg(v.y(), 0, 'f', 3).arg(v.z(), 0, 'f', 3);
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("stlcam"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Generates a layered zig-zag milling program from an STL or OBJ mesh."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("mesh"), QStringLiteral("Input mesh (.stl or .obj)."));

    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Write the program to <file> instead of stdout."),
                                          QStringLiteral("file"));
    const QCommandLineOption paramsOption(QStringLiteral("params"),
                                          QStringLiteral("JSON file with machining parameters."),
                                          QStringLiteral("file"));
    const QCommandLineOption selectionOption(QStringLiteral("selection"),
                                             QStringLiteral("Selection box minX,minY,minZ,maxX,maxY,maxZ "
                                                            "(defaults to the mesh bounds)."),
                                             QStringLiteral("box"));
    const QCommandLineOption quietOption({QStringLiteral("q"), QStringLiteral("quiet")},
                                         QStringLiteral("Only log warnings and errors."));

    const NumericOption numericOptions[] = {
        {QCommandLineOption(QStringLiteral("tool-diameter"), QStringLiteral("Cutter diameter in mm."), QStringLiteral("mm")),
         &tp::MachiningParamsUpdate::toolDiameter},
        {QCommandLineOption(QStringLiteral("stepover"), QStringLiteral("Row spacing as a fraction of the diameter."), QStringLiteral("fraction")),
         &tp::MachiningParamsUpdate::stepoverFraction},
        {QCommandLineOption(QStringLiteral("stepdown"), QStringLiteral("Depth per layer in mm."), QStringLiteral("mm")),
         &tp::MachiningParamsUpdate::stepdown},
        {QCommandLineOption(QStringLiteral("feed-rate"), QStringLiteral("Cutting feed in mm/min."), QStringLiteral("mm/min")),
         &tp::MachiningParamsUpdate::feedRate},
        {QCommandLineOption(QStringLiteral("safe-z"), QStringLiteral("Clearance height for rapid moves in mm."), QStringLiteral("mm")),
         &tp::MachiningParamsUpdate::safeZ},
    };

    parser.addOption(outputOption);
    parser.addOption(paramsOption);
    parser.addOption(selectionOption);
    parser.addOption(quietOption);
    for (const NumericOption& numeric : numericOptions)
    {
        parser.addOption(numeric.option);
    }
    parser.process(app);

    common::initLogging(parser.isSet(quietOption) ? common::Verbosity::Quiet : common::Verbosity::Normal);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1)
    {
        STLCAM_LOG_ERR(App, "Exactly one input mesh is required.");
        return 1;
    }

    tp::MachiningParams params;
    if (parser.isSet(paramsOption))
    {
        tp::MachiningParamsUpdate fromFile;
        QStringList warnings;
        const bool loaded = tp::loadParamsUpdateFromFile(parser.value(paramsOption), fromFile, warnings);
        for (const QString& warning : warnings)
        {
            STLCAM_LOG_WARN(App, warning);
        }
        if (!loaded)
        {
            return 1;
        }
        params.merge(fromFile);
    }

    tp::MachiningParamsUpdate fromFlags;
    for (const NumericOption& numeric : numericOptions)
    {
        if (!parser.isSet(numeric.option))
        {
            continue;
        }
        bool ok = false;
        const double value = parser.value(numeric.option).toDouble(&ok);
        if (!ok)
        {
            STLCAM_LOG_ERR(App, QStringLiteral("--%1 expects a number.").arg(numeric.option.names().constFirst()));
            return 1;
        }
        fromFlags.*(numeric.field) = value;
    }
    params.merge(fromFlags);

    mesh::Model model;
    std::string importError;
    const io::ModelImporter importer;
    if (!importer.load(std::filesystem::path(positional.constFirst().toStdString()), model, importError))
    {
        STLCAM_LOG_ERR(App, QStringLiteral("Failed to load %1: %2")
                         .arg(positional.constFirst(), QString::fromStdString(importError)));
        return 1;
    }

    QTextStream console(stderr);
    const mesh::MeshStats stats = model.stats();
    console << "Mesh: " << model.name() << '\n'
            << "  triangles: " << stats.triangleCount << ", vertices: " << stats.vertexCount << '\n'
            << "  extent: " << formatVector(stats.extent) << '\n'
            << "  center: " << formatVector(stats.center) << '\n'
            << "  min: " << formatVector(stats.min) << ", max: " << formatVector(stats.max) << Qt::endl;

    tp::SelectionVolume selection = tp::SelectionVolume::enclosing(model.bounds(), params.stepdown);
    if (parser.isSet(selectionOption))
    {
        QString selectionError;
        const std::optional<tp::SelectionVolume> parsed = parseSelection(parser.value(selectionOption), selectionError);
        if (!parsed)
        {
            STLCAM_LOG_ERR(App, selectionError);
            return 1;
        }
        selection = *parsed;
    }

    tp::PathGenerator generator;
    tp::Path path;
    try
    {
        int lastPercent = -1;
        path = generator.generate(model, selection, params, [&](double fraction) {
            const int percent = static_cast<int>(fraction * 100.0);
            if (percent / 10 != lastPercent / 10)
            {
                console << "  progress: " << percent << '%' << Qt::endl;
                lastPercent = percent;
            }
        });
    }
    catch (const tp::PreconditionError& ex)
    {
        STLCAM_LOG_ERR(App, ex.what());
        return 1;
    }
    catch (const std::exception& ex)
    {
        STLCAM_LOG_ERR(App, QStringLiteral("Path generation failed: %1").arg(QString::fromUtf8(ex.what())));
        return 1;
    }

    console << "Path: " << path.layerCount() << " layers, " << path.totalPoints() << " points, ~"
            << QString::number(generator.estimateTimeMinutes(), 'f', 1) << " min, ~"
            << tp::GCodeEmitter::estimateSize(path) << " bytes" << Qt::endl;

    if (parser.isSet(outputOption))
    {
        QString exportError;
        if (!tp::GCodeExporter::exportToFile(path, parser.value(outputOption), params, &exportError))
        {
            return 1;
        }
        return 0;
    }

    QTextStream output(stdout);
    output << QString::fromStdString(tp::GCodeEmitter{}.emit(path, params));
    output.flush();
    return 0;
}
