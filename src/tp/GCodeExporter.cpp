#include "tp/GCodeExporter.h"

#include "common/log.h"
#include "tp/GCodeEmitter.h"

#include <QtCore/QSaveFile>

#include <string>

namespace tp
{

bool GCodeExporter::exportToFile(const tp::Path& path,
                                 const QString& filePath,
                                 const tp::MachiningParams& params,
                                 QString* error)
{
    const auto fail = [&](const QString& message) {
        STLCAM_LOG_ERR(Post, message);
        if (error)
        {
            *error = message;
        }
        return false;
    };

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        return fail(QStringLiteral("Unable to open %1 for writing.").arg(filePath));
    }

    const std::string program = GCodeEmitter{}.emit(path, params);
    if (file.write(program.c_str(), static_cast<qint64>(program.size())) == -1)
    {
        file.cancelWriting();
        return fail(QStringLiteral("Failed to write to %1.").arg(filePath));
    }

    if (!file.commit())
    {
        return fail(QStringLiteral("Failed to save %1: %2").arg(filePath, file.errorString()));
    }

    STLCAM_LOG_INFO(Post, QStringLiteral("Wrote %1 bytes of G-code to %2")
                       .arg(static_cast<qulonglong>(program.size()))
                       .arg(filePath));
    return true;
}

} // namespace tp
