#pragma once

#include "tp/MachiningParams.h"
#include "tp/Path.h"

#include <QtCore/QString>

namespace tp
{

class GCodeExporter
{
public:
    static bool exportToFile(const tp::Path& path,
                             const QString& filePath,
                             const tp::MachiningParams& params,
                             QString* error = nullptr);
};

} // namespace tp
