#include "tp/MachiningParams.h"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>

#include <cmath>

namespace tp
{

void MachiningParams::merge(const MachiningParamsUpdate& update)
{
    if (update.toolDiameter)
    {
        toolDiameter = *update.toolDiameter;
    }
    if (update.stepoverFraction)
    {
        stepoverFraction = *update.stepoverFraction;
    }
    if (update.stepdown)
    {
        stepdown = *update.stepdown;
    }
    if (update.feedRate)
    {
        feedRate = *update.feedRate;
    }
    if (update.safeZ)
    {
        safeZ = *update.safeZ;
    }
}

bool MachiningParams::validate(std::string& error) const
{
    if (!std::isfinite(toolDiameter) || toolDiameter <= 0.0)
    {
        error = "Tool diameter must be greater than zero.";
        return false;
    }
    if (!std::isfinite(stepoverFraction) || stepoverFraction <= 0.0 || stepoverFraction > 1.0)
    {
        error = "Stepover must be a fraction in (0, 1] of the tool diameter.";
        return false;
    }
    if (!std::isfinite(stepdown) || stepdown <= 0.0)
    {
        error = "Stepdown must be greater than zero.";
        return false;
    }
    if (!std::isfinite(feedRate) || feedRate <= 0.0)
    {
        error = "Feed rate must be greater than zero.";
        return false;
    }
    if (!std::isfinite(safeZ))
    {
        error = "Safe Z must be a finite height.";
        return false;
    }
    return true;
}

bool loadParamsUpdateFromJson(const QByteArray& data, MachiningParamsUpdate& update, QStringList& warnings)
{
    if (data.trimmed().isEmpty())
    {
        warnings.push_back(QStringLiteral("Parameter JSON is empty."));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError)
    {
        warnings.push_back(QStringLiteral("Failed to parse parameters: %1").arg(parseError.errorString()));
        return false;
    }
    if (!doc.isObject())
    {
        warnings.push_back(QStringLiteral("Parameter JSON must be an object."));
        return false;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it)
    {
        const QString& key = it.key();
        std::optional<double>* target = nullptr;
        if (key == QLatin1String("tool_diameter"))
        {
            target = &update.toolDiameter;
        }
        else if (key == QLatin1String("stepover"))
        {
            target = &update.stepoverFraction;
        }
        else if (key == QLatin1String("stepdown"))
        {
            target = &update.stepdown;
        }
        else if (key == QLatin1String("feed_rate"))
        {
            target = &update.feedRate;
        }
        else if (key == QLatin1String("safe_z"))
        {
            target = &update.safeZ;
        }
        else
        {
            warnings.push_back(QStringLiteral("Ignoring unknown parameter \"%1\".").arg(key));
            continue;
        }

        if (!it.value().isDouble())
        {
            warnings.push_back(QStringLiteral("Parameter \"%1\" must be a number.").arg(key));
            continue;
        }
        *target = it.value().toDouble();
    }

    return true;
}

bool loadParamsUpdateFromFile(const QString& filePath, MachiningParamsUpdate& update, QStringList& warnings)
{
    QFile file(filePath);
    if (!file.exists())
    {
        warnings.push_back(QStringLiteral("Parameter file not found: %1").arg(filePath));
        return false;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        warnings.push_back(QStringLiteral("Unable to open parameter file: %1").arg(filePath));
        return false;
    }

    return loadParamsUpdateFromJson(file.readAll(), update, warnings);
}

} // namespace tp
