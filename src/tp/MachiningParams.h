#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>
#include <string>

namespace tp
{

struct MachiningParamsUpdate
{
    std::optional<double> toolDiameter;
    std::optional<double> stepoverFraction;
    std::optional<double> stepdown;
    std::optional<double> feedRate;
    std::optional<double> safeZ;
};

struct MachiningParams
{
    double toolDiameter{1.0};
    double stepoverFraction{0.4};
    double stepdown{0.5};
    double feedRate{100.0};
    double safeZ{5.0};

    [[nodiscard]] double toolRadius() const noexcept { return toolDiameter * 0.5; }
    [[nodiscard]] double stepoverDistance() const noexcept { return toolDiameter * stepoverFraction; }
    [[nodiscard]] double scanStep() const noexcept { return toolDiameter * 0.2; }

    // Only the fields present in `update` are replaced.
    void merge(const MachiningParamsUpdate& update);
    [[nodiscard]] bool validate(std::string& error) const;
};

// Reads {"tool_diameter", "stepover", "stepdown", "feed_rate", "safe_z"}; unknown keys and
// non-numeric values are reported in `warnings` and skipped.
bool loadParamsUpdateFromJson(const QByteArray& data, MachiningParamsUpdate& update, QStringList& warnings);
bool loadParamsUpdateFromFile(const QString& filePath, MachiningParamsUpdate& update, QStringList& warnings);

} // namespace tp
