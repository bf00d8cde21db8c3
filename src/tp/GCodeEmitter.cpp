#include "tp/GCodeEmitter.h"

#include <cmath>
#include <iomanip>

namespace tp
{

namespace
{

constexpr std::string_view kRule = "; ============================================================";
constexpr std::size_t kBytesPerPoint = 40;
constexpr std::size_t kHeaderFooterBytes = 1000;

} // namespace

std::string GCodeEmitter::emit(const Path& path, const MachiningParams& params) const
{
    return emit(path, params, QDateTime::currentDateTimeUtc());
}

std::string GCodeEmitter::emit(const Path& path,
                               const MachiningParams& params,
                               const QDateTime& generatedAt) const
{
    std::ostringstream out;

    out << '%' << newline();
    emitHeader(out, path, params, generatedAt);

    out << "; ---------- MACHINING ----------" << newline() << newline();
    for (const Layer& layer : path.layers)
    {
        emitLayer(out, layer, path.layerCount(), params);
    }

    emitFooter(out, params);
    out << '%' << newline();
    return out.str();
}

std::size_t GCodeEmitter::estimateSize(const Path& path)
{
    return path.totalPoints() * kBytesPerPoint + kHeaderFooterBytes;
}

std::string GCodeEmitter::formatNumber(double value, int precision)
{
    // Values that round to zero print without a sign.
    const double half = 0.5 * std::pow(10.0, -precision);
    if (std::abs(value) < half)
    {
        value = 0.0;
    }

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setprecision(precision) << value;
    return oss.str();
}

void GCodeEmitter::emitHeader(std::ostringstream& out,
                              const Path& path,
                              const MachiningParams& params,
                              const QDateTime& generatedAt) const
{
    out << kRule << newline();
    out << "; STL CAM - 2.5D zig-zag surface program" << newline();
    out << kRule << newline();
    out << "; Generated: " << generatedAt.toString(Qt::ISODateWithMs).toStdString() << newline();
    out << "; Tool diameter: " << formatNumber(params.toolDiameter) << " mm" << newline();
    out << "; Stepover: " << formatNumber(params.stepoverFraction * 100.0, 1) << "% ("
        << formatNumber(params.stepoverDistance()) << " mm)" << newline();
    out << "; Stepdown: " << formatNumber(params.stepdown) << " mm" << newline();
    out << "; Feed rate: " << formatNumber(params.feedRate) << " mm/min" << newline();
    out << "; Safe Z: " << formatNumber(params.safeZ) << " mm" << newline();
    out << "; Total layers: " << path.layerCount() << newline();
    out << "; Total points: " << path.totalPoints() << newline();
    out << kRule << newline() << newline();

    out << "; ---------- INITIALIZATION ----------" << newline();
    out << "G90 ; absolute positioning" << newline();
    out << "G21 ; metric units (mm)" << newline();
    out << "G40 G49 G80 ; cancel compensation and canned cycles" << newline();
    out << "G94 ; feed per minute" << newline();
    out << "F" << formatNumber(params.feedRate) << " ; cutting feed rate" << newline() << newline();

    out << "G0 Z" << formatNumber(params.safeZ) << " ; retract to safe height" << newline();
    out << "G0 X0.000 Y0.000 ; move to origin" << newline() << newline();
}

void GCodeEmitter::emitLayer(std::ostringstream& out,
                             const Layer& layer,
                             std::size_t layerTotal,
                             const MachiningParams& params) const
{
    const std::string safeZ = formatNumber(params.safeZ);
    const std::size_t count = layer.points.size();

    out << "; ====== Layer " << (layer.index + 1) << '/' << layerTotal << " - Z=" << formatNumber(layer.z)
        << " ======" << newline();
    out << "; Points in layer: " << count << newline();

    if (count == 0)
    {
        out << "; (no points in this layer)" << newline() << newline();
        return;
    }

    const glm::dvec3& first = layer.points.front();
    out << "G0 Z" << safeZ << " ; safe height" << newline();
    out << "G0 X" << formatNumber(first.x) << " Y" << formatNumber(first.y) << newline();
    out << "G1 Z" << formatNumber(first.z) << " ; plunge to cutting depth" << newline();

    for (std::size_t i = 1; i < count; ++i)
    {
        const glm::dvec3& point = layer.points[i];
        out << "G1 X" << formatNumber(point.x) << " Y" << formatNumber(point.y) << " Z" << formatNumber(point.z)
            << newline();

        if (i % kProgressCommentInterval == 0)
        {
            out << "; Progress: " << i << '/' << count << " points" << newline();
        }
    }

    out << "G0 Z" << safeZ << " ; retract" << newline() << newline();
}

void GCodeEmitter::emitFooter(std::ostringstream& out, const MachiningParams& params) const
{
    out << "; ---------- PROGRAM END ----------" << newline();
    out << "G0 Z" << formatNumber(params.safeZ) << " ; final retract" << newline();
    out << "G0 X0.000 Y0.000 ; return to origin" << newline();
    out << "M5 ; spindle stop" << newline();
    out << "M30 ; program end and rewind" << newline();
}

} // namespace tp
