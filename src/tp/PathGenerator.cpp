#include "tp/PathGenerator.h"

#include "common/log.h"
#include "tp/SurfaceQuery.h"

#include <QtCore/QElapsedTimer>
#include <QtCore/QString>

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace tp
{

double estimateTimeMinutes(const Path& path, const MachiningParams& params)
{
    double distance = 0.0;
    for (const Layer& layer : path.layers)
    {
        for (std::size_t i = 1; i < layer.points.size(); ++i)
        {
            distance += glm::distance(layer.points[i], layer.points[i - 1]);
        }
    }

    distance += static_cast<double>(path.layerCount()) * params.safeZ * 2.0;
    return (params.feedRate > 0.0) ? distance / params.feedRate : 0.0;
}

double PathGenerator::estimateTimeMinutes() const
{
    return tp::estimateTimeMinutes(m_path, m_params);
}

std::size_t PathGenerator::layerCountFor(const SelectionVolume& selection, const MachiningParams& params)
{
    const double extent = selection.max.z - selection.min.z;
    if (!(extent > 0.0) || !(params.stepdown > 0.0))
    {
        return 0;
    }
    const double layers = std::ceil(extent / params.stepdown);
    if (!(layers < static_cast<double>(std::numeric_limits<std::size_t>::max())))
    {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(layers);
}

double PathGenerator::layerZ(const SelectionVolume& selection,
                             const MachiningParams& params,
                             std::size_t layerIndex,
                             std::size_t layerCount)
{
    // The final layer always lands on the floor; earlier ones step down from the top.
    if (layerIndex + 1 >= layerCount)
    {
        return selection.min.z;
    }
    const double z = selection.max.z - static_cast<double>(layerIndex) * params.stepdown;
    return std::max(z, selection.min.z);
}

void PathGenerator::checkPreconditions(const mesh::Model& model,
                                       const SelectionVolume& selection,
                                       const MachiningParams& params)
{
    if (!model.isValid())
    {
        throw PreconditionError("No mesh loaded: the model contains no triangles.");
    }

    const glm::dvec3 extent = selection.size();
    const char* axisNames[3] = {"X", "Y", "Z"};
    for (int axis = 0; axis < 3; ++axis)
    {
        if (!std::isfinite(extent[axis]) || extent[axis] < SelectionVolume::kMinExtent)
        {
            throw PreconditionError(std::string("Selection volume is degenerate: ") + axisNames[axis]
                                    + " extent " + std::to_string(extent[axis]) + " is below the "
                                    + std::to_string(SelectionVolume::kMinExtent) + " minimum.");
        }
    }

    std::string paramError;
    if (!params.validate(paramError))
    {
        throw PreconditionError("Invalid machining parameters: " + paramError);
    }

    const double layers = std::ceil(extent.z / params.stepdown);
    if (!(layers <= static_cast<double>(kMaxLayerCount)))
    {
        std::ostringstream oss;
        oss << "Stepdown " << params.stepdown << " mm over a Z extent of " << extent.z << " mm needs "
            << layers << " layers; at most " << kMaxLayerCount << " are supported.";
        throw PreconditionError(oss.str());
    }

    const double rows = std::floor(extent.y / params.stepoverDistance()) + 1.0;
    const double columns = std::ceil(extent.x / params.scanStep()) + 1.0;
    if (!(rows * columns <= static_cast<double>(kMaxSamplesPerLayer)))
    {
        std::ostringstream oss;
        oss << "Tool diameter " << params.toolDiameter << " mm over a " << extent.x << " x " << extent.y
            << " mm selection needs " << rows * columns << " samples per layer; at most "
            << kMaxSamplesPerLayer << " are supported.";
        throw PreconditionError(oss.str());
    }
}

Path PathGenerator::generate(const mesh::Model& model,
                             const SelectionVolume& selection,
                             const MachiningParams& params,
                             const ProgressCallback& progressCallback)
{
    const std::atomic<bool> neverCancel{false};
    return generate(model, selection, params, neverCancel, progressCallback);
}

Path PathGenerator::generate(const mesh::Model& model,
                             const SelectionVolume& selection,
                             const MachiningParams& params,
                             const std::atomic<bool>& cancelFlag,
                             const ProgressCallback& progressCallback)
{
    m_path = Path{};
    m_cancelled = false;

    checkPreconditions(model, selection, params);
    m_selection = selection;
    m_params = params;

    QElapsedTimer timer;
    timer.start();

    const SurfaceQuery query(model);
    const std::size_t layerCount = layerCountFor(selection, params);
    m_path.layers.reserve(layerCount);

    STLCAM_LOG_INFO(Tp, QStringLiteral("Generating %1 layers (tool %2 mm, stepover %3 mm, stepdown %4 mm)")
                     .arg(static_cast<qulonglong>(layerCount))
                     .arg(params.toolDiameter, 0, 'f', 3)
                     .arg(params.stepoverDistance(), 0, 'f', 3)
                     .arg(params.stepdown, 0, 'f', 3));

    for (std::size_t layerIndex = 0; layerIndex < layerCount; ++layerIndex)
    {
        if (cancelFlag.load(std::memory_order_relaxed))
        {
            m_cancelled = true;
            STLCAM_LOG_INFO(Tp, QStringLiteral("Generation cancelled after %1 of %2 layers")
                             .arg(static_cast<qulonglong>(layerIndex))
                             .arg(static_cast<qulonglong>(layerCount)));
            break;
        }

        const double zPlane = layerZ(selection, params, layerIndex, layerCount);
        m_path.layers.push_back(scanLayer(query, layerIndex, zPlane));

        if (progressCallback)
        {
            progressCallback(static_cast<double>(layerIndex + 1) / static_cast<double>(layerCount));
        }
    }

    STLCAM_LOG_INFO(Tp, QStringLiteral("Path generated: %1 layers, %2 points in %3 ms")
                     .arg(static_cast<qulonglong>(m_path.layerCount()))
                     .arg(static_cast<qulonglong>(m_path.totalPoints()))
                     .arg(timer.elapsed()));
    return m_path;
}

Layer PathGenerator::scanLayer(const SurfaceQuery& query, std::size_t layerIndex, double zPlane) const
{
    Layer layer;
    layer.index = layerIndex;
    layer.z = zPlane;

    const double stepover = m_params.stepoverDistance();
    for (std::size_t row = 0;; ++row)
    {
        const double y = m_selection.min.y + static_cast<double>(row) * stepover;
        if (y > m_selection.max.y)
        {
            break;
        }

        std::vector<glm::dvec3> rowPoints = scanRow(query, y, zPlane);
        // Odd rows run right to left so consecutive rows join without a return stroke.
        if (row % 2 == 1)
        {
            std::reverse(rowPoints.begin(), rowPoints.end());
        }
        layer.points.insert(layer.points.end(),
                            std::make_move_iterator(rowPoints.begin()),
                            std::make_move_iterator(rowPoints.end()));
    }

    return layer;
}

std::vector<glm::dvec3> PathGenerator::scanRow(const SurfaceQuery& query, double y, double zPlane) const
{
    std::vector<glm::dvec3> points;

    const double scanStep = m_params.scanStep();
    const double toolRadius = m_params.toolRadius();
    const auto steps = static_cast<std::size_t>(std::ceil((m_selection.max.x - m_selection.min.x) / scanStep));

    for (std::size_t i = 0; i <= steps; ++i)
    {
        const double x = m_selection.min.x + static_cast<double>(i) * scanStep;
        const std::optional<double> surfaceZ = query.heightAt(x, y, zPlane, m_selection.min.z);
        if (!surfaceZ)
        {
            continue;
        }

        if (m_selection.contains(glm::dvec3{x, y, *surfaceZ}))
        {
            points.emplace_back(x, y, *surfaceZ + toolRadius);
        }
    }

    return points;
}

} // namespace tp
