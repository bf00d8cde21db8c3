#pragma once

#include "mesh/Model.h"
#include "tp/MachiningParams.h"
#include "tp/Path.h"
#include "tp/SelectionVolume.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tp
{

class SurfaceQuery;

class PreconditionError : public std::runtime_error
{
public:
    explicit PreconditionError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

// Receives layersDone / totalLayers after every completed layer.
using ProgressCallback = std::function<void(double)>;

// Travel distance of every layer plus a fixed safe-Z rapid allowance per layer, over the feed rate.
[[nodiscard]] double estimateTimeMinutes(const Path& path, const MachiningParams& params);

// One generator per job: every call to generate() overwrites the previous result, and
// calls on the same instance must not overlap.
class PathGenerator
{
public:
    static constexpr std::size_t kMaxLayerCount = 100'000;
    static constexpr std::size_t kMaxSamplesPerLayer = 100'000'000;

    PathGenerator() = default;

    // Throws PreconditionError before any scanning when the mesh is empty, the selection is
    // degenerate, the parameters are out of range or the layer or per-layer sample count
    // exceeds its limit. The cancel flag is polled between layers; a cancelled run returns
    // the layers completed so far.
    Path generate(const mesh::Model& model,
                  const SelectionVolume& selection,
                  const MachiningParams& params,
                  const std::atomic<bool>& cancelFlag,
                  const ProgressCallback& progressCallback = {});

    Path generate(const mesh::Model& model,
                  const SelectionVolume& selection,
                  const MachiningParams& params,
                  const ProgressCallback& progressCallback = {});

    [[nodiscard]] const Path& path() const noexcept { return m_path; }
    [[nodiscard]] std::size_t totalPoints() const noexcept { return m_path.totalPoints(); }
    [[nodiscard]] double estimateTimeMinutes() const;
    [[nodiscard]] bool wasCancelled() const noexcept { return m_cancelled; }

    [[nodiscard]] static std::size_t layerCountFor(const SelectionVolume& selection, const MachiningParams& params);
    [[nodiscard]] static double layerZ(const SelectionVolume& selection,
                                       const MachiningParams& params,
                                       std::size_t layerIndex,
                                       std::size_t layerCount);

private:
    static void checkPreconditions(const mesh::Model& model,
                                   const SelectionVolume& selection,
                                   const MachiningParams& params);

    Layer scanLayer(const SurfaceQuery& query, std::size_t layerIndex, double zPlane) const;
    std::vector<glm::dvec3> scanRow(const SurfaceQuery& query, double y, double zPlane) const;

    Path m_path;
    SelectionVolume m_selection;
    MachiningParams m_params;
    bool m_cancelled{false};
};

} // namespace tp
