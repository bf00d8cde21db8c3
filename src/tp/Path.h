#pragma once

#include <glm/vec3.hpp>

#include <cstddef>
#include <vector>

namespace tp
{

struct Layer
{
    std::size_t index{0};
    double z{0.0};
    std::vector<glm::dvec3> points;

    [[nodiscard]] bool empty() const noexcept
    {
        return points.empty();
    }
};

// Layers run from the top of the selection down to its floor; empty layers are kept
// so indices stay contiguous.
struct Path
{
    std::vector<Layer> layers;

    [[nodiscard]] bool empty() const noexcept
    {
        return layers.empty();
    }

    [[nodiscard]] std::size_t layerCount() const noexcept
    {
        return layers.size();
    }

    [[nodiscard]] std::size_t totalPoints() const noexcept
    {
        std::size_t total = 0;
        for (const Layer& layer : layers)
        {
            total += layer.points.size();
        }
        return total;
    }
};

} // namespace tp
