#include "grid_indexer.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <glm/geometric.hpp>

namespace worldstream
{

GridIndexer::GridIndexer(int gridScale)
    : gridScale_(gridScale)
{
    if (gridScale_ <= 0)
    {
        throw std::invalid_argument("Grid scale must be positive");
    }
    maxCell_ = std::numeric_limits<int>::max() / gridScale_;
}

int GridIndexer::clampCell(std::int64_t cell) const noexcept
{
    return static_cast<int>(std::clamp<std::int64_t>(cell, -maxCell_, maxCell_));
}

ChunkCoord GridIndexer::snapToGrid(float x, float z) const noexcept
{
    const double scale = static_cast<double>(gridScale_);
    const double limit = static_cast<double>(maxCell_);
    const auto cellOf = [&](float value) {
        if (std::isnan(value))
        {
            return 0;
        }
        const double cell = std::floor(static_cast<double>(value) / scale + 0.5);
        return static_cast<int>(std::clamp(cell, -limit, limit));
    };
    return coordFromKey(ChunkKey{cellOf(x), cellOf(z)});
}

ChunkCoord GridIndexer::snapToGrid(const ChunkCoord& coord) const noexcept
{
    const ChunkKey key = chunkKey(coord);
    return coordFromKey(key);
}

ChunkKey GridIndexer::chunkKey(const ChunkCoord& coord) const noexcept
{
    // floor(v / s + 0.5) == floor((2v + s) / 2s), kept in integers.
    const std::int64_t span = 2 * static_cast<std::int64_t>(gridScale_);
    const auto cellOf = [&](int value) {
        return clampCell(floorDiv(2 * static_cast<std::int64_t>(value) + gridScale_, span));
    };
    return ChunkKey{cellOf(coord.x), cellOf(coord.z)};
}

ChunkCoord GridIndexer::coordFromKey(const ChunkKey& key) const noexcept
{
    return ChunkCoord{clampCell(key.cellX) * gridScale_, clampCell(key.cellZ) * gridScale_};
}

std::vector<ChunkCoord> GridIndexer::candidates(const glm::vec2& observer, int renderDistance) const
{
    std::vector<ChunkCoord> result;
    if (renderDistance < 0)
    {
        return result;
    }

    const float scale = static_cast<float>(gridScale_);
    const float radius = static_cast<float>(renderDistance) * scale;
    const float halfSpan = radius * 0.5f;
    const ChunkCoord center = snapToGrid(observer.x, observer.y);
    const glm::vec2 centerPos{static_cast<float>(center.x), static_cast<float>(center.z)};

    const std::size_t side = static_cast<std::size_t>(renderDistance) + 1;
    result.reserve(side * side);
    for (int stepX = 0; stepX <= renderDistance; ++stepX)
    {
        for (int stepZ = 0; stepZ <= renderDistance; ++stepZ)
        {
            const glm::vec2 samplePos{centerPos.x + static_cast<float>(stepX) * scale - halfSpan,
                                      centerPos.y + static_cast<float>(stepZ) * scale - halfSpan};
            if (glm::distance(samplePos, observer) > radius)
            {
                continue;
            }
            const ChunkCoord coord = snapToGrid(samplePos.x, samplePos.y);
            if (std::find(result.begin(), result.end(), coord) == result.end())
            {
                result.push_back(coord);
            }
        }
    }
    return result;
}

float GridIndexer::planarDistance(const ChunkCoord& coord, const glm::vec2& observer) noexcept
{
    return glm::distance(glm::vec2(static_cast<float>(coord.x), static_cast<float>(coord.z)), observer);
}

std::int64_t GridIndexer::floorDiv(std::int64_t value, std::int64_t divisor) noexcept
{
    std::int64_t quotient = value / divisor;
    const std::int64_t remainder = value % divisor;
    if (remainder != 0 && ((remainder < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

} // namespace worldstream
