#pragma once

#include <cstdint>
#include <vector>

#include <glm/vec2.hpp>

#include "chunk_types.h"

namespace worldstream
{

class GridIndexer
{
public:
    explicit GridIndexer(int gridScale);

    [[nodiscard]] int gridScale() const noexcept { return gridScale_; }

    // Largest cell index whose coordinate still fits in an int. Snapping clamps to +/- this cell, so
    // the world ends at roughly +/- INT_MAX units on each axis.
    [[nodiscard]] int maxCell() const noexcept { return maxCell_; }

    // Round-half-up to the nearest multiple of the grid scale on each axis.
    [[nodiscard]] ChunkCoord snapToGrid(float x, float z) const noexcept;
    [[nodiscard]] ChunkCoord snapToGrid(const ChunkCoord& coord) const noexcept;

    [[nodiscard]] ChunkKey chunkKey(const ChunkCoord& coord) const noexcept;
    [[nodiscard]] ChunkCoord coordFromKey(const ChunkKey& key) const noexcept;

    // Square lattice of (renderDistance + 1)^2 points around the snapped observer, cut to a circle of
    // renderDistance * gridScale around the observer, returned snapped, deduplicated and in scan order.
    // Empty for an observer beyond the clamped edge of the grid.
    [[nodiscard]] std::vector<ChunkCoord> candidates(const glm::vec2& observer, int renderDistance) const;

    [[nodiscard]] static float planarDistance(const ChunkCoord& coord, const glm::vec2& observer) noexcept;

private:
    static std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) noexcept;

    [[nodiscard]] int clampCell(std::int64_t cell) const noexcept;

    int gridScale_{1};
    int maxCell_{0};
};

} // namespace worldstream
