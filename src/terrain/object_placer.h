#pragma once

#include <cstdint>
#include <vector>

#include "chunk_types.h"
#include "world_config.h"

namespace worldstream::terrain
{

// Scatters objects over a chunk footprint by rejection sampling from a stream seeded by the chunk
// coordinate. The result may hold fewer than the drawn count when a slot exhausts its attempts.
class ObjectPlacer
{
public:
    static constexpr std::int64_t kSeedFactorX = 1000;
    static constexpr std::int64_t kSeedFactorZ = 10;

    ObjectPlacer(const ObjectSettings& settings, int gridScale, std::uint32_t worldSeed) noexcept;

    // Offsets are relative to the chunk origin on X/Z and to the chunk height on Y.
    [[nodiscard]] std::vector<ObjectPlacement> generatePlacements(const ChunkCoord& coord) const;

    [[nodiscard]] std::uint32_t chunkSeed(const ChunkCoord& coord) const noexcept;

    [[nodiscard]] static bool isPlacementValid(const std::vector<ObjectPlacement>& accepted,
                                               float offsetX,
                                               float offsetZ,
                                               float minDistance) noexcept;

private:
    ObjectSettings settings_{};
    float sampleSpan_{0.0f};
    std::uint32_t worldSeed_{0};
};

} // namespace worldstream::terrain
