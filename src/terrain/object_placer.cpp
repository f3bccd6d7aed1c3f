#include "terrain/object_placer.h"

#include <algorithm>
#include <random>

namespace worldstream::terrain
{

ObjectPlacer::ObjectPlacer(const ObjectSettings& settings, int gridScale, std::uint32_t worldSeed) noexcept
    : settings_(settings),
      sampleSpan_(static_cast<float>(gridScale) * settings.footprint),
      worldSeed_(worldSeed)
{
}

std::uint32_t ObjectPlacer::chunkSeed(const ChunkCoord& coord) const noexcept
{
    const std::int64_t seed = static_cast<std::int64_t>(coord.x) * kSeedFactorX +
                              static_cast<std::int64_t>(coord.z) * kSeedFactorZ +
                              static_cast<std::int64_t>(worldSeed_);
    return static_cast<std::uint32_t>(static_cast<std::uint64_t>(seed));
}

bool ObjectPlacer::isPlacementValid(const std::vector<ObjectPlacement>& accepted,
                                    float offsetX,
                                    float offsetZ,
                                    float minDistance) noexcept
{
    const float minDistanceSq = minDistance * minDistance;
    return std::none_of(accepted.begin(), accepted.end(), [&](const ObjectPlacement& placement) {
        const float dx = offsetX - placement.offsetX;
        const float dz = offsetZ - placement.offsetZ;
        return dx * dx + dz * dz < minDistanceSq;
    });
}

std::vector<ObjectPlacement> ObjectPlacer::generatePlacements(const ChunkCoord& coord) const
{
    std::mt19937 rng(chunkSeed(coord));
    std::uniform_int_distribution<int> countDist(settings_.minPerChunk, settings_.maxPerChunk);
    std::uniform_real_distribution<float> offsetDist(-0.5f, 0.5f);

    const int targetCount = countDist(rng);

    std::vector<ObjectPlacement> placements;
    placements.reserve(static_cast<std::size_t>(std::max(targetCount, 0)));

    for (int slot = 0; slot < targetCount; ++slot)
    {
        for (int attempt = 0; attempt < settings_.maxPlacementAttempts; ++attempt)
        {
            const float offsetX = offsetDist(rng) * sampleSpan_;
            const float offsetZ = offsetDist(rng) * sampleSpan_;
            if (isPlacementValid(placements, offsetX, offsetZ, settings_.minDistance))
            {
                placements.push_back(ObjectPlacement{offsetX, settings_.groundClearance, offsetZ});
                break;
            }
        }
    }

    return placements;
}

} // namespace worldstream::terrain
