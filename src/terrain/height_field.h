#pragma once

#include <cstdint>

#include "chunk_types.h"
#include "world_config.h"

namespace worldstream::terrain
{

// Stepped terrain height per chunk, sampled from 3D Perlin noise with the world seed on the third axis.
// Pure: the same coordinate always yields the same height for a given configuration.
class HeightField
{
public:
    HeightField(const TerrainSettings& settings, std::uint32_t worldSeed) noexcept;

    [[nodiscard]] float computeHeight(const ChunkCoord& coord) const noexcept;

    // Raw noise in [-1, 1] before scaling and stepping.
    [[nodiscard]] float sampleNoise(const ChunkCoord& coord) const noexcept;

    [[nodiscard]] const TerrainSettings& settings() const noexcept { return settings_; }

private:
    TerrainSettings settings_{};
    float seedAxis_{0.0f};
};

} // namespace worldstream::terrain
