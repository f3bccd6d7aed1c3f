#include "terrain/height_field.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/noise.hpp>
#include <glm/vec3.hpp>

namespace worldstream::terrain
{

HeightField::HeightField(const TerrainSettings& settings, std::uint32_t worldSeed) noexcept
    : settings_(settings),
      seedAxis_(static_cast<float>(worldSeed))
{
}

float HeightField::sampleNoise(const ChunkCoord& coord) const noexcept
{
    const glm::vec3 sample{static_cast<float>(coord.x) / settings_.smoothness,
                           static_cast<float>(coord.z) / settings_.smoothness,
                           seedAxis_};
    return std::clamp(glm::perlin(sample), -1.0f, 1.0f);
}

float HeightField::computeHeight(const ChunkCoord& coord) const noexcept
{
    const float variation = sampleNoise(coord) * settings_.heightVariationScale;
    const float steps = std::floor(variation * settings_.heightAmplitude / settings_.heightStep);
    return settings_.originHeight + steps * settings_.heightStep;
}

} // namespace worldstream::terrain
