#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace worldstream
{

struct GridSettings
{
    int scale{128};
    int renderDistance{6};
};

struct TerrainSettings
{
    float originHeight{0.0f};
    float heightStep{4.0f};
    float heightVariationScale{1.0f};
    float heightAmplitude{10.0f};
    float smoothness{3.0f};
};

struct ObjectSettings
{
    int minPerChunk{2};
    int maxPerChunk{7};
    float minDistance{10.0f};
    int maxPlacementAttempts{20};
    float footprint{0.8f};
    float groundClearance{78.897f};
};

struct StreamingSettings
{
    double cooldownSeconds{0.0};
    int maxEvictionsPerTick{3};
    int maxMaterializationsPerTick{1};
    bool randomizeSelection{false};
};

struct AssetSettings
{
    std::string floorArchetype{"plains"};
    std::string objectArchetype{"tree"};
};

struct WorldConfig
{
    std::uint32_t worldSeed{300};
    GridSettings grid{};
    TerrainSettings terrain{};
    ObjectSettings objects{};
    StreamingSettings streaming{};
    AssetSettings assets{};

    [[nodiscard]] float renderRadius() const noexcept
    {
        return static_cast<float>(grid.renderDistance) * static_cast<float>(grid.scale);
    }

    // Throws std::runtime_error naming the first offending setting.
    void validate(const std::filesystem::path& source = "<memory>") const;

    static WorldConfig load(const std::filesystem::path& path);
};

} // namespace worldstream
