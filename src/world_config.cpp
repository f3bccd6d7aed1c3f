#include "world_config.h"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <toml++/toml.h>

namespace worldstream
{
namespace
{
float readFloat(const toml::table& table, std::string_view key, float fallback)
{
    if (auto value = table[key].value<double>())
    {
        return static_cast<float>(*value);
    }
    if (auto valueF = table[key].value<float>())
    {
        return *valueF;
    }
    return fallback;
}

int readInt(const toml::table& table, std::string_view key, int fallback)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        return static_cast<int>(*value);
    }
    return fallback;
}

[[noreturn]] void failSetting(std::string_view key, const std::filesystem::path& filePath, std::string_view reason)
{
    std::ostringstream oss;
    oss << "Setting '" << key << "' in " << filePath << " " << reason;
    throw std::runtime_error(oss.str());
}

void requirePositive(float value, std::string_view key, const std::filesystem::path& filePath)
{
    if (!std::isfinite(value) || value <= 0.0f)
    {
        failSetting(key, filePath, "must be positive");
    }
}

void applyGrid(const toml::table& table, GridSettings& grid)
{
    grid.scale = readInt(table, "scale", grid.scale);
    grid.renderDistance = readInt(table, "render_distance", grid.renderDistance);
}

void applyTerrain(const toml::table& table, TerrainSettings& terrain)
{
    terrain.originHeight = readFloat(table, "origin_height", terrain.originHeight);
    terrain.heightStep = readFloat(table, "height_step", terrain.heightStep);
    terrain.heightVariationScale = readFloat(table, "height_variation_scale", terrain.heightVariationScale);
    terrain.heightAmplitude = readFloat(table, "height_amplitude", terrain.heightAmplitude);
    terrain.smoothness = readFloat(table, "smoothness", terrain.smoothness);
}

void applyObjects(const toml::table& table, ObjectSettings& objects)
{
    objects.minPerChunk = readInt(table, "min_per_chunk", objects.minPerChunk);
    objects.maxPerChunk = readInt(table, "max_per_chunk", objects.maxPerChunk);
    objects.minDistance = readFloat(table, "min_distance", objects.minDistance);
    objects.maxPlacementAttempts = readInt(table, "max_placement_attempts", objects.maxPlacementAttempts);
    objects.footprint = readFloat(table, "footprint", objects.footprint);
    objects.groundClearance = readFloat(table, "ground_clearance", objects.groundClearance);
}

void applyStreaming(const toml::table& table, StreamingSettings& streaming)
{
    if (auto cooldown = table["cooldown_seconds"].value<double>())
    {
        streaming.cooldownSeconds = *cooldown;
    }
    streaming.maxEvictionsPerTick = readInt(table, "max_evictions_per_tick", streaming.maxEvictionsPerTick);
    streaming.maxMaterializationsPerTick =
        readInt(table, "max_materializations_per_tick", streaming.maxMaterializationsPerTick);
    if (auto randomize = table["randomize_selection"].value<bool>())
    {
        streaming.randomizeSelection = *randomize;
    }
}

void applyAssets(const toml::table& table, AssetSettings& assets)
{
    if (auto floor = table["floor"].value<std::string>())
    {
        assets.floorArchetype = *floor;
    }
    if (auto object = table["object"].value<std::string>())
    {
        assets.objectArchetype = *object;
    }
}

} // namespace

void WorldConfig::validate(const std::filesystem::path& source) const
{
    if (grid.scale <= 0)
    {
        failSetting("grid.scale", source, "must be positive");
    }
    if (grid.renderDistance <= 0)
    {
        failSetting("grid.render_distance", source, "must be positive");
    }

    requirePositive(terrain.heightStep, "terrain.height_step", source);
    requirePositive(terrain.smoothness, "terrain.smoothness", source);
    if (!std::isfinite(terrain.originHeight) || !std::isfinite(terrain.heightVariationScale) ||
        !std::isfinite(terrain.heightAmplitude))
    {
        failSetting("terrain", source, "must contain finite values");
    }

    if (objects.minPerChunk < 0 || objects.maxPerChunk < objects.minPerChunk)
    {
        failSetting("objects.min_per_chunk", source, "must be non-negative and not exceed objects.max_per_chunk");
    }
    if (!std::isfinite(objects.minDistance) || objects.minDistance < 0.0f)
    {
        failSetting("objects.min_distance", source, "must be non-negative");
    }
    if (objects.maxPlacementAttempts <= 0)
    {
        failSetting("objects.max_placement_attempts", source, "must be positive");
    }
    if (!std::isfinite(objects.footprint) || objects.footprint <= 0.0f || objects.footprint > 1.0f)
    {
        failSetting("objects.footprint", source, "must be in (0, 1]");
    }
    if (!std::isfinite(objects.groundClearance))
    {
        failSetting("objects.ground_clearance", source, "must be finite");
    }

    if (!std::isfinite(streaming.cooldownSeconds) || streaming.cooldownSeconds < 0.0)
    {
        failSetting("streaming.cooldown_seconds", source, "must be non-negative");
    }
    if (streaming.maxEvictionsPerTick <= 0)
    {
        failSetting("streaming.max_evictions_per_tick", source, "must be positive");
    }
    if (streaming.maxMaterializationsPerTick <= 0)
    {
        failSetting("streaming.max_materializations_per_tick", source, "must be positive");
    }
}

WorldConfig WorldConfig::load(const std::filesystem::path& path)
{
    WorldConfig config{};
    if (!std::filesystem::exists(path))
    {
        std::cout << "[WorldConfig] " << path << " not found, using defaults" << std::endl;
        return config;
    }

    toml::table table = toml::parse_file(path.string());

    if (auto seedValue = table["seed"].value<std::int64_t>())
    {
        if (*seedValue < 0 || *seedValue > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        {
            std::ostringstream oss;
            oss << "Seed value out of range in " << path;
            throw std::runtime_error(oss.str());
        }
        config.worldSeed = static_cast<std::uint32_t>(*seedValue);
    }

    if (const toml::table* gridTable = table["grid"].as_table())
    {
        applyGrid(*gridTable, config.grid);
    }
    if (const toml::table* terrainTable = table["terrain"].as_table())
    {
        applyTerrain(*terrainTable, config.terrain);
    }
    if (const toml::table* objectsTable = table["objects"].as_table())
    {
        applyObjects(*objectsTable, config.objects);
    }
    if (const toml::table* streamingTable = table["streaming"].as_table())
    {
        applyStreaming(*streamingTable, config.streaming);
    }
    if (const toml::table* assetsTable = table["assets"].as_table())
    {
        applyAssets(*assetsTable, config.assets);
    }

    config.validate(path);
    return config;
}

} // namespace worldstream
