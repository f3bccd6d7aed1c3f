#pragma once
// chunk_types.h
// Value types shared by the indexer, generators, cache and persistence layer.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace worldstream
{

// Grid-aligned chunk origin; both axes are multiples of the grid scale.
struct ChunkCoord
{
    int x{0};
    int z{0};

    bool operator==(const ChunkCoord& other) const noexcept
    {
        return x == other.x && z == other.z;
    }
    bool operator!=(const ChunkCoord& other) const noexcept { return !(*this == other); }
};

// Cell index of a chunk (coord divided by the grid scale).
struct ChunkKey
{
    int cellX{0};
    int cellZ{0};

    bool operator==(const ChunkKey& other) const noexcept
    {
        return cellX == other.cellX && cellZ == other.cellZ;
    }
    bool operator!=(const ChunkKey& other) const noexcept { return !(*this == other); }

    [[nodiscard]] std::uint64_t packed() const noexcept
    {
        return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(cellX)) << 32) |
               static_cast<std::uint64_t>(static_cast<std::uint32_t>(cellZ));
    }
};

struct ChunkKeyHasher
{
    std::size_t operator()(const ChunkKey& key) const noexcept
    {
        std::size_t hash = static_cast<std::size_t>(key.cellX) * 73856093u;
        hash ^= static_cast<std::size_t>(key.cellZ) * 19349663u;
        return hash;
    }
};

struct ObjectPlacement
{
    float offsetX{0.0f};
    float offsetY{0.0f};
    float offsetZ{0.0f};

    bool operator==(const ObjectPlacement& other) const noexcept
    {
        return offsetX == other.offsetX && offsetY == other.offsetY && offsetZ == other.offsetZ;
    }
};

// Opaque reference to a materialized chunk; owned by the world composer.
using ChunkHandle = std::uint64_t;
inline constexpr ChunkHandle kInvalidChunkHandle = 0;

struct Chunk
{
    ChunkCoord coord{};
    float height{0.0f};
    std::vector<ObjectPlacement> placements;
    ChunkHandle handle{kInvalidChunkHandle};
};

struct ChunkSnapshot
{
    ChunkCoord coord{};
    // Empty only when imported from a damaged archive.
    std::optional<float> height{};
    std::vector<ObjectPlacement> placements;

    bool operator==(const ChunkSnapshot& other) const noexcept
    {
        return coord == other.coord && height == other.height && placements == other.placements;
    }
};

using PersistedSet = std::unordered_map<ChunkKey, ChunkSnapshot, ChunkKeyHasher>;

enum class WarningKind : std::uint8_t
{
    MissingObjectArchetype = 0,
    UnusableFloorArchetype,
    SpawnFailed,
    DestroyFailed,
    MissingSnapshotHeight
};

struct StreamWarning
{
    ChunkCoord coord{};
    WarningKind kind{WarningKind::SpawnFailed};
    std::string message;
};

const char* toString(WarningKind kind) noexcept;

} // namespace worldstream
