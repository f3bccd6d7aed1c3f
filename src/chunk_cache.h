#pragma once
// chunk_cache.h
// Owns the active chunk set and decides, per chunk, between reviving a snapshot and generating afresh.

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "asset_catalog.h"
#include "chunk_types.h"
#include "grid_indexer.h"
#include "persistence_store.h"
#include "world_composer.h"
#include "world_config.h"

namespace worldstream
{

namespace terrain
{
class HeightField;
class ObjectPlacer;
} // namespace terrain

enum class MaterializeOutcome : std::uint8_t
{
    AlreadyActive = 0,
    Revived,
    Generated,
    Failed
};

using ActiveSet = std::unordered_map<ChunkKey, Chunk, ChunkKeyHasher>;

class ChunkCache
{
public:
    ChunkCache(const WorldConfig& config,
               const GridIndexer& indexer,
               const terrain::HeightField& heightField,
               const terrain::ObjectPlacer& objectPlacer,
               PersistenceStore& store,
               WorldComposer& composer);

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    void setCatalog(AssetCatalog catalog);
    [[nodiscard]] const AssetCatalog& catalog() const noexcept { return catalog_; }

    MaterializeOutcome materialize(const ChunkCoord& coord);
    bool evict(const ChunkCoord& coord);

    [[nodiscard]] bool isActive(const ChunkCoord& coord) const noexcept;
    [[nodiscard]] const Chunk* find(const ChunkCoord& coord) const noexcept;
    [[nodiscard]] const ActiveSet& active() const noexcept { return active_; }
    [[nodiscard]] std::size_t activeCount() const noexcept { return active_.size(); }

    // Snapshots every active chunk without evicting it and returns the whole persisted set.
    PersistedSet saveAll();

    // Evicts every active chunk, snapshotting each one.
    void clear();

    [[nodiscard]] std::vector<StreamWarning> takeWarnings();
    [[nodiscard]] std::size_t pendingWarningCount() const noexcept { return warnings_.size(); }

private:
    void warn(const ChunkCoord& coord, WarningKind kind, std::string message);
    Chunk buildChunk(const ChunkCoord& coord, MaterializeOutcome& outcome);
    SpawnRequest buildSpawnRequest(const Chunk& chunk, const Archetype& floor);

    const WorldConfig& config_;
    const GridIndexer& indexer_;
    const terrain::HeightField& heightField_;
    const terrain::ObjectPlacer& objectPlacer_;
    PersistenceStore& store_;
    WorldComposer& composer_;

    AssetCatalog catalog_;
    ActiveSet active_;
    std::vector<StreamWarning> warnings_;
};

} // namespace worldstream
