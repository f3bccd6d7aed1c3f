#pragma once
// streaming_world.h
// Owning context for one streamed world: configuration, generators, cache, persistence and scheduler.
// Independent instances share nothing.

#include <cstdint>
#include <optional>

#include <glm/vec2.hpp>

#include "asset_catalog.h"
#include "chunk_cache.h"
#include "grid_indexer.h"
#include "persistence_store.h"
#include "streaming_scheduler.h"
#include "terrain/height_field.h"
#include "terrain/object_placer.h"
#include "world_composer.h"
#include "world_config.h"

namespace worldstream
{

class StreamingWorld
{
public:
    StreamingWorld(WorldConfig config,
                   WorldComposer& composer,
                   std::uint32_t selectionSeed = 0,
                   StreamingScheduler::TimeSource timeSource = &StreamingScheduler::Clock::now);

    StreamingWorld(const StreamingWorld&) = delete;
    StreamingWorld& operator=(const StreamingWorld&) = delete;

    void setCatalog(AssetCatalog catalog);

    TickReport tick(float observerX, float observerZ);
    TickReport tick(const glm::vec2& observer);

    PersistedSet saveAll();
    [[nodiscard]] PersistedSet exportAll() const;
    void importAll(std::optional<PersistedSet> data);
    void clearSaved() noexcept;

    [[nodiscard]] const WorldConfig& config() const noexcept { return config_; }
    [[nodiscard]] const GridIndexer& indexer() const noexcept { return indexer_; }
    [[nodiscard]] const terrain::HeightField& heightField() const noexcept { return heightField_; }
    [[nodiscard]] const terrain::ObjectPlacer& objectPlacer() const noexcept { return objectPlacer_; }
    [[nodiscard]] PersistenceStore& store() noexcept { return store_; }
    [[nodiscard]] ChunkCache& cache() noexcept { return cache_; }
    [[nodiscard]] StreamingScheduler& scheduler() noexcept { return scheduler_; }

private:
    WorldConfig config_;
    GridIndexer indexer_;
    terrain::HeightField heightField_;
    terrain::ObjectPlacer objectPlacer_;
    PersistenceStore store_;
    ChunkCache cache_;
    StreamingScheduler scheduler_;
};

} // namespace worldstream
