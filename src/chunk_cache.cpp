#include "chunk_cache.h"

#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "terrain/height_field.h"
#include "terrain/object_placer.h"

namespace worldstream
{

ChunkCache::ChunkCache(const WorldConfig& config,
                       const GridIndexer& indexer,
                       const terrain::HeightField& heightField,
                       const terrain::ObjectPlacer& objectPlacer,
                       PersistenceStore& store,
                       WorldComposer& composer)
    : config_(config),
      indexer_(indexer),
      heightField_(heightField),
      objectPlacer_(objectPlacer),
      store_(store),
      composer_(composer)
{
}

void ChunkCache::setCatalog(AssetCatalog catalog)
{
    catalog_ = std::move(catalog);
}

void ChunkCache::warn(const ChunkCoord& coord, WarningKind kind, std::string message)
{
    std::cerr << "[ChunkCache] warning (" << coord.x << ", " << coord.z << "): " << message << std::endl;
    warnings_.push_back(StreamWarning{coord, kind, std::move(message)});
}

bool ChunkCache::isActive(const ChunkCoord& coord) const noexcept
{
    return active_.find(indexer_.chunkKey(coord)) != active_.end();
}

const Chunk* ChunkCache::find(const ChunkCoord& coord) const noexcept
{
    auto it = active_.find(indexer_.chunkKey(coord));
    return it != active_.end() ? &it->second : nullptr;
}

Chunk ChunkCache::buildChunk(const ChunkCoord& coord, MaterializeOutcome& outcome)
{
    Chunk chunk{};
    chunk.coord = coord;

    if (const ChunkSnapshot* saved = store_.find(coord))
    {
        if (saved->height)
        {
            chunk.height = *saved->height;
        }
        else
        {
            chunk.height = config_.terrain.originHeight;
            warn(coord, WarningKind::MissingSnapshotHeight, "snapshot has no height, using origin height");
        }
        chunk.placements = saved->placements;
        outcome = MaterializeOutcome::Revived;
        return chunk;
    }

    chunk.height = heightField_.computeHeight(coord);
    chunk.placements = objectPlacer_.generatePlacements(coord);
    outcome = MaterializeOutcome::Generated;
    return chunk;
}

SpawnRequest ChunkCache::buildSpawnRequest(const Chunk& chunk, const Archetype& floor)
{
    SpawnRequest request{};
    request.coord = chunk.coord;
    request.height = chunk.height;
    request.floor = &floor;

    if (chunk.placements.empty())
    {
        return request;
    }

    const std::string& objectName = config_.assets.objectArchetype;
    const Archetype* object = catalog_.findObject(objectName);
    if (!object)
    {
        std::ostringstream oss;
        oss << "object archetype '" << objectName << "' is missing, skipped " << chunk.placements.size()
            << " objects";
        warn(chunk.coord, WarningKind::MissingObjectArchetype, oss.str());
        return request;
    }

    request.objects.reserve(chunk.placements.size());
    for (const ObjectPlacement& placement : chunk.placements)
    {
        if (!object->anchored)
        {
            warn(chunk.coord, WarningKind::MissingObjectArchetype,
                 "object archetype '" + objectName + "' has no anchor, skipped one object");
            continue;
        }
        request.objects.push_back(ObjectSpawn{placement, object});
    }
    return request;
}

MaterializeOutcome ChunkCache::materialize(const ChunkCoord& requested)
{
    const ChunkCoord coord = indexer_.snapToGrid(requested);
    const ChunkKey key = indexer_.chunkKey(coord);
    if (active_.find(key) != active_.end())
    {
        return MaterializeOutcome::AlreadyActive;
    }

    const Archetype* floor = catalog_.findFloor(config_.assets.floorArchetype);
    if (!floor || !floor->anchored)
    {
        warn(coord, WarningKind::UnusableFloorArchetype,
             "floor archetype '" + config_.assets.floorArchetype + "' is missing or has no anchor, chunk not created");
        return MaterializeOutcome::Failed;
    }

    MaterializeOutcome outcome = MaterializeOutcome::Failed;
    Chunk chunk = buildChunk(coord, outcome);

    const SpawnRequest request = buildSpawnRequest(chunk, *floor);
    try
    {
        chunk.handle = composer_.spawn(request);
    }
    catch (const std::exception& ex)
    {
        warn(coord, WarningKind::SpawnFailed, std::string("spawn failed: ") + ex.what());
        return MaterializeOutcome::Failed;
    }

    std::cout << "[ChunkCache] + chunk (" << coord.x << ", " << coord.z << ") "
              << (outcome == MaterializeOutcome::Revived ? "revived" : "generated") << ", height "
              << chunk.height << ", objects " << chunk.placements.size() << std::endl;

    active_.emplace(key, std::move(chunk));
    return outcome;
}

bool ChunkCache::evict(const ChunkCoord& requested)
{
    auto it = active_.find(indexer_.chunkKey(requested));
    if (it == active_.end())
    {
        return false;
    }

    const Chunk& chunk = it->second;
    store_.snapshot(chunk);

    try
    {
        composer_.destroy(chunk.handle);
    }
    catch (const std::exception& ex)
    {
        warn(chunk.coord, WarningKind::DestroyFailed, std::string("destroy failed: ") + ex.what());
    }

    std::cout << "[ChunkCache] - chunk (" << chunk.coord.x << ", " << chunk.coord.z << ")" << std::endl;
    active_.erase(it);
    return true;
}

PersistedSet ChunkCache::saveAll()
{
    for (const auto& [key, chunk] : active_)
    {
        store_.snapshot(chunk);
    }
    return store_.exportAll();
}

void ChunkCache::clear()
{
    std::vector<ChunkCoord> toEvict;
    toEvict.reserve(active_.size());
    for (const auto& [key, chunk] : active_)
    {
        toEvict.push_back(chunk.coord);
    }

    for (const ChunkCoord& coord : toEvict)
    {
        evict(coord);
    }
}

std::vector<StreamWarning> ChunkCache::takeWarnings()
{
    std::vector<StreamWarning> drained;
    drained.swap(warnings_);
    return drained;
}

} // namespace worldstream
