#include "persistence_store.h"

#include <iostream>
#include <unordered_map>
#include <utility>

namespace worldstream
{
namespace
{
// An entry already filed under its own key wins; otherwise the lower source key does.
bool prefersIncoming(const ChunkKey& canonical, const ChunkKey& incoming, const ChunkKey& kept) noexcept
{
    const bool incomingExact = incoming == canonical;
    const bool keptExact = kept == canonical;
    if (incomingExact != keptExact)
    {
        return incomingExact;
    }
    return incoming.packed() < kept.packed();
}
} // namespace

PersistenceStore::PersistenceStore(const GridIndexer& indexer) noexcept
    : indexer_(indexer)
{
}

ChunkSnapshot PersistenceStore::makeSnapshot(const Chunk& chunk)
{
    return ChunkSnapshot{chunk.coord, chunk.height, chunk.placements};
}

const ChunkSnapshot& PersistenceStore::snapshot(const Chunk& chunk)
{
    const ChunkKey key = indexer_.chunkKey(chunk.coord);
    auto result = persisted_.insert_or_assign(key, makeSnapshot(chunk));
    return result.first->second;
}

const ChunkSnapshot* PersistenceStore::find(const ChunkCoord& coord) const noexcept
{
    auto it = persisted_.find(indexer_.chunkKey(coord));
    return it != persisted_.end() ? &it->second : nullptr;
}

bool PersistenceStore::contains(const ChunkCoord& coord) const noexcept
{
    return find(coord) != nullptr;
}

PersistedSet PersistenceStore::exportAll() const
{
    return persisted_;
}

void PersistenceStore::importAll(std::optional<PersistedSet> data)
{
    persisted_.clear();
    if (!data)
    {
        return;
    }

    // Key each kept entry was filed under, to settle collisions independently of iteration order.
    std::unordered_map<ChunkKey, ChunkKey, ChunkKeyHasher> sourceKeys;
    sourceKeys.reserve(data->size());
    persisted_.reserve(data->size());

    for (auto& [key, snapshot] : *data)
    {
        snapshot.coord = indexer_.snapToGrid(snapshot.coord);
        const ChunkKey canonical = indexer_.chunkKey(snapshot.coord);
        if (canonical != key)
        {
            std::cerr << "[PersistenceStore] Re-keyed snapshot at (" << snapshot.coord.x << ", " << snapshot.coord.z
                      << ")" << std::endl;
        }

        auto existing = sourceKeys.find(canonical);
        if (existing != sourceKeys.end())
        {
            std::cerr << "[PersistenceStore] Two snapshots map to (" << snapshot.coord.x << ", " << snapshot.coord.z
                      << "), keeping one" << std::endl;
            if (!prefersIncoming(canonical, key, existing->second))
            {
                continue;
            }
            existing->second = key;
        }
        else
        {
            sourceKeys.emplace(canonical, key);
        }
        persisted_.insert_or_assign(canonical, std::move(snapshot));
    }
}

void PersistenceStore::clear() noexcept
{
    persisted_.clear();
}

} // namespace worldstream
