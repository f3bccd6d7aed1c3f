#pragma once

#include <cstddef>
#include <optional>

#include "chunk_types.h"
#include "grid_indexer.h"

namespace worldstream
{

// Handle-free snapshots of every chunk that has left the active set. Revival reads entries without
// consuming them, so a chunk can cycle in and out of range indefinitely.
class PersistenceStore
{
public:
    explicit PersistenceStore(const GridIndexer& indexer) noexcept;

    [[nodiscard]] static ChunkSnapshot makeSnapshot(const Chunk& chunk);

    // Stores a snapshot of `chunk`, replacing any earlier one at the same key.
    const ChunkSnapshot& snapshot(const Chunk& chunk);

    [[nodiscard]] const ChunkSnapshot* find(const ChunkCoord& coord) const noexcept;
    [[nodiscard]] bool contains(const ChunkCoord& coord) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return persisted_.size(); }

    [[nodiscard]] PersistedSet exportAll() const;

    // Replaces the store. An empty optional clears it. Entries are re-keyed from their coordinates.
    void importAll(std::optional<PersistedSet> data);

    void clear() noexcept;

private:
    const GridIndexer& indexer_;
    PersistedSet persisted_;
};

} // namespace worldstream
