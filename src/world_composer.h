#pragma once
// world_composer.h
// Boundary to whatever turns chunk data into renderable/collidable instances.

#include <vector>

#include "asset_catalog.h"
#include "chunk_types.h"

namespace worldstream
{

struct ObjectSpawn
{
    ObjectPlacement placement{};
    const Archetype* archetype{nullptr};
};

struct SpawnRequest
{
    ChunkCoord coord{};
    float height{0.0f};
    const Archetype* floor{nullptr};
    // Only objects whose archetype is usable; skipped ones are reported by the cache instead.
    std::vector<ObjectSpawn> objects;
};

class WorldComposer
{
public:
    virtual ~WorldComposer() = default;

    // Either returns a usable handle or throws; a partially built chunk is never returned.
    virtual ChunkHandle spawn(const SpawnRequest& request) = 0;
    virtual void destroy(ChunkHandle handle) = 0;
};

} // namespace worldstream
