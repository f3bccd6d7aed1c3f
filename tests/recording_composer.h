#pragma once

#include <stdexcept>
#include <unordered_set>
#include <vector>

#include "asset_catalog.h"
#include "world_composer.h"
#include "world_config.h"

namespace worldstream::test
{

// Fake composer that keeps every request and can be told to fail.
class RecordingComposer final : public WorldComposer
{
public:
    ChunkHandle spawn(const SpawnRequest& request) override
    {
        if (failNextSpawns > 0)
        {
            --failNextSpawns;
            throw std::runtime_error("composer refused spawn");
        }
        spawns.push_back(request);
        const ChunkHandle handle = nextHandle++;
        live.insert(handle);
        return handle;
    }

    void destroy(ChunkHandle handle) override
    {
        destroyed.push_back(handle);
        live.erase(handle);
        if (failDestroys)
        {
            throw std::runtime_error("composer lost the instance");
        }
    }

    int failNextSpawns{0};
    bool failDestroys{false};
    std::vector<SpawnRequest> spawns;
    std::vector<ChunkHandle> destroyed;
    std::unordered_set<ChunkHandle> live;
    ChunkHandle nextHandle{1};
};

inline AssetCatalog makeCatalog(const WorldConfig& config, bool floorAnchored = true, bool withObject = true)
{
    AssetCatalog catalog;
    catalog.addFloor(Archetype{config.assets.floorArchetype, 1, floorAnchored});
    if (withObject)
    {
        catalog.addObject(Archetype{config.assets.objectArchetype, 2, true});
    }
    return catalog;
}

inline bool hasWarning(const std::vector<StreamWarning>& warnings, WarningKind kind)
{
    for (const StreamWarning& warning : warnings)
    {
        if (warning.kind == kind)
        {
            return true;
        }
    }
    return false;
}

} // namespace worldstream::test
