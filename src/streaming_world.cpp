#include "streaming_world.h"

#include <iostream>
#include <utility>

namespace worldstream
{
namespace
{
WorldConfig validated(WorldConfig config)
{
    config.validate();
    return config;
}
} // namespace

StreamingWorld::StreamingWorld(WorldConfig config,
                               WorldComposer& composer,
                               std::uint32_t selectionSeed,
                               StreamingScheduler::TimeSource timeSource)
    : config_(validated(std::move(config))),
      indexer_(config_.grid.scale),
      heightField_(config_.terrain, config_.worldSeed),
      objectPlacer_(config_.objects, config_.grid.scale, config_.worldSeed),
      store_(indexer_),
      cache_(config_, indexer_, heightField_, objectPlacer_, store_, composer),
      scheduler_(config_, indexer_, cache_, selectionSeed, std::move(timeSource))
{
}

void StreamingWorld::setCatalog(AssetCatalog catalog)
{
    cache_.setCatalog(std::move(catalog));
}

TickReport StreamingWorld::tick(float observerX, float observerZ)
{
    return scheduler_.tick(glm::vec2(observerX, observerZ));
}

TickReport StreamingWorld::tick(const glm::vec2& observer)
{
    return scheduler_.tick(observer);
}

PersistedSet StreamingWorld::saveAll()
{
    return cache_.saveAll();
}

PersistedSet StreamingWorld::exportAll() const
{
    return store_.exportAll();
}

void StreamingWorld::importAll(std::optional<PersistedSet> data)
{
    if (!data)
    {
        std::cerr << "[StreamingWorld] no saved chunk data to import, starting empty" << std::endl;
    }
    store_.importAll(std::move(data));
}

void StreamingWorld::clearSaved() noexcept
{
    store_.clear();
}

} // namespace worldstream
