#include "asset_catalog.h"
#include "snapshot_archive.h"
#include "streaming_world.h"
#include "world_composer.h"
#include "world_config.h"

#include <glm/vec2.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_map>

namespace
{
using namespace worldstream;

constexpr int kWalkTicks = 240;
constexpr float kWalkStep = 16.0f;
constexpr std::uint32_t kSelectionSeed = 0x5eedu;

// Stands in for a renderer: hands out handles and remembers what each one holds.
class ConsoleComposer final : public WorldComposer
{
public:
    ChunkHandle spawn(const SpawnRequest& request) override
    {
        const ChunkHandle handle = nextHandle_++;
        live_.emplace(handle, request.objects.size());
        objectsSpawned_ += request.objects.size();
        return handle;
    }

    void destroy(ChunkHandle handle) override
    {
        live_.erase(handle);
    }

    [[nodiscard]] std::size_t liveChunks() const noexcept { return live_.size(); }
    [[nodiscard]] std::size_t objectsSpawned() const noexcept { return objectsSpawned_; }

private:
    ChunkHandle nextHandle_{1};
    std::unordered_map<ChunkHandle, std::size_t> live_;
    std::size_t objectsSpawned_{0};
};

AssetCatalog makeDemoCatalog(const WorldConfig& config)
{
    AssetCatalog catalog;
    catalog.addFloor(Archetype{config.assets.floorArchetype, 1, true});
    catalog.addObject(Archetype{config.assets.objectArchetype, 2, true});
    return catalog;
}

void walk(StreamingWorld& world, glm::vec2& observer, const glm::vec2& direction, int ticks)
{
    for (int i = 0; i < ticks; ++i)
    {
        observer += direction * kWalkStep;
        const TickReport report = world.tick(observer);
        for (const StreamWarning& warning : report.warnings)
        {
            std::cerr << "[Demo] " << toString(warning.kind) << ": " << warning.message << std::endl;
        }
    }
}

int runDemo(const std::filesystem::path& configPath, const std::filesystem::path& archivePath)
{
    WorldConfig config = WorldConfig::load(configPath);
    ConsoleComposer composer;
    StreamingWorld world(config, composer, kSelectionSeed);
    world.setCatalog(makeDemoCatalog(world.config()));

    if (std::filesystem::exists(archivePath))
    {
        world.importAll(readArchive(archivePath, world.indexer()));
        std::cout << "Imported " << world.store().size() << " saved chunks from " << archivePath << std::endl;
    }

    glm::vec2 observer{0.0f, 0.0f};
    walk(world, observer, glm::vec2(1.0f, 0.0f), kWalkTicks);
    walk(world, observer, glm::vec2(-1.0f, 0.0f), kWalkTicks);

    const StreamingStats& stats = world.scheduler().stats();
    std::cout << "Ticks: " << stats.ticks << " (throttled " << stats.throttledTicks << ")"
              << ", generated: " << stats.generatedChunks << ", revived: " << stats.revivedChunks
              << ", evicted: " << stats.evictedChunks << ", failed: " << stats.failedMaterializations << std::endl;
    std::cout << "Live chunks: " << composer.liveChunks() << ", objects spawned: " << composer.objectsSpawned()
              << std::endl;

    const PersistedSet saved = world.saveAll();
    writeArchive(archivePath, saved, world.config().grid.scale);
    std::cout << "Saved " << saved.size() << " chunks to " << archivePath << std::endl;
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
    const std::filesystem::path configPath = argc > 1 ? argv[1] : "assets/worldstream.toml";
    const std::filesystem::path archivePath = argc > 2 ? argv[2] : "worldstream_save.toml";

    try
    {
        return runDemo(configPath, archivePath);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unhandled exception: " << e.what() << '\n';
    }

    return EXIT_FAILURE;
}
