#include <cassert>
#include <iostream>
#include <optional>

#include "grid_indexer.h"
#include "persistence_store.h"

using namespace worldstream;

namespace
{
Chunk makeChunk(int x, int z, float height)
{
    Chunk chunk{};
    chunk.coord = {x, z};
    chunk.height = height;
    chunk.placements = {{1.5f, 78.897f, -2.25f}, {-30.0f, 78.897f, 12.0f}};
    chunk.handle = 42;
    return chunk;
}
}

void test_snapshot_drops_handle()
{
    std::cout << "Running test_snapshot_drops_handle..." << std::endl;
    const Chunk chunk = makeChunk(128, -256, 8.0f);
    const ChunkSnapshot snapshot = PersistenceStore::makeSnapshot(chunk);
    assert(snapshot.coord == chunk.coord);
    assert(snapshot.height && *snapshot.height == 8.0f);
    assert(snapshot.placements == chunk.placements);
    std::cout << "PASSED" << std::endl;
}

void test_snapshot_overwrites()
{
    std::cout << "Running test_snapshot_overwrites..." << std::endl;
    GridIndexer indexer(128);
    PersistenceStore store(indexer);

    store.snapshot(makeChunk(0, 128, 4.0f));
    store.snapshot(makeChunk(0, 128, -8.0f));
    assert(store.size() == 1u);
    const ChunkSnapshot* found = store.find({0, 128});
    assert(found && found->height && *found->height == -8.0f);
    assert(store.contains({0, 128}));
    assert(!store.contains({128, 0}));
    assert(store.find({0, 256}) == nullptr);
    std::cout << "PASSED" << std::endl;
}

void test_export_clear_import()
{
    std::cout << "Running test_export_clear_import..." << std::endl;
    GridIndexer indexer(128);
    PersistenceStore store(indexer);
    for (int i = -3; i <= 3; ++i)
    {
        store.snapshot(makeChunk(i * 128, i * -256, static_cast<float>(i * 4)));
    }

    const PersistedSet exported = store.exportAll();
    store.clear();
    assert(store.size() == 0u);

    store.importAll(exported);
    assert(store.exportAll() == exported);
    assert(store.size() == 7u);
    std::cout << "PASSED" << std::endl;
}

void test_import_absent_data()
{
    std::cout << "Running test_import_absent_data..." << std::endl;
    GridIndexer indexer(128);
    PersistenceStore store(indexer);
    store.snapshot(makeChunk(0, 0, 0.0f));

    store.importAll(std::nullopt);
    assert(store.size() == 0u);
    std::cout << "PASSED" << std::endl;
}

void test_import_rekeys_entries()
{
    std::cout << "Running test_import_rekeys_entries..." << std::endl;
    GridIndexer indexer(128);
    PersistenceStore store(indexer);

    PersistedSet data;
    ChunkSnapshot snapshot{};
    snapshot.coord = {256, -128};
    snapshot.height = 4.0f;
    data.emplace(ChunkKey{99, 99}, snapshot);

    ChunkSnapshot heightless{};
    heightless.coord = {-384, 0};
    data.emplace(indexer.chunkKey(heightless.coord), heightless);

    store.importAll(data);
    assert(store.size() == 2u);
    const ChunkSnapshot* moved = store.find({256, -128});
    assert(moved && *moved == snapshot);
    const ChunkSnapshot* partial = store.find({-384, 0});
    assert(partial && !partial->height);
    std::cout << "PASSED" << std::endl;
}

void test_import_collision_is_deterministic()
{
    std::cout << "Running test_import_collision_is_deterministic..." << std::endl;
    GridIndexer indexer(128);
    PersistenceStore store(indexer);

    const auto snapshotAt = [](int x, int z, float height) {
        ChunkSnapshot snapshot{};
        snapshot.coord = {x, z};
        snapshot.height = height;
        return snapshot;
    };

    // Correctly keyed entry beats a stray one landing on the same cell.
    PersistedSet data;
    data.emplace(ChunkKey{0, 0}, snapshotAt(0, 0, 1.0f));
    data.emplace(ChunkKey{5, 5}, snapshotAt(10, 0, 2.0f));
    store.importAll(data);
    assert(store.size() == 1u);
    assert(store.find({0, 0})->height == 1.0f);

    // Between two stray entries the lower source key wins, whatever the iteration order.
    PersistedSet strays;
    strays.emplace(ChunkKey{9, 9}, snapshotAt(-3, 0, 4.0f));
    strays.emplace(ChunkKey{7, 7}, snapshotAt(3, 0, 3.0f));
    store.importAll(strays);
    assert(store.size() == 1u);
    assert(store.find({0, 0})->height == 3.0f);
    std::cout << "PASSED" << std::endl;
}

int main()
{
    test_snapshot_drops_handle();
    test_snapshot_overwrites();
    test_export_clear_import();
    test_import_absent_data();
    test_import_rekeys_entries();
    test_import_collision_is_deterministic();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
