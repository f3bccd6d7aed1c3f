#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

#include "terrain/object_placer.h"
#include "world_config.h"

using namespace worldstream;
using worldstream::terrain::ObjectPlacer;

namespace
{
bool respectsMinDistance(const std::vector<ObjectPlacement>& placements, float minDistance)
{
    const float minDistanceSq = minDistance * minDistance;
    for (std::size_t i = 0; i < placements.size(); ++i)
    {
        for (std::size_t j = i + 1; j < placements.size(); ++j)
        {
            const float dx = placements[i].offsetX - placements[j].offsetX;
            const float dz = placements[i].offsetZ - placements[j].offsetZ;
            if (dx * dx + dz * dz < minDistanceSq - 1e-3f)
            {
                return false;
            }
        }
    }
    return true;
}
}

void test_count_and_spacing()
{
    std::cout << "Running test_count_and_spacing..." << std::endl;
    WorldConfig config{};
    config.objects.minPerChunk = 2;
    config.objects.maxPerChunk = 7;
    config.objects.minDistance = 10.0f;
    const ObjectPlacer placer(config.objects, 128, config.worldSeed);

    for (int cellX = -12; cellX <= 12; ++cellX)
    {
        for (int cellZ = -12; cellZ <= 12; ++cellZ)
        {
            const std::vector<ObjectPlacement> placements = placer.generatePlacements({cellX * 128, cellZ * 128});
            assert(placements.size() <= 7u);
            assert(!placements.empty());
            assert(respectsMinDistance(placements, 10.0f));
        }
    }
    std::cout << "PASSED" << std::endl;
}

void test_offsets_inside_footprint()
{
    std::cout << "Running test_offsets_inside_footprint..." << std::endl;
    const WorldConfig config{};
    const ObjectPlacer placer(config.objects, 128, config.worldSeed);
    const float halfSpan = 128.0f * config.objects.footprint * 0.5f;

    for (int cellX = -8; cellX <= 8; ++cellX)
    {
        for (const ObjectPlacement& placement : placer.generatePlacements({cellX * 128, 256}))
        {
            assert(std::abs(placement.offsetX) <= halfSpan);
            assert(std::abs(placement.offsetZ) <= halfSpan);
            assert(placement.offsetY == config.objects.groundClearance);
        }
    }
    std::cout << "PASSED" << std::endl;
}

void test_placements_are_deterministic()
{
    std::cout << "Running test_placements_are_deterministic..." << std::endl;
    const WorldConfig config{};
    const ObjectPlacer first(config.objects, 128, config.worldSeed);
    const ObjectPlacer second(config.objects, 128, config.worldSeed);
    const ChunkCoord coord{-384, 1024};

    const std::vector<ObjectPlacement> expected = first.generatePlacements(coord);

    // Unrelated generation and unrelated random streams must not disturb the result.
    std::mt19937 unrelated(1234u);
    (void)unrelated();
    (void)first.generatePlacements({128, 128});
    (void)second.generatePlacements({0, 0});

    assert(first.generatePlacements(coord) == expected);
    assert(second.generatePlacements(coord) == expected);
    assert(first.chunkSeed(coord) == second.chunkSeed(coord));
    assert(first.chunkSeed({0, 0}) == config.worldSeed);
    std::cout << "PASSED" << std::endl;
}

void test_neighbouring_chunks_differ()
{
    std::cout << "Running test_neighbouring_chunks_differ..." << std::endl;
    const WorldConfig config{};
    const ObjectPlacer placer(config.objects, 128, config.worldSeed);
    assert(placer.generatePlacements({0, 0}) != placer.generatePlacements({128, 0}));
    std::cout << "PASSED" << std::endl;
}

void test_exhausted_attempts_underfill()
{
    std::cout << "Running test_exhausted_attempts_underfill..." << std::endl;
    WorldConfig config{};
    config.objects.minPerChunk = 5;
    config.objects.maxPerChunk = 7;
    // Wider than the whole sampling region, so only the first slot can ever succeed.
    config.objects.minDistance = 200.0f;
    const ObjectPlacer placer(config.objects, 128, config.worldSeed);

    for (int cellX = -5; cellX <= 5; ++cellX)
    {
        const std::vector<ObjectPlacement> placements = placer.generatePlacements({cellX * 128, -128});
        assert(placements.size() == 1u);
    }
    std::cout << "PASSED" << std::endl;
}

void test_zero_objects()
{
    std::cout << "Running test_zero_objects..." << std::endl;
    WorldConfig config{};
    config.objects.minPerChunk = 0;
    config.objects.maxPerChunk = 0;
    const ObjectPlacer placer(config.objects, 128, config.worldSeed);
    assert(placer.generatePlacements({512, 512}).empty());
    std::cout << "PASSED" << std::endl;
}

void test_validity_check()
{
    std::cout << "Running test_validity_check..." << std::endl;
    const std::vector<ObjectPlacement> accepted{{0.0f, 0.0f, 0.0f}, {20.0f, 0.0f, 0.0f}};
    assert(!ObjectPlacer::isPlacementValid(accepted, 5.0f, 5.0f, 10.0f));
    assert(ObjectPlacer::isPlacementValid(accepted, 10.0f, 0.0f, 10.0f));
    assert(ObjectPlacer::isPlacementValid(accepted, 10.0f, 10.0f, 10.0f));
    assert(ObjectPlacer::isPlacementValid({}, 0.0f, 0.0f, 10.0f));
    std::cout << "PASSED" << std::endl;
}

int main()
{
    test_count_and_spacing();
    test_offsets_inside_footprint();
    test_placements_are_deterministic();
    test_neighbouring_chunks_differ();
    test_exhausted_attempts_underfill();
    test_zero_objects();
    test_validity_check();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
