#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

#include "grid_indexer.h"
#include "terrain/height_field.h"
#include "terrain/object_placer.h"
#include "world_config.h"

namespace
{

constexpr int kDefaultRadius = 6;

int parseRadius(int argc, char** argv)
{
    if (argc < 2)
    {
        return kDefaultRadius;
    }

    const int radius = std::stoi(argv[1]);
    return radius > 0 ? radius : kDefaultRadius;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        const int radius = parseRadius(argc, argv);
        const std::string configPath = argc > 2 ? argv[2] : "assets/worldstream.toml";
        const worldstream::WorldConfig config = worldstream::WorldConfig::load(configPath);

        const worldstream::GridIndexer indexer(config.grid.scale);
        const worldstream::terrain::HeightField heightField(config.terrain, config.worldSeed);
        const worldstream::terrain::ObjectPlacer placer(config.objects, config.grid.scale, config.worldSeed);

        std::cout << "seed " << config.worldSeed << ", grid " << config.grid.scale << ", step "
                  << config.terrain.heightStep << '\n';
        std::cout << "height/objects per chunk, rows are Z from -" << radius << " to +" << radius << '\n';

        for (int cellZ = -radius; cellZ <= radius; ++cellZ)
        {
            for (int cellX = -radius; cellX <= radius; ++cellX)
            {
                const worldstream::ChunkCoord coord = indexer.coordFromKey({cellX, cellZ});
                const float height = heightField.computeHeight(coord);
                const std::size_t objects = placer.generatePlacements(coord).size();
                std::cout << std::setw(5) << height << '/' << objects;
            }
            std::cout << '\n';
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
