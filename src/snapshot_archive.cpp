#include "snapshot_archive.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <toml++/toml.h>

namespace worldstream
{
namespace
{
bool fitsInt(std::int64_t value)
{
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

std::optional<ObjectPlacement> readPlacement(const toml::node& node)
{
    const toml::array* triple = node.as_array();
    if (!triple || triple->size() != 3)
    {
        return std::nullopt;
    }

    const std::optional<double> x = (*triple)[0].value<double>();
    const std::optional<double> y = (*triple)[1].value<double>();
    const std::optional<double> z = (*triple)[2].value<double>();
    if (!x || !y || !z)
    {
        return std::nullopt;
    }

    return ObjectPlacement{static_cast<float>(*x), static_cast<float>(*y), static_cast<float>(*z)};
}

std::optional<ChunkSnapshot> readChunk(const toml::table& table, std::size_t index)
{
    const std::optional<std::int64_t> x = table["x"].value<std::int64_t>();
    const std::optional<std::int64_t> z = table["z"].value<std::int64_t>();
    if (!x || !z)
    {
        std::cerr << "[SnapshotArchive] chunk #" << index << " has no coordinates, skipped" << std::endl;
        return std::nullopt;
    }
    if (!fitsInt(*x) || !fitsInt(*z))
    {
        std::cerr << "[SnapshotArchive] chunk #" << index << " has coordinates out of range, skipped" << std::endl;
        return std::nullopt;
    }

    ChunkSnapshot snapshot{};
    snapshot.coord = ChunkCoord{static_cast<int>(*x), static_cast<int>(*z)};
    if (auto height = table["height"].value<double>())
    {
        snapshot.height = static_cast<float>(*height);
    }
    else
    {
        std::cerr << "[SnapshotArchive] chunk (" << *x << ", " << *z << ") has no height" << std::endl;
    }

    if (const toml::array* objects = table["objects"].as_array())
    {
        snapshot.placements.reserve(objects->size());
        for (const toml::node& node : *objects)
        {
            if (auto placement = readPlacement(node))
            {
                snapshot.placements.push_back(*placement);
            }
            else
            {
                std::cerr << "[SnapshotArchive] chunk (" << *x << ", " << *z << ") has a malformed object, skipped"
                          << std::endl;
            }
        }
    }

    return snapshot;
}

} // namespace

std::string formatArchive(const PersistedSet& persisted, int gridScale)
{
    std::vector<const ChunkSnapshot*> ordered;
    ordered.reserve(persisted.size());
    for (const auto& [key, snapshot] : persisted)
    {
        ordered.push_back(&snapshot);
    }
    std::sort(ordered.begin(), ordered.end(), [](const ChunkSnapshot* lhs, const ChunkSnapshot* rhs) {
        return lhs->coord.x != rhs->coord.x ? lhs->coord.x < rhs->coord.x : lhs->coord.z < rhs->coord.z;
    });

    toml::array chunks;
    for (const ChunkSnapshot* snapshot : ordered)
    {
        toml::table entry;
        entry.insert("x", static_cast<std::int64_t>(snapshot->coord.x));
        entry.insert("z", static_cast<std::int64_t>(snapshot->coord.z));
        if (snapshot->height)
        {
            entry.insert("height", static_cast<double>(*snapshot->height));
        }

        toml::array objects;
        for (const ObjectPlacement& placement : snapshot->placements)
        {
            objects.push_back(toml::array{static_cast<double>(placement.offsetX),
                                          static_cast<double>(placement.offsetY),
                                          static_cast<double>(placement.offsetZ)});
        }
        entry.insert("objects", std::move(objects));
        chunks.push_back(std::move(entry));
    }

    toml::table root;
    root.insert("version", static_cast<std::int64_t>(kSnapshotArchiveVersion));
    root.insert("grid_scale", static_cast<std::int64_t>(gridScale));
    root.insert("chunk", std::move(chunks));

    std::ostringstream oss;
    oss << root << '\n';
    return oss.str();
}

std::optional<PersistedSet> parseArchive(std::string_view text, const GridIndexer& indexer)
{
    toml::table root;
    try
    {
        root = toml::parse(text);
    }
    catch (const toml::parse_error& err)
    {
        std::cerr << "[SnapshotArchive] parse error: " << err.description() << std::endl;
        return std::nullopt;
    }

    const std::optional<std::int64_t> version = root["version"].value<std::int64_t>();
    if (!version || *version != kSnapshotArchiveVersion)
    {
        std::cerr << "[SnapshotArchive] unsupported archive version" << std::endl;
        return std::nullopt;
    }

    if (auto gridScale = root["grid_scale"].value<std::int64_t>(); gridScale && *gridScale != indexer.gridScale())
    {
        std::cerr << "[SnapshotArchive] archive grid scale " << *gridScale << " differs from " << indexer.gridScale()
                  << std::endl;
    }

    PersistedSet persisted;
    const toml::array* chunks = root["chunk"].as_array();
    if (!chunks)
    {
        return persisted;
    }

    for (std::size_t index = 0; index < chunks->size(); ++index)
    {
        const toml::table* table = chunks->get(index)->as_table();
        if (!table)
        {
            std::cerr << "[SnapshotArchive] chunk #" << index << " is not a table, skipped" << std::endl;
            continue;
        }

        if (auto snapshot = readChunk(*table, index))
        {
            snapshot->coord = indexer.snapToGrid(snapshot->coord);
            const ChunkKey key = indexer.chunkKey(snapshot->coord);
            persisted.insert_or_assign(key, std::move(*snapshot));
        }
    }

    return persisted;
}

void writeArchive(const std::filesystem::path& path, const PersistedSet& persisted, int gridScale)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        std::ostringstream oss;
        oss << "Failed to open " << path << " for writing";
        throw std::runtime_error(oss.str());
    }

    out << formatArchive(persisted, gridScale);
    if (!out)
    {
        std::ostringstream oss;
        oss << "Failed to write snapshot archive " << path;
        throw std::runtime_error(oss.str());
    }
}

std::optional<PersistedSet> readArchive(const std::filesystem::path& path, const GridIndexer& indexer)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    return parseArchive(contents.str(), indexer);
}

} // namespace worldstream
