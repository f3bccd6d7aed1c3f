#include "asset_catalog.h"

#include <string>
#include <utility>

namespace worldstream
{

void AssetCatalog::addFloor(Archetype archetype)
{
    std::string key = archetype.name;
    floors_.insert_or_assign(std::move(key), std::move(archetype));
}

void AssetCatalog::addObject(Archetype archetype)
{
    std::string key = archetype.name;
    objects_.insert_or_assign(std::move(key), std::move(archetype));
}

const Archetype* AssetCatalog::findFloor(std::string_view name) const noexcept
{
    return find(floors_, name);
}

const Archetype* AssetCatalog::findObject(std::string_view name) const noexcept
{
    return find(objects_, name);
}

const Archetype* AssetCatalog::find(const std::unordered_map<std::string, Archetype>& table,
                                    std::string_view name) noexcept
{
    auto it = table.find(std::string(name));
    return it != table.end() ? &it->second : nullptr;
}

} // namespace worldstream
