#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace worldstream
{

// Opaque description of a spawnable asset. The core reads only `anchored`; everything else is for the composer.
struct Archetype
{
    std::string name;
    std::uint32_t id{0};
    bool anchored{false};
};

class AssetCatalog
{
public:
    void addFloor(Archetype archetype);
    void addObject(Archetype archetype);

    [[nodiscard]] const Archetype* findFloor(std::string_view name) const noexcept;
    [[nodiscard]] const Archetype* findObject(std::string_view name) const noexcept;

    [[nodiscard]] std::size_t floorCount() const noexcept { return floors_.size(); }
    [[nodiscard]] std::size_t objectCount() const noexcept { return objects_.size(); }
    [[nodiscard]] bool empty() const noexcept { return floors_.empty() && objects_.empty(); }

private:
    static const Archetype* find(const std::unordered_map<std::string, Archetype>& table,
                                 std::string_view name) noexcept;

    std::unordered_map<std::string, Archetype> floors_;
    std::unordered_map<std::string, Archetype> objects_;
};

} // namespace worldstream
