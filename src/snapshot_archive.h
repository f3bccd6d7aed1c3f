#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "chunk_types.h"
#include "grid_indexer.h"

namespace worldstream
{

// TOML transport for a persisted set:
//
//   version = 1
//   grid_scale = 128
//
//   [[chunk]]
//   x = 0
//   z = 128
//   height = -4.0
//   objects = [ [ 12.5, 78.897, -30.25 ], ... ]
//
// A chunk without `height` is kept and revives at the origin height.
inline constexpr int kSnapshotArchiveVersion = 1;

[[nodiscard]] std::string formatArchive(const PersistedSet& persisted, int gridScale);

// Returns std::nullopt when the text is not a readable archive.
[[nodiscard]] std::optional<PersistedSet> parseArchive(std::string_view text, const GridIndexer& indexer);

// Throws std::runtime_error when the file cannot be written.
void writeArchive(const std::filesystem::path& path, const PersistedSet& persisted, int gridScale);

// Returns std::nullopt when the file is absent or unreadable.
[[nodiscard]] std::optional<PersistedSet> readArchive(const std::filesystem::path& path, const GridIndexer& indexer);

} // namespace worldstream
