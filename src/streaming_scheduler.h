#pragma once
// streaming_scheduler.h
// Per-tick load/unload decisions around a moving observer.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <vector>

#include <glm/vec2.hpp>

#include "chunk_cache.h"
#include "chunk_types.h"
#include "grid_indexer.h"
#include "world_config.h"

namespace worldstream
{

struct TickReport
{
    bool throttled{false};
    std::size_t candidates{0};
    std::size_t queued{0};
    std::vector<ChunkCoord> materialized;
    int generated{0};
    int revived{0};
    int failed{0};
    std::vector<ChunkCoord> evicted;
    std::vector<StreamWarning> warnings;
};

struct StreamingStats
{
    std::uint64_t ticks{0};
    std::uint64_t throttledTicks{0};
    std::uint64_t generatedChunks{0};
    std::uint64_t revivedChunks{0};
    std::uint64_t evictedChunks{0};
    std::uint64_t failedMaterializations{0};
};

class StreamingScheduler
{
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    StreamingScheduler(const WorldConfig& config,
                       const GridIndexer& indexer,
                       ChunkCache& cache,
                       std::uint32_t selectionSeed,
                       TimeSource timeSource = &Clock::now);

    TickReport tick(const glm::vec2& observer);

    // Evicts at most maxEvictionsPerTick active chunks farther than the render radius.
    std::vector<ChunkCoord> evictOutOfRange(const glm::vec2& observer);

    // What the last pass left unprocessed; rebuilt on the next unthrottled tick.
    [[nodiscard]] const std::vector<ChunkCoord>& processingQueue() const noexcept { return queue_; }

    [[nodiscard]] const StreamingStats& stats() const noexcept { return stats_; }

    void reseedSelection(std::uint32_t seed);

private:
    bool coolingDown(Clock::time_point now) const noexcept;
    std::size_t pickQueued();
    void rebuildQueue(const glm::vec2& observer, TickReport& report);

    const WorldConfig& config_;
    const GridIndexer& indexer_;
    ChunkCache& cache_;
    TimeSource timeSource_;
    std::mt19937 selectionRng_;
    std::optional<Clock::time_point> lastTick_{};
    std::vector<ChunkCoord> queue_;
    StreamingStats stats_{};
};

} // namespace worldstream
