#include "streaming_scheduler.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace worldstream
{

StreamingScheduler::StreamingScheduler(const WorldConfig& config,
                                       const GridIndexer& indexer,
                                       ChunkCache& cache,
                                       std::uint32_t selectionSeed,
                                       TimeSource timeSource)
    : config_(config),
      indexer_(indexer),
      cache_(cache),
      timeSource_(std::move(timeSource)),
      selectionRng_(selectionSeed)
{
    if (!timeSource_)
    {
        timeSource_ = &Clock::now;
    }
}

void StreamingScheduler::reseedSelection(std::uint32_t seed)
{
    selectionRng_.seed(seed);
}

bool StreamingScheduler::coolingDown(Clock::time_point now) const noexcept
{
    if (config_.streaming.cooldownSeconds <= 0.0 || !lastTick_)
    {
        return false;
    }

    const std::chrono::duration<double> elapsed = now - *lastTick_;
    return elapsed.count() < config_.streaming.cooldownSeconds;
}

void StreamingScheduler::rebuildQueue(const glm::vec2& observer, TickReport& report)
{
    queue_.clear();

    const std::vector<ChunkCoord> candidates = indexer_.candidates(observer, config_.grid.renderDistance);
    report.candidates = candidates.size();
    for (const ChunkCoord& coord : candidates)
    {
        if (!cache_.isActive(coord))
        {
            queue_.push_back(coord);
        }
    }
    report.queued = queue_.size();
}

std::size_t StreamingScheduler::pickQueued()
{
    if (!config_.streaming.randomizeSelection || queue_.size() < 2)
    {
        return 0;
    }

    std::uniform_int_distribution<std::size_t> pick(0, queue_.size() - 1);
    return pick(selectionRng_);
}

TickReport StreamingScheduler::tick(const glm::vec2& observer)
{
    TickReport report{};

    const Clock::time_point now = timeSource_();
    if (coolingDown(now))
    {
        report.throttled = true;
        ++stats_.throttledTicks;
        return report;
    }
    lastTick_ = now;
    ++stats_.ticks;

    rebuildQueue(observer, report);

    for (int budget = config_.streaming.maxMaterializationsPerTick; budget > 0 && !queue_.empty(); --budget)
    {
        const std::size_t index = pickQueued();
        const ChunkCoord coord = queue_[index];
        queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(index));

        switch (cache_.materialize(coord))
        {
            case MaterializeOutcome::Generated:
                ++report.generated;
                ++stats_.generatedChunks;
                report.materialized.push_back(coord);
                break;
            case MaterializeOutcome::Revived:
                ++report.revived;
                ++stats_.revivedChunks;
                report.materialized.push_back(coord);
                break;
            case MaterializeOutcome::Failed:
                ++report.failed;
                ++stats_.failedMaterializations;
                break;
            case MaterializeOutcome::AlreadyActive:
                break;
        }
    }

    report.evicted = evictOutOfRange(observer);
    report.warnings = cache_.takeWarnings();

    if (!report.materialized.empty() || !report.evicted.empty())
    {
        std::cout << "[Streaming] Tick: loaded=" << report.materialized.size()
                  << ", unloaded=" << report.evicted.size()
                  << ", pending=" << queue_.size()
                  << ", active=" << cache_.activeCount() << std::endl;
    }

    return report;
}

std::vector<ChunkCoord> StreamingScheduler::evictOutOfRange(const glm::vec2& observer)
{
    const float radius = config_.renderRadius();
    const std::size_t cap = static_cast<std::size_t>(std::max(config_.streaming.maxEvictionsPerTick, 0));

    std::vector<ChunkCoord> toEvict;
    toEvict.reserve(cap);
    for (const auto& [key, chunk] : cache_.active())
    {
        if (toEvict.size() >= cap)
        {
            break;
        }
        if (GridIndexer::planarDistance(chunk.coord, observer) > radius)
        {
            toEvict.push_back(chunk.coord);
        }
    }

    std::vector<ChunkCoord> evicted;
    evicted.reserve(toEvict.size());
    for (const ChunkCoord& coord : toEvict)
    {
        if (cache_.evict(coord))
        {
            evicted.push_back(coord);
            ++stats_.evictedChunks;
        }
    }
    return evicted;
}

} // namespace worldstream
