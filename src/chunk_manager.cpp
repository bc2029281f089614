#include "chunk_manager.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <deque>
#include <exception>
#include <iostream>
#include <iterator>
#include <list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "worldgen/grid_math.h"

using worldgen::ColumnHasher;

namespace
{
struct ProfilingCounters
{
    long long generationMicros{0};
    int generatedChunks{0};
    int failedChunks{0};
    int attachedChunks{0};
    int detachedChunks{0};
    int evictedChunks{0};
};

struct ChunkEntry
{
    std::unique_ptr<Chunk> chunk;
    std::list<glm::ivec2>::iterator hiddenIt{};
    bool inHiddenList{false};
};

} // namespace

struct ChunkManager::Impl
{
    Impl(int chunkSize, const worldgen::StreamingSettings& settings, GenerateFn generate, ChunkRenderSink* sink);

    void queueChunk(const glm::ivec2& coord);
    int processChunkQueue(int maxChunks);
    void updatePlayerDirection(float playerX, float playerY, float velocityX, float velocityY);
    void prioritizeChunksInDirection(const glm::ivec2& playerChunk);
    void updateVisibleChunks(float cameraX, float cameraY);
    int forceLoadChunksAroundPosition(float worldX, float worldY);
    Chunk& ensureGenerated(const glm::ivec2& coord);
    ChunkState state(const glm::ivec2& coord) const noexcept;
    ChunkProfilingSnapshot sampleProfilingSnapshot();

    [[nodiscard]] int chunkPixels() const noexcept { return chunkSize_ * settings_.tileSize; }
    [[nodiscard]] glm::ivec2 chunkForPosition(float worldX, float worldY) const noexcept;

    Chunk* generateChunk(const glm::ivec2& coord);
    void attach(ChunkEntry& entry);
    void detach(ChunkEntry& entry);
    void markHidden(ChunkEntry& entry);
    void touchVisible(ChunkEntry& entry);
    void evictIfNeeded();
    void removeFromQueue(const glm::ivec2& coord);

    int chunkSize_{kDefaultChunkSize};
    worldgen::StreamingSettings settings_{};
    GenerateFn generate_;
    ChunkRenderSink* sink_{nullptr};

    std::unordered_map<glm::ivec2, ChunkEntry, ColumnHasher> chunks_{};
    std::deque<glm::ivec2> queue_{};
    std::unordered_set<glm::ivec2, ColumnHasher> queued_{};
    std::unordered_set<glm::ivec2, ColumnHasher> visible_{};
    // Most recently hidden chunk at the front.
    std::list<glm::ivec2> hiddenLru_{};

    std::optional<ChunkBounds> range_{};
    std::optional<glm::ivec2> lastPlayerChunk_{};
    Direction direction_{Direction::None};
    ProfilingCounters profilingCounters_{};
};

ChunkManager::Impl::Impl(int chunkSize,
                         const worldgen::StreamingSettings& settings,
                         GenerateFn generate,
                         ChunkRenderSink* sink)
    : chunkSize_(chunkSize),
      settings_(settings),
      generate_(std::move(generate)),
      sink_(sink)
{
    if (!generate_)
    {
        throw std::invalid_argument("ChunkManager requires a chunk generation callback");
    }
    if (chunkSize_ <= 0 || settings_.tileSize <= 0)
    {
        throw std::invalid_argument("ChunkManager requires positive chunk and tile sizes");
    }
    if (settings_.viewportSize.x <= 0 || settings_.viewportSize.y <= 0)
    {
        throw std::invalid_argument("ChunkManager requires a positive viewport size");
    }
}

glm::ivec2 ChunkManager::Impl::chunkForPosition(float worldX, float worldY) const noexcept
{
    const float pixels = static_cast<float>(chunkPixels());
    return {static_cast<int>(std::floor(worldX / pixels)), static_cast<int>(std::floor(worldY / pixels))};
}

ChunkState ChunkManager::Impl::state(const glm::ivec2& coord) const noexcept
{
    auto it = chunks_.find(coord);
    if (it != chunks_.end())
    {
        return it->second.chunk->visible ? ChunkState::Visible : ChunkState::Hidden;
    }
    return queued_.count(coord) != 0 ? ChunkState::Queued : ChunkState::Unrequested;
}

void ChunkManager::Impl::queueChunk(const glm::ivec2& coord)
{
    if (chunks_.count(coord) != 0 || queued_.count(coord) != 0)
    {
        return;
    }
    queue_.push_back(coord);
    queued_.insert(coord);
}

void ChunkManager::Impl::removeFromQueue(const glm::ivec2& coord)
{
    if (queued_.erase(coord) == 0)
    {
        return;
    }
    auto it = std::find(queue_.begin(), queue_.end(), coord);
    if (it != queue_.end())
    {
        queue_.erase(it);
    }
}

Chunk* ChunkManager::Impl::generateChunk(const glm::ivec2& coord)
{
    auto chunk = std::make_unique<Chunk>(coord, chunkSize_);

    const auto start = std::chrono::steady_clock::now();
    try
    {
        generate_(*chunk);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Error creating chunk at (" << coord.x << ", " << coord.y << "): " << ex.what() << std::endl;
        ++profilingCounters_.failedChunks;
        return nullptr;
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    profilingCounters_.generationMicros +=
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    ++profilingCounters_.generatedChunks;

    chunk->generated = true;
    auto existing = chunks_.find(coord);
    if (existing != chunks_.end())
    {
        touchVisible(existing->second);
    }

    ChunkEntry entry{};
    entry.chunk = std::move(chunk);
    auto [it, inserted] = chunks_.insert_or_assign(coord, std::move(entry));
    (void)inserted;
    return it->second.chunk.get();
}

void ChunkManager::Impl::attach(ChunkEntry& entry)
{
    Chunk& chunk = *entry.chunk;
    if (chunk.visible)
    {
        return;
    }
    touchVisible(entry);
    chunk.visible = true;
    visible_.insert(chunk.coord);
    ++profilingCounters_.attachedChunks;
    if (sink_)
    {
        sink_->attach(chunk);
    }
}

void ChunkManager::Impl::detach(ChunkEntry& entry)
{
    Chunk& chunk = *entry.chunk;
    if (!chunk.visible)
    {
        return;
    }
    chunk.visible = false;
    visible_.erase(chunk.coord);
    ++profilingCounters_.detachedChunks;
    if (sink_)
    {
        sink_->detach(chunk);
    }
    markHidden(entry);
}

void ChunkManager::Impl::markHidden(ChunkEntry& entry)
{
    if (settings_.maxHiddenChunks == 0)
    {
        return;
    }
    touchVisible(entry);
    entry.hiddenIt = hiddenLru_.emplace(hiddenLru_.begin(), entry.chunk->coord);
    entry.inHiddenList = true;
}

void ChunkManager::Impl::touchVisible(ChunkEntry& entry)
{
    if (entry.inHiddenList)
    {
        hiddenLru_.erase(entry.hiddenIt);
        entry.inHiddenList = false;
    }
}

void ChunkManager::Impl::evictIfNeeded()
{
    if (settings_.maxHiddenChunks == 0)
    {
        return;
    }

    int evicted = 0;
    while (hiddenLru_.size() > settings_.maxHiddenChunks)
    {
        auto lruIt = std::prev(hiddenLru_.end());
        const glm::ivec2 coord = *lruIt;
        hiddenLru_.erase(lruIt);

        auto chunkIt = chunks_.find(coord);
        if (chunkIt != chunks_.end())
        {
            chunkIt->second.inHiddenList = false;
            chunks_.erase(chunkIt);
            ++evicted;
        }
    }

    if (evicted > 0)
    {
        profilingCounters_.evictedChunks += evicted;
        std::cout << "[ChunkManager] Evicted " << evicted << " hidden chunk(s), " << chunks_.size() << " resident"
                  << std::endl;
    }
}

int ChunkManager::Impl::processChunkQueue(int maxChunks)
{
    int generated = 0;
    for (int i = 0; i < maxChunks && !queue_.empty(); ++i)
    {
        const glm::ivec2 coord = queue_.front();
        queue_.pop_front();
        queued_.erase(coord);

        if (chunks_.count(coord) != 0)
        {
            continue;
        }

        if (generateChunk(coord) == nullptr)
        {
            continue;
        }
        ++generated;

        ChunkEntry& entry = chunks_.at(coord);
        if (range_ && range_->contains(coord))
        {
            attach(entry);
        }
        else
        {
            markHidden(entry);
        }
    }

    evictIfNeeded();
    return generated;
}

void ChunkManager::Impl::updatePlayerDirection(float playerX, float playerY, float velocityX, float velocityY)
{
    if (std::abs(velocityX) > std::abs(velocityY))
    {
        direction_ = velocityX > 0.0f ? Direction::Right : Direction::Left;
    }
    else if (velocityY != 0.0f)
    {
        direction_ = velocityY > 0.0f ? Direction::Down : Direction::Up;
    }
    else
    {
        direction_ = Direction::None;
    }

    const glm::ivec2 playerChunk = chunkForPosition(playerX, playerY);
    if (!lastPlayerChunk_)
    {
        lastPlayerChunk_ = playerChunk;
        return;
    }
    if (playerChunk != *lastPlayerChunk_)
    {
        prioritizeChunksInDirection(playerChunk);
        lastPlayerChunk_ = playerChunk;
    }
}

void ChunkManager::Impl::prioritizeChunksInDirection(const glm::ivec2& playerChunk)
{
    const int ahead = settings_.lookAheadDistance;
    glm::ivec2 offset{0};
    switch (direction_)
    {
    case Direction::Up:
        offset.y = -ahead;
        break;
    case Direction::Right:
        offset.x = ahead;
        break;
    case Direction::Down:
        offset.y = ahead;
        break;
    case Direction::Left:
        offset.x = -ahead;
        break;
    case Direction::None:
        break;
    }

    if (offset == glm::ivec2(0))
    {
        return;
    }

    // Each coordinate is spliced to the front in turn, so the last one visited leads the queue.
    for (int dy = -1; dy <= 1; ++dy)
    {
        for (int dx = -1; dx <= 1; ++dx)
        {
            const glm::ivec2 coord = playerChunk + offset + glm::ivec2(dx, dy);
            if (chunks_.count(coord) != 0)
            {
                continue;
            }
            removeFromQueue(coord);
            queue_.push_front(coord);
            queued_.insert(coord);
        }
    }
}

void ChunkManager::Impl::updateVisibleChunks(float cameraX, float cameraY)
{
    const float pixels = static_cast<float>(chunkPixels());
    const glm::vec2 viewport(settings_.viewportSize);
    const glm::ivec2 center = chunkForPosition(cameraX + viewport.x * 0.5f, cameraY + viewport.y * 0.5f);
    const glm::ivec2 reach(static_cast<int>(std::ceil(viewport.x / pixels * 0.5f)) + settings_.viewMargin,
                           static_cast<int>(std::ceil(viewport.y / pixels * 0.5f)) + settings_.viewMargin);

    const ChunkBounds range{center - reach, center + reach};
    range_ = range;

    for (int y = range.min.y; y <= range.max.y; ++y)
    {
        for (int x = range.min.x; x <= range.max.x; ++x)
        {
            const glm::ivec2 coord(x, y);
            auto it = chunks_.find(coord);
            if (it == chunks_.end())
            {
                queueChunk(coord);
                continue;
            }

            ChunkEntry& entry = it->second;
            if (!entry.chunk->generated && generateChunk(coord) == nullptr)
            {
                continue;
            }
            attach(entry);
        }
    }

    const ChunkBounds keep = range.expanded(settings_.hysteresis);
    std::vector<glm::ivec2> leaving;
    for (const glm::ivec2& coord : visible_)
    {
        if (!keep.contains(coord))
        {
            leaving.push_back(coord);
        }
    }
    for (const glm::ivec2& coord : leaving)
    {
        detach(chunks_.at(coord));
    }

    evictIfNeeded();
}

int ChunkManager::Impl::forceLoadChunksAroundPosition(float worldX, float worldY)
{
    const glm::ivec2 center = chunkForPosition(worldX, worldY);
    const int radius = settings_.forceLoadRadius;

    int generated = 0;
    for (int y = center.y - radius; y <= center.y + radius; ++y)
    {
        for (int x = center.x - radius; x <= center.x + radius; ++x)
        {
            const glm::ivec2 coord(x, y);
            auto it = chunks_.find(coord);
            if (it == chunks_.end())
            {
                removeFromQueue(coord);
                if (generateChunk(coord) == nullptr)
                {
                    continue;
                }
                ++generated;
                it = chunks_.find(coord);
            }
            attach(it->second);
        }
    }

    lastPlayerChunk_ = center;
    std::cout << "[ChunkManager] Force loaded " << generated << " chunk(s) around (" << center.x << ", " << center.y
              << ")" << std::endl;
    return generated;
}

Chunk& ChunkManager::Impl::ensureGenerated(const glm::ivec2& coord)
{
    auto it = chunks_.find(coord);
    if (it != chunks_.end())
    {
        return *it->second.chunk;
    }

    removeFromQueue(coord);
    Chunk* chunk = generateChunk(coord);
    if (!chunk)
    {
        std::ostringstream oss;
        oss << "Failed to generate chunk (" << coord.x << ", " << coord.y << ")";
        throw std::runtime_error(oss.str());
    }

    ChunkEntry& entry = chunks_.at(coord);
    if (range_ && range_->contains(coord))
    {
        attach(entry);
    }
    else
    {
        markHidden(entry);
        evictIfNeeded();
    }
    return *chunk;
}

ChunkProfilingSnapshot ChunkManager::Impl::sampleProfilingSnapshot()
{
    ChunkProfilingSnapshot snapshot{};
    snapshot.generatedChunks = profilingCounters_.generatedChunks;
    snapshot.failedChunks = profilingCounters_.failedChunks;
    snapshot.attachedChunks = profilingCounters_.attachedChunks;
    snapshot.detachedChunks = profilingCounters_.detachedChunks;
    snapshot.evictedChunks = profilingCounters_.evictedChunks;
    if (profilingCounters_.generatedChunks > 0)
    {
        snapshot.averageGenerationMs = static_cast<double>(profilingCounters_.generationMicros) / 1000.0 /
                                       static_cast<double>(profilingCounters_.generatedChunks);
    }
    snapshot.queuedChunks = queue_.size();
    snapshot.visibleChunks = visible_.size();
    snapshot.loadedChunks = chunks_.size();

    profilingCounters_ = ProfilingCounters{};
    return snapshot;
}

ChunkManager::ChunkManager(int chunkSize,
                           const worldgen::StreamingSettings& settings,
                           GenerateFn generate,
                           ChunkRenderSink* sink)
    : impl_(std::make_unique<Impl>(chunkSize, settings, std::move(generate), sink))
{
}

ChunkManager::~ChunkManager() = default;

void ChunkManager::queueChunk(int chunkX, int chunkY)
{
    impl_->queueChunk({chunkX, chunkY});
}

int ChunkManager::processChunkQueue(int maxChunks)
{
    return impl_->processChunkQueue(maxChunks);
}

void ChunkManager::updatePlayerDirection(float playerX, float playerY, float velocityX, float velocityY)
{
    impl_->updatePlayerDirection(playerX, playerY, velocityX, velocityY);
}

void ChunkManager::prioritizeChunksInDirection(int chunkX, int chunkY)
{
    impl_->prioritizeChunksInDirection({chunkX, chunkY});
}

void ChunkManager::updateVisibleChunks(float cameraX, float cameraY)
{
    impl_->updateVisibleChunks(cameraX, cameraY);
}

int ChunkManager::forceLoadChunksAroundPosition(float worldX, float worldY)
{
    return impl_->forceLoadChunksAroundPosition(worldX, worldY);
}

Chunk& ChunkManager::ensureGenerated(const glm::ivec2& coord)
{
    return impl_->ensureGenerated(coord);
}

Chunk* ChunkManager::findChunk(const glm::ivec2& coord) noexcept
{
    auto it = impl_->chunks_.find(coord);
    return it != impl_->chunks_.end() ? it->second.chunk.get() : nullptr;
}

const Chunk* ChunkManager::findChunk(const glm::ivec2& coord) const noexcept
{
    auto it = impl_->chunks_.find(coord);
    return it != impl_->chunks_.end() ? it->second.chunk.get() : nullptr;
}

ChunkState ChunkManager::state(const glm::ivec2& coord) const noexcept
{
    return impl_->state(coord);
}

std::vector<ChunkDescriptor> ChunkManager::chunks() const
{
    std::vector<ChunkDescriptor> descriptors;
    descriptors.reserve(impl_->chunks_.size());
    for (const auto& [coord, entry] : impl_->chunks_)
    {
        descriptors.push_back({coord, entry.chunk->generated, entry.chunk->visible});
    }
    return descriptors;
}

std::vector<glm::ivec2> ChunkManager::queuedChunks() const
{
    return std::vector<glm::ivec2>(impl_->queue_.begin(), impl_->queue_.end());
}

std::size_t ChunkManager::queueLength() const noexcept
{
    return impl_->queue_.size();
}

std::size_t ChunkManager::visibleCount() const noexcept
{
    return impl_->visible_.size();
}

std::size_t ChunkManager::loadedCount() const noexcept
{
    return impl_->chunks_.size();
}

Direction ChunkManager::direction() const noexcept
{
    return impl_->direction_;
}

ChunkBounds ChunkManager::visibleBounds() const noexcept
{
    return impl_->range_.value_or(ChunkBounds{});
}

glm::ivec2 ChunkManager::chunkForPosition(float worldX, float worldY) const noexcept
{
    return impl_->chunkForPosition(worldX, worldY);
}

int ChunkManager::chunkSize() const noexcept
{
    return impl_->chunkSize_;
}

ChunkProfilingSnapshot ChunkManager::sampleProfilingSnapshot()
{
    return impl_->sampleProfilingSnapshot();
}
