#pragma once
// chunk_manager.h
// Declares chunk streaming: the generation queue, visibility tracking and residency of generated chunks.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <glm/vec2.hpp>

#include "chunk.h"
#include "worldgen/worldgen_profile.h"

inline constexpr int kDefaultChunkSize = 16;

enum class Direction : std::uint8_t
{
    None,
    Up,
    Right,
    Down,
    Left
};

enum class ChunkState : std::uint8_t
{
    Unrequested,
    Queued,
    Hidden,
    Visible
};

struct ChunkDescriptor
{
    glm::ivec2 coord{0};
    bool generated{false};
    bool visible{false};
};

// Inclusive chunk rectangle.
struct ChunkBounds
{
    glm::ivec2 min{0};
    glm::ivec2 max{-1};

    [[nodiscard]] bool contains(const glm::ivec2& coord) const noexcept
    {
        return coord.x >= min.x && coord.x <= max.x && coord.y >= min.y && coord.y <= max.y;
    }

    [[nodiscard]] ChunkBounds expanded(int amount) const noexcept
    {
        return {min - glm::ivec2(amount), max + glm::ivec2(amount)};
    }
};

struct ChunkProfilingSnapshot
{
    double averageGenerationMs{0.0};
    int generatedChunks{0};
    int failedChunks{0};
    int attachedChunks{0};
    int detachedChunks{0};
    int evictedChunks{0};
    std::size_t queuedChunks{0};
    std::size_t visibleChunks{0};
    std::size_t loadedChunks{0};
};

class ChunkManager
{
public:
    // Fills chunk.grid for chunk.coord. Exceptions leave the coordinate ungenerated.
    using GenerateFn = std::function<void(Chunk& chunk)>;

    ChunkManager(int chunkSize,
                 const worldgen::StreamingSettings& settings,
                 GenerateFn generate,
                 ChunkRenderSink* sink = nullptr);
    ~ChunkManager();

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;
    ChunkManager(ChunkManager&&) = delete;
    ChunkManager& operator=(ChunkManager&&) = delete;

    void queueChunk(int chunkX, int chunkY);
    int processChunkQueue(int maxChunks);

    // Positions and velocities are in world pixels.
    void updatePlayerDirection(float playerX, float playerY, float velocityX, float velocityY);
    void prioritizeChunksInDirection(int chunkX, int chunkY);
    void updateVisibleChunks(float cameraX, float cameraY);
    int forceLoadChunksAroundPosition(float worldX, float worldY);

    Chunk& ensureGenerated(const glm::ivec2& coord);
    [[nodiscard]] Chunk* findChunk(const glm::ivec2& coord) noexcept;
    [[nodiscard]] const Chunk* findChunk(const glm::ivec2& coord) const noexcept;

    [[nodiscard]] ChunkState state(const glm::ivec2& coord) const noexcept;
    [[nodiscard]] std::vector<ChunkDescriptor> chunks() const;
    [[nodiscard]] std::vector<glm::ivec2> queuedChunks() const;
    [[nodiscard]] std::size_t queueLength() const noexcept;
    [[nodiscard]] std::size_t visibleCount() const noexcept;
    [[nodiscard]] std::size_t loadedCount() const noexcept;
    [[nodiscard]] Direction direction() const noexcept;
    [[nodiscard]] ChunkBounds visibleBounds() const noexcept;
    [[nodiscard]] glm::ivec2 chunkForPosition(float worldX, float worldY) const noexcept;
    [[nodiscard]] int chunkSize() const noexcept;

    ChunkProfilingSnapshot sampleProfilingSnapshot();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
