#pragma once

#include <cstddef>
#include <vector>

#include "worldgen/block_registry.h"

namespace worldgen
{

// Square block grid of one chunk. Local row 0 is the lowest world row.
struct ChunkGrid
{
    ChunkGrid() = default;
    explicit ChunkGrid(int edge)
        : size(edge),
          blocks(static_cast<std::size_t>(edge) * static_cast<std::size_t>(edge), kAirBlock)
    {
    }

    [[nodiscard]] bool contains(int localX, int localY) const noexcept
    {
        return localX >= 0 && localY >= 0 && localX < size && localY < size;
    }

    [[nodiscard]] std::size_t index(int localX, int localY) const noexcept
    {
        return static_cast<std::size_t>(localY) * static_cast<std::size_t>(size) + static_cast<std::size_t>(localX);
    }

    [[nodiscard]] BlockId at(int localX, int localY) const noexcept { return blocks[index(localX, localY)]; }
    void set(int localX, int localY, BlockId block) noexcept { blocks[index(localX, localY)] = block; }

    bool operator==(const ChunkGrid& other) const = default;

    int size{0};
    std::vector<BlockId> blocks{};
};

} // namespace worldgen
