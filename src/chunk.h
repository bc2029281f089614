#pragma once

#include <glm/vec2.hpp>

#include "worldgen/chunk_grid.h"

struct Chunk
{
    Chunk(const glm::ivec2& c, int size)
        : coord(c),
          grid(size)
    {
    }

    glm::ivec2 coord;
    worldgen::ChunkGrid grid;
    bool generated{false};
    bool visible{false};
};

// Consumer of attach/detach events, typically a renderer.
class ChunkRenderSink
{
public:
    virtual ~ChunkRenderSink() = default;

    virtual void attach(const Chunk& chunk) = 0;
    virtual void detach(const Chunk& chunk) = 0;
};
