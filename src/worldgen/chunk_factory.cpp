#include "worldgen/chunk_factory.h"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "worldgen/grid_math.h"

namespace worldgen
{

ChunkFactory::ChunkFactory(const BlockRegistry& blocks,
                           const HeightProfile& heightProfile,
                           const BiomeClassifier& biomes,
                           StructureSpatialIndex& structures,
                           const StructureSettings& settings)
    : blocks_(blocks),
      heightProfile_(heightProfile),
      biomes_(biomes),
      structures_(structures),
      settings_(settings)
{
    if (settings_.checkInterval <= 0)
    {
        throw std::invalid_argument("Structure check interval must be positive");
    }
}

float ChunkFactory::surfaceHeight(int worldX) const
{
    const float x = static_cast<float>(worldX);
    const float baseHeight = heightProfile_.sample(x);
    const float shaped = biomes_.modifyHeight(x, baseHeight);
    if (!std::isfinite(shaped))
    {
        std::cerr << "[ChunkFactory] Non-finite biome height at x=" << worldX << ", using base height " << baseHeight
                  << std::endl;
        return baseHeight;
    }
    return shaped;
}

BlockId ChunkFactory::layeredBlock(int worldX, int worldY, int surfaceY) const
{
    const HeightSettings& bounds = heightProfile_.settings();
    if (worldY >= bounds.worldTop)
    {
        return kAirBlock;
    }
    if (worldY <= bounds.worldBottom)
    {
        return blocks::kBedrock;
    }
    return biomes_.blockAt(worldX, worldY, static_cast<float>(surfaceY));
}

BlockId ChunkFactory::terrainBlockAt(int worldX, int worldY) const
{
    const int surfaceY = static_cast<int>(std::floor(surfaceHeight(worldX)));
    return layeredBlock(worldX, worldY, surfaceY);
}

ChunkGrid ChunkFactory::generateChunk(int chunkX, int chunkY, int size)
{
    if (size <= 0)
    {
        std::ostringstream oss;
        oss << "Chunk size must be positive, got " << size;
        throw std::invalid_argument(oss.str());
    }

    structures_.clearPositionsForChunk(chunkX);

    ChunkGrid grid(size);
    const int baseX = chunkX * size;
    const int baseY = chunkY * size;

    std::vector<int> surface(static_cast<std::size_t>(size));
    for (int localX = 0; localX < size; ++localX)
    {
        surface[static_cast<std::size_t>(localX)] = static_cast<int>(std::floor(surfaceHeight(baseX + localX)));
    }

    for (int localY = 0; localY < size; ++localY)
    {
        for (int localX = 0; localX < size; ++localX)
        {
            grid.set(localX, localY,
                     layeredBlock(baseX + localX, baseY + localY, surface[static_cast<std::size_t>(localX)]));
        }
    }

    placeOres(grid, baseX, baseY, surface);
    placeStructures(grid, baseX, baseY, surface);
    return grid;
}

void ChunkFactory::placeOres(ChunkGrid& grid, int baseX, int baseY, const std::vector<int>& surface) const
{
    if (structures_.oreCount() == 0)
    {
        return;
    }

    for (int localY = 0; localY < grid.size; ++localY)
    {
        const int worldY = baseY + localY;
        for (int localX = 0; localX < grid.size; ++localX)
        {
            if (worldY >= surface[static_cast<std::size_t>(localX)])
            {
                continue;
            }
            if (!blocks_.capabilities(grid.at(localX, localY)).oreHost)
            {
                continue;
            }
            if (const OreDefinition* ore = structures_.oreAt(baseX + localX, worldY))
            {
                grid.set(localX, localY, ore->block);
            }
        }
    }
}

void ChunkFactory::placeStructures(ChunkGrid& grid, int baseX, int baseY, const std::vector<int>& surface)
{
    const int size = grid.size;
    const int worldTop = heightProfile_.settings().worldTop;

    for (int localX = 0; localX < size; localX += settings_.checkInterval)
    {
        // Jitter the sampled column so candidates do not line up on a grid.
        const int jitter = static_cast<int>(std::floor(std::sin(static_cast<float>(localX) * 0.7f) * 2.0f));
        const int columnX = wrapIndex(localX + jitter, size);
        const int worldX = baseX + columnX;
        const int surfaceY = surface[static_cast<std::size_t>(columnX)];
        if (surfaceY >= worldTop - 1)
        {
            continue;
        }

        const BiomeDefinition& biome = biomes_.biomeAt(worldX, surfaceY);
        const BlockId surfaceBlock = layeredBlock(worldX, surfaceY, surfaceY);
        if (!biome.supportsStructureOn(surfaceBlock))
        {
            continue;
        }

        // Structures never straddle a vertical chunk seam.
        const StructureDefinition* structure =
            structures_.structureAt(worldX, surfaceY, biome.id, [&](const StructureDefinition& candidate) {
                const int width = candidate.width();
                const int left = columnX - width / 2;
                return left >= 0 && left + width <= size;
            });
        if (!structure)
        {
            continue;
        }

        structures_.placeStructure(worldX, surfaceY, *structure, [&](int x, int y, BlockId block) {
            const int localCellX = x - baseX;
            const int localCellY = y - baseY;
            if (!grid.contains(localCellX, localCellY) || y >= worldTop)
            {
                return;
            }
            const BlockId existing = grid.at(localCellX, localCellY);
            if (existing == kAirBlock || blocks_.capabilities(existing).replaceable)
            {
                grid.set(localCellX, localCellY, block);
            }
        });
    }
}

} // namespace worldgen
