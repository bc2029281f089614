#pragma once

#include "worldgen/biome_classifier.h"
#include "worldgen/block_registry.h"
#include "worldgen/chunk_grid.h"
#include "worldgen/height_profile.h"
#include "worldgen/structure_index.h"
#include "worldgen/worldgen_profile.h"

namespace worldgen
{

// Builds one chunk grid from terrain height, biome layering, ore veins and
// surface structures. The same coordinate always yields the same grid.
class ChunkFactory
{
public:
    ChunkFactory(const BlockRegistry& blocks,
                 const HeightProfile& heightProfile,
                 const BiomeClassifier& biomes,
                 StructureSpatialIndex& structures,
                 const StructureSettings& settings);

    [[nodiscard]] ChunkGrid generateChunk(int chunkX, int chunkY, int size);

    // Biome-shaped surface height. Falls back to the unshaped profile when
    // shaping produces a non-finite value.
    [[nodiscard]] float surfaceHeight(int worldX) const;

    // Block a fresh generation would put at a world cell, ignoring structures and ores.
    [[nodiscard]] BlockId terrainBlockAt(int worldX, int worldY) const;

private:
    [[nodiscard]] BlockId layeredBlock(int worldX, int worldY, int surfaceY) const;
    void placeOres(ChunkGrid& grid, int baseX, int baseY, const std::vector<int>& surface) const;
    void placeStructures(ChunkGrid& grid, int baseX, int baseY, const std::vector<int>& surface);

    const BlockRegistry& blocks_;
    const HeightProfile& heightProfile_;
    const BiomeClassifier& biomes_;
    StructureSpatialIndex& structures_;
    StructureSettings settings_;
};

} // namespace worldgen
