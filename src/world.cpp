#include "world.h"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "worldgen/biome_database.h"
#include "worldgen/structure_database.h"

using worldgen::BlockId;
using worldgen::floorDiv;
using worldgen::wrapIndex;

WorldDefinitions WorldDefinitions::load(const std::filesystem::path& assetDir)
{
    WorldDefinitions definitions{};
    worldgen::registerBuiltinBlocks(definitions.blocks);

    const worldgen::BiomeDatabase biomeDatabase(assetDir / "biomes", definitions.blocks);
    definitions.biomes = biomeDatabase.definitions();

    const worldgen::StructureDatabase structureDatabase(assetDir / "structures", definitions.blocks);
    definitions.structures = structureDatabase.structures();
    definitions.ores = structureDatabase.ores();

    std::cout << "[World] Loaded " << definitions.blocks.blockCount() << " blocks, " << definitions.biomes.size()
              << " biomes, " << definitions.structures.size() << " structures and " << definitions.ores.size()
              << " ores from " << assetDir << std::endl;
    return definitions;
}

World::World(const worldgen::WorldgenProfile& profile, WorldDefinitions definitions, ChunkRenderSink* sink)
    : profile_(profile),
      blocks_(std::move(definitions.blocks)),
      noiseFactory_(profile_.seed),
      heightProfile_(&noiseFactory_, profile_.height),
      biomeClassifier_(&noiseFactory_, profile_.climate, profile_.chunkSize),
      structureIndex_(&noiseFactory_, profile_.structures),
      chunkFactory_(blocks_, heightProfile_, biomeClassifier_, structureIndex_, profile_.structures),
      chunkManager_(profile_.chunkSize, profile_.streaming, [this](Chunk& chunk) { generateChunk(chunk); }, sink)
{
    if (!blocks_.contains(worldgen::kAirBlock) || !blocks_.contains(worldgen::blocks::kBedrock))
    {
        throw std::invalid_argument("World block registry must define air and bedrock");
    }
    if (definitions.biomes.empty())
    {
        throw std::runtime_error("No biomes registered with BiomeClassifier");
    }

    for (worldgen::BiomeDefinition& biome : definitions.biomes)
    {
        biomeClassifier_.registerBiome(std::move(biome));
    }
    for (worldgen::StructureDefinition& structure : definitions.structures)
    {
        structureIndex_.registerStructure(std::move(structure));
    }
    for (worldgen::OreDefinition& ore : definitions.ores)
    {
        structureIndex_.registerOre(std::move(ore));
    }
}

glm::ivec2 World::chunkOfBlock(int worldX, int worldY) const noexcept
{
    return {floorDiv(worldX, profile_.chunkSize), floorDiv(worldY, profile_.chunkSize)};
}

void World::generateChunk(Chunk& chunk)
{
    chunk.grid = chunkFactory_.generateChunk(chunk.coord.x, chunk.coord.y, profile_.chunkSize);
    applyOverrides(chunk);
}

void World::applyOverrides(Chunk& chunk) const
{
    auto it = overridesByChunk_.find(chunk.coord);
    if (it == overridesByChunk_.end())
    {
        return;
    }

    for (const glm::ivec2& position : it->second)
    {
        auto modified = modifiedBlocks_.find(position);
        if (modified == modifiedBlocks_.end())
        {
            continue;
        }
        chunk.grid.set(wrapIndex(position.x, profile_.chunkSize), wrapIndex(position.y, profile_.chunkSize),
                       modified->second);
    }
}

const worldgen::BlockDefinition& World::blockAt(int worldX, int worldY)
{
    auto modified = modifiedBlocks_.find({worldX, worldY});
    if (modified != modifiedBlocks_.end())
    {
        return blocks_.block(modified->second);
    }

    const worldgen::HeightSettings& bounds = profile_.height;
    if (worldY >= bounds.worldTop)
    {
        return blocks_.block(worldgen::kAirBlock);
    }
    if (worldY <= bounds.worldBottom)
    {
        return blocks_.block(worldgen::blocks::kBedrock);
    }

    Chunk& chunk = chunkManager_.ensureGenerated(chunkOfBlock(worldX, worldY));
    return blocks_.block(
        chunk.grid.at(wrapIndex(worldX, profile_.chunkSize), wrapIndex(worldY, profile_.chunkSize)));
}

void World::setBlockAt(int worldX, int worldY, BlockId block)
{
    if (!blocks_.contains(block))
    {
        std::ostringstream oss;
        oss << "Cannot place unregistered block id " << block << " at (" << worldX << ", " << worldY << ")";
        throw std::out_of_range(oss.str());
    }

    const glm::ivec2 position(worldX, worldY);
    const glm::ivec2 chunkCoord = chunkOfBlock(worldX, worldY);
    auto [it, inserted] = modifiedBlocks_.insert_or_assign(position, block);
    (void)it;
    if (inserted)
    {
        overridesByChunk_[chunkCoord].push_back(position);
    }

    if (Chunk* chunk = chunkManager_.findChunk(chunkCoord))
    {
        chunk->grid.set(wrapIndex(worldX, profile_.chunkSize), wrapIndex(worldY, profile_.chunkSize), block);
    }
}

void World::setBlockAt(int worldX, int worldY, std::string_view blockName)
{
    setBlockAt(worldX, worldY, blocks_.idOf(blockName));
}

void World::clearModifiedBlocks()
{
    std::vector<glm::ivec2> touchedChunks;
    touchedChunks.reserve(overridesByChunk_.size());
    for (const auto& [coord, positions] : overridesByChunk_)
    {
        touchedChunks.push_back(coord);
    }

    modifiedBlocks_.clear();
    overridesByChunk_.clear();

    // Loaded chunks go back to their generated state.
    for (const glm::ivec2& coord : touchedChunks)
    {
        if (Chunk* chunk = chunkManager_.findChunk(coord))
        {
            generateChunk(*chunk);
        }
    }
}

int World::heightAt(int worldX) const
{
    return heightProfile_.heightAt(worldX);
}

float World::surfaceHeight(int worldX) const
{
    return chunkFactory_.surfaceHeight(worldX);
}

const worldgen::BiomeDefinition& World::biomeAt(int worldX, int worldY) const
{
    return biomeClassifier_.biomeAt(worldX, worldY);
}

void World::placeStructure(std::string_view structureId, int worldX)
{
    const worldgen::StructureDefinition& definition = structureIndex_.structure(structureId);
    const int surfaceY = static_cast<int>(std::floor(surfaceHeight(worldX)));
    structureIndex_.placeStructure(worldX, surfaceY, definition,
                                   [this](int x, int y, BlockId block) { setBlockAt(x, y, block); });
}

int World::spawn(const glm::vec2& position)
{
    return chunkManager_.forceLoadChunksAroundPosition(position.x, position.y);
}

void World::update(const FrameInput& input)
{
    chunkManager_.updatePlayerDirection(input.playerPosition.x, input.playerPosition.y, input.playerVelocity.x,
                                        input.playerVelocity.y);
    chunkManager_.updateVisibleChunks(input.camera.x, input.camera.y);
    chunkManager_.processChunkQueue(profile_.streaming.chunksPerFrame);
}
