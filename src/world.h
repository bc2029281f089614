#pragma once

#include <filesystem>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <glm/vec2.hpp>

#include "chunk_manager.h"
#include "worldgen/biome_classifier.h"
#include "worldgen/block_registry.h"
#include "worldgen/chunk_factory.h"
#include "worldgen/grid_math.h"
#include "worldgen/height_profile.h"
#include "worldgen/noise_field.h"
#include "worldgen/structure_index.h"
#include "worldgen/worldgen_profile.h"

// Immutable tables produced by the startup registration pass.
struct WorldDefinitions
{
    worldgen::BlockRegistry blocks{};
    std::vector<worldgen::BiomeDefinition> biomes{};
    std::vector<worldgen::StructureDefinition> structures{};
    std::vector<worldgen::OreDefinition> ores{};

    // Reads <assetDir>/biomes and <assetDir>/structures on top of the built-in blocks.
    static WorldDefinitions load(const std::filesystem::path& assetDir);
};

struct FrameInput
{
    glm::vec2 camera{0.0f};
    glm::vec2 playerPosition{0.0f};
    glm::vec2 playerVelocity{0.0f};
};

using ModifiedBlockMap = std::unordered_map<glm::ivec2, worldgen::BlockId, worldgen::ColumnHasher>;

class World
{
public:
    World(const worldgen::WorldgenProfile& profile, WorldDefinitions definitions, ChunkRenderSink* sink = nullptr);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // Edits win over generated terrain; outside the vertical bounds the world is air or bedrock.
    const worldgen::BlockDefinition& blockAt(int worldX, int worldY);
    void setBlockAt(int worldX, int worldY, worldgen::BlockId block);
    void setBlockAt(int worldX, int worldY, std::string_view blockName);
    [[nodiscard]] const ModifiedBlockMap& modifiedBlocks() const noexcept { return modifiedBlocks_; }
    void clearModifiedBlocks();

    [[nodiscard]] int heightAt(int worldX) const;
    [[nodiscard]] float surfaceHeight(int worldX) const;
    [[nodiscard]] const worldgen::BiomeDefinition& biomeAt(int worldX, int worldY) const;

    void placeStructure(std::string_view structureId, int worldX);

    // Positions are world pixels: block coordinates scaled by the tile size.
    int spawn(const glm::vec2& position);
    void update(const FrameInput& input);

    [[nodiscard]] ChunkManager& chunkManager() noexcept { return chunkManager_; }
    [[nodiscard]] const ChunkManager& chunkManager() const noexcept { return chunkManager_; }
    [[nodiscard]] const worldgen::BlockRegistry& blocks() const noexcept { return blocks_; }
    [[nodiscard]] const worldgen::BiomeClassifier& biomes() const noexcept { return biomeClassifier_; }
    [[nodiscard]] const worldgen::StructureSpatialIndex& structures() const noexcept { return structureIndex_; }
    [[nodiscard]] const worldgen::WorldgenProfile& profile() const noexcept { return profile_; }

private:
    void generateChunk(Chunk& chunk);
    void applyOverrides(Chunk& chunk) const;
    [[nodiscard]] glm::ivec2 chunkOfBlock(int worldX, int worldY) const noexcept;

    worldgen::WorldgenProfile profile_;
    worldgen::BlockRegistry blocks_;
    worldgen::NoiseFactory noiseFactory_;
    worldgen::HeightProfile heightProfile_;
    worldgen::BiomeClassifier biomeClassifier_;
    worldgen::StructureSpatialIndex structureIndex_;
    worldgen::ChunkFactory chunkFactory_;
    ModifiedBlockMap modifiedBlocks_{};
    std::unordered_map<glm::ivec2, std::vector<glm::ivec2>, worldgen::ColumnHasher> overridesByChunk_{};
    ChunkManager chunkManager_;
};
