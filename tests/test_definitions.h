#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "world.h"
#include "worldgen/biome_database.h"
#include "worldgen/block_registry.h"
#include "worldgen/structure_database.h"
#include "worldgen/worldgen_profile.h"

namespace testing_support
{

inline std::filesystem::path assetDir()
{
    return std::filesystem::path(WORLDGEN_ASSET_DIR);
}

inline worldgen::BlockRegistry builtinBlocks()
{
    worldgen::BlockRegistry registry;
    worldgen::registerBuiltinBlocks(registry);
    return registry;
}

// Grass over dirt over stone, accepting every climate.
inline worldgen::BiomeDefinition makeBiome(const std::string& id, float minTemperature = -1.0f,
                                           float maxTemperature = 1.0f)
{
    using worldgen::BiomeDefinition;
    namespace blocks = worldgen::blocks;

    BiomeDefinition biome{};
    biome.id = id;
    biome.name = id;
    biome.minTemperature = minTemperature;
    biome.maxTemperature = maxTemperature;

    BiomeDefinition::Layer surface{};
    surface.name = "surface";
    surface.minDepth = 0;
    surface.maxDepth = 0;
    surface.block = blocks::kGrass;

    BiomeDefinition::Layer soil{};
    soil.name = "soil";
    soil.minDepth = 1;
    soil.maxDepth = 4;
    soil.block = blocks::kDirt;

    BiomeDefinition::Layer rock{};
    rock.name = "rock";
    rock.minDepth = 5;
    rock.block = blocks::kStone;

    biome.layers = {surface, soil, rock};
    biome.structureFoundations = {blocks::kGrass};
    return biome;
}

// Three-wide canopy on a two-high trunk.
inline worldgen::StructureDefinition makeTree(const std::string& id, float rarity, float minDistance,
                                              std::vector<std::string> validBiomes)
{
    namespace blocks = worldgen::blocks;
    constexpr worldgen::BlockId air = worldgen::kAirBlock;

    worldgen::StructureDefinition tree{};
    tree.id = id;
    tree.name = id;
    tree.rarity = rarity;
    tree.minDistance = minDistance;
    tree.validBiomes = std::move(validBiomes);
    tree.pattern = {
        {air, blocks::kOakLog, air},
        {air, blocks::kOakLog, air},
        {blocks::kOakLeaves, blocks::kOakLeaves, blocks::kOakLeaves},
    };
    return tree;
}

inline WorldDefinitions makeDefinitions()
{
    WorldDefinitions definitions{};
    worldgen::registerBuiltinBlocks(definitions.blocks);
    definitions.biomes.push_back(makeBiome("plains"));
    definitions.structures.push_back(makeTree("tree", 0.5f, 6.0f, {"plains"}));
    return definitions;
}

inline worldgen::WorldgenProfile makeProfile(const std::string& seed = "1234567890")
{
    worldgen::WorldgenProfile profile{};
    profile.seed = seed;
    profile.chunkSize = 16;
    profile.streaming.viewportSize = {256, 256};
    profile.streaming.viewMargin = 0;
    profile.streaming.forceLoadRadius = 1;
    return profile;
}

} // namespace testing_support
