#include "worldgen/block_registry.h"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace worldgen
{
namespace
{
constexpr BlockCapabilities kGas{false, true, false, false};
constexpr BlockCapabilities kSoil{true, false, true, false};
constexpr BlockCapabilities kRock{true, false, true, true};
constexpr BlockCapabilities kLoose{true, false, true, false};
constexpr BlockCapabilities kPlant{true, true, false, false};
constexpr BlockCapabilities kSolid{true, false, false, false};

} // namespace

const BlockDefinition& BlockRegistry::add(BlockDefinition definition)
{
    if (definition.name.empty())
    {
        throw std::invalid_argument("Block definitions require a name");
    }

    if (contains(definition.id))
    {
        std::ostringstream oss;
        oss << "Duplicate block id " << definition.id << " ('" << definition.name << "')";
        throw std::runtime_error(oss.str());
    }
    if (indexByName_.count(definition.name) != 0)
    {
        std::ostringstream oss;
        oss << "Duplicate block name '" << definition.name << "'";
        throw std::runtime_error(oss.str());
    }

    const std::size_t index = definitions_.size();
    if (indexById_.size() <= definition.id)
    {
        indexById_.resize(static_cast<std::size_t>(definition.id) + 1, -1);
    }
    indexById_[definition.id] = static_cast<std::int32_t>(index);
    indexByName_.emplace(definition.name, index);
    definitions_.push_back(std::move(definition));
    return definitions_.back();
}

const BlockDefinition& BlockRegistry::block(BlockId id) const
{
    if (const BlockDefinition* definition = tryGetBlock(id))
    {
        return *definition;
    }

    std::ostringstream oss;
    oss << "Block id " << id << " is not registered";
    throw std::out_of_range(oss.str());
}

const BlockDefinition* BlockRegistry::tryGetBlock(BlockId id) const noexcept
{
    if (!contains(id))
    {
        return nullptr;
    }
    return &definitions_[static_cast<std::size_t>(indexById_[id])];
}

BlockId BlockRegistry::idOf(std::string_view name) const
{
    auto it = indexByName_.find(std::string(name));
    if (it == indexByName_.end())
    {
        std::ostringstream oss;
        oss << "Block '" << name << "' not found";
        throw std::runtime_error(oss.str());
    }
    return definitions_[it->second].id;
}

bool BlockRegistry::contains(BlockId id) const noexcept
{
    return id < indexById_.size() && indexById_[id] >= 0;
}

const BlockCapabilities& BlockRegistry::capabilities(BlockId id) const
{
    return block(id).capabilities;
}

void registerBuiltinBlocks(BlockRegistry& registry)
{
    registry.add({kAirBlock, "air", ' ', 0x000000u, kGas});
    registry.add({blocks::kDirt, "dirt", 'd', 0x8B5A2Bu, kSoil});
    registry.add({blocks::kGrass, "grass", '"', 0x5FA935u, kSoil});
    registry.add({blocks::kStone, "stone", '#', 0x7F7F7Fu, kRock});
    registry.add({blocks::kSand, "sand", ':', 0xDBCF8Eu, kLoose});
    registry.add({blocks::kSandstone, "sandstone", '=', 0xD8C78Au, kRock});
    registry.add({blocks::kClay, "clay", 'c', 0x9EA4B0u, kSoil});
    registry.add({blocks::kGravel, "gravel", ',', 0x857F7Bu, kLoose});
    registry.add({blocks::kSnow, "snow", '*', 0xF5FBFBu, kSoil});
    registry.add({blocks::kIce, "ice", '~', 0x9DC3FFu, kSolid});
    registry.add({blocks::kBedrock, "bedrock", 'B', 0x333333u, kSolid});
    registry.add({blocks::kOakLog, "oak_log", '|', 0x6B5133u, kSolid});
    registry.add({blocks::kOakLeaves, "oak_leaves", '&', 0x3C8A2Eu, kPlant});
    registry.add({blocks::kCoalOre, "coal_ore", 'o', 0x3A3A3Au, kSolid});
    registry.add({blocks::kIronOre, "iron_ore", 'i', 0xB08C6Cu, kSolid});
    registry.add({blocks::kGoldOre, "gold_ore", 'g', 0xE8C33Eu, kSolid});
    registry.add({blocks::kDiamondOre, "diamond_ore", 'D', 0x5DECF5u, kSolid});
    registry.add({blocks::kEmeraldOre, "emerald_ore", 'E', 0x17DD62u, kSolid});
    registry.add({blocks::kCactus, "cactus", 'Y', 0x3F8A2Cu, kPlant});
    registry.add({blocks::kSpruceLog, "spruce_log", '!', 0x3D2A17u, kSolid});
    registry.add({blocks::kSpruceLeaves, "spruce_leaves", '^', 0x2E5232u, kPlant});
    registry.add({blocks::kDeepslate, "deepslate", '%', 0x4A4A50u, kRock});
    registry.add({blocks::kPodzol, "podzol", 'p', 0x5C3F1Eu, kSoil});
    registry.add({blocks::kMycelium, "mycelium", 'm', 0x6F6265u, kSoil});
    registry.add({blocks::kRedSand, "red_sand", ';', 0xBE6621u, kLoose});
    registry.add({blocks::kTerracotta, "terracotta", 't', 0x985E43u, kRock});
    registry.add({blocks::kMud, "mud", 'u', 0x3C3837u, kSoil});
    registry.add({blocks::kAcaciaLog, "acacia_log", 'l', 0x676157u, kSolid});
    registry.add({blocks::kAcaciaLeaves, "acacia_leaves", '@', 0x6A8C2Cu, kPlant});
    registry.add({blocks::kCobblestone, "cobblestone", 'C', 0x7A7A7Au, kSolid});
    registry.add({blocks::kMossyCobblestone, "mossy_cobblestone", 'M', 0x6E7F5Cu, kSolid});
    registry.add({blocks::kMushroomStem, "mushroom_stem", 'I', 0xCBC4B9u, kSolid});
    registry.add({blocks::kMushroomCap, "mushroom_cap", 'R', 0xB22A2Au, kPlant});
}

} // namespace worldgen
