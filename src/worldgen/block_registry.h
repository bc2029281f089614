#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace worldgen
{

using BlockId = std::uint16_t;

inline constexpr BlockId kAirBlock = 0;

struct BlockCapabilities
{
    bool solid{true};
    // Structures may overwrite the cell.
    bool replaceable{false};
    bool structureFoundation{false};
    bool oreHost{false};
};

struct BlockDefinition
{
    BlockId id{kAirBlock};
    std::string name;
    char glyph{'?'};
    std::uint32_t color{0xFF00FFu};
    BlockCapabilities capabilities{};
};

class BlockRegistry
{
public:
    BlockRegistry() = default;

    const BlockDefinition& add(BlockDefinition definition);

    [[nodiscard]] const BlockDefinition& block(BlockId id) const;
    [[nodiscard]] const BlockDefinition* tryGetBlock(BlockId id) const noexcept;
    [[nodiscard]] BlockId idOf(std::string_view name) const;
    [[nodiscard]] bool contains(BlockId id) const noexcept;
    [[nodiscard]] const BlockCapabilities& capabilities(BlockId id) const;
    [[nodiscard]] const std::vector<BlockDefinition>& definitions() const noexcept { return definitions_; }
    [[nodiscard]] std::size_t blockCount() const noexcept { return definitions_.size(); }

private:
    std::vector<BlockDefinition> definitions_{};
    std::unordered_map<std::string, std::size_t> indexByName_{};
    // Dense, keyed by block id; -1 marks an unregistered id.
    std::vector<std::int32_t> indexById_{};
};

// Registers the stock palette. Ids are stable across runs.
void registerBuiltinBlocks(BlockRegistry& registry);

namespace blocks
{
inline constexpr BlockId kDirt = 1;
inline constexpr BlockId kGrass = 2;
inline constexpr BlockId kStone = 3;
inline constexpr BlockId kSand = 4;
inline constexpr BlockId kSandstone = 5;
inline constexpr BlockId kClay = 6;
inline constexpr BlockId kGravel = 7;
inline constexpr BlockId kSnow = 8;
inline constexpr BlockId kIce = 9;
inline constexpr BlockId kBedrock = 10;
inline constexpr BlockId kOakLog = 11;
inline constexpr BlockId kOakLeaves = 12;
inline constexpr BlockId kCoalOre = 13;
inline constexpr BlockId kIronOre = 14;
inline constexpr BlockId kGoldOre = 15;
inline constexpr BlockId kDiamondOre = 16;
inline constexpr BlockId kEmeraldOre = 17;
inline constexpr BlockId kCactus = 18;
inline constexpr BlockId kSpruceLog = 19;
inline constexpr BlockId kSpruceLeaves = 20;
inline constexpr BlockId kDeepslate = 21;
inline constexpr BlockId kPodzol = 22;
inline constexpr BlockId kMycelium = 23;
inline constexpr BlockId kRedSand = 24;
inline constexpr BlockId kTerracotta = 25;
inline constexpr BlockId kMud = 26;
inline constexpr BlockId kAcaciaLog = 27;
inline constexpr BlockId kAcaciaLeaves = 28;
inline constexpr BlockId kCobblestone = 29;
inline constexpr BlockId kMossyCobblestone = 30;
inline constexpr BlockId kMushroomStem = 31;
inline constexpr BlockId kMushroomCap = 32;
} // namespace blocks

} // namespace worldgen
