#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "worldgen/block_registry.h"

namespace worldgen
{

struct StructureDefinition
{
    std::string id;
    std::string name;
    float rarity{0.5f};
    float minDistance{0.0f};
    std::vector<std::string> validBiomes{};
    // pattern[0] is the bottom row. kAirBlock cells are left untouched.
    std::vector<std::vector<BlockId>> pattern{};
    int yOffset{1};

    [[nodiscard]] int width() const noexcept;
    [[nodiscard]] int height() const noexcept { return static_cast<int>(pattern.size()); }
    [[nodiscard]] bool allowsBiome(std::string_view biomeId) const noexcept;
};

struct OreDefinition
{
    std::string id;
    BlockId block{kAirBlock};
    float rarity{0.1f};
    int minY{-120};
    int maxY{0};
};

class StructureDatabase
{
public:
    StructureDatabase(const std::filesystem::path& directory, const BlockRegistry& blocks);

    [[nodiscard]] const std::vector<StructureDefinition>& structures() const noexcept { return structures_; }
    [[nodiscard]] const std::vector<OreDefinition>& ores() const noexcept { return ores_; }

    // Appends every [[structure]] and [[ore]] in one file.
    void parseFile(const std::filesystem::path& path, const BlockRegistry& blocks);

private:
    std::vector<StructureDefinition> structures_{};
    std::vector<OreDefinition> ores_{};
};

} // namespace worldgen
