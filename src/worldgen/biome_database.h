#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "worldgen/block_registry.h"

namespace worldgen
{

struct BiomeDefinition
{
    struct LayerVariant
    {
        BlockId block{kAirBlock};
        // Variant applies when the layer noise is above and/or below these values.
        std::optional<float> above{};
        std::optional<float> below{};
        std::optional<int> minDepth{};

        [[nodiscard]] bool matches(int depth, float noise) const noexcept
        {
            if (minDepth && depth < *minDepth)
            {
                return false;
            }
            if (above && !(noise > *above))
            {
                return false;
            }
            if (below && !(noise < *below))
            {
                return false;
            }
            return true;
        }
    };

    struct Layer
    {
        std::string name;
        int minDepth{0};
        std::optional<int> maxDepth{};
        BlockId block{kAirBlock};
        float noiseFrequency{0.1f};
        std::vector<LayerVariant> variants{};

        [[nodiscard]] bool containsDepth(int depth) const noexcept
        {
            return depth >= minDepth && (!maxDepth || depth <= *maxDepth);
        }
    };

    std::string id;
    std::string name;
    float minTemperature{-1.0f};
    float maxTemperature{1.0f};
    float minHumidity{-1.0f};
    float maxHumidity{1.0f};
    float heightMultiplier{1.0f};
    float heightAddition{0.0f};
    float terrainVariability{0.2f};
    float peakFrequency{0.3f};
    float rollingHills{0.0f};
    std::vector<Layer> layers{};
    BlockId fallbackBlock{blocks::kStone};
    std::vector<BlockId> structureFoundations{};

    [[nodiscard]] bool isApplicable(float temperature, float humidity) const noexcept
    {
        return temperature >= minTemperature && temperature <= maxTemperature && humidity >= minHumidity &&
               humidity <= maxHumidity;
    }

    [[nodiscard]] float shapeHeight(float baseHeight, float detailNoise, float hillsNoise) const noexcept
    {
        return baseHeight * heightMultiplier + detailNoise * terrainVariability * 10.0f + heightAddition +
               hillsNoise * rollingHills;
    }

    // First layer whose depth range contains depth, or nullptr.
    [[nodiscard]] const Layer* layerForDepth(int depth) const noexcept;
    [[nodiscard]] bool supportsStructureOn(BlockId block) const noexcept;
};

class BiomeDatabase
{
public:
    BiomeDatabase(const std::filesystem::path& directory, const BlockRegistry& blocks);

    [[nodiscard]] const BiomeDefinition& biome(const std::string& id) const;
    [[nodiscard]] const BiomeDefinition* tryGetBiome(const std::string& id) const noexcept;
    [[nodiscard]] const std::vector<BiomeDefinition>& definitions() const noexcept { return definitions_; }
    [[nodiscard]] std::size_t biomeCount() const noexcept { return definitions_.size(); }

    static BiomeDefinition parseBiomeFile(const std::filesystem::path& path, const BlockRegistry& blocks);

private:
    void loadFromDirectory(const std::filesystem::path& directory, const BlockRegistry& blocks);

    std::vector<BiomeDefinition> definitions_{};
    std::unordered_map<std::string, std::size_t> indexById_{};
};

} // namespace worldgen
