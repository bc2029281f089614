#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "worldgen/biome_database.h"
#include "worldgen/noise_field.h"
#include "worldgen/worldgen_profile.h"

namespace worldgen
{

struct ClimateSample
{
    float temperature{0.0f};
    float humidity{0.0f};
};

// Assigns one biome per chunk column and shapes terrain per biome.
// Registration closes at the first query; later registrations throw.
class BiomeClassifier
{
public:
    BiomeClassifier(const NoiseFactory* noiseFactory, const ClimateSettings& settings, int chunkSize);

    void registerBiome(BiomeDefinition biome);

    [[nodiscard]] const BiomeDefinition& biomeAt(int worldX, int worldY) const;
    [[nodiscard]] const BiomeDefinition& biomeForColumn(int chunkX) const;
    [[nodiscard]] ClimateSample climateForColumn(int chunkX) const;

    // Biome-shaped height at worldX. Near a chunk edge the primary and the
    // neighbouring column's formulas are cross-faded so both sides agree on
    // the seam.
    [[nodiscard]] float modifyHeight(float worldX, float baseHeight) const;

    [[nodiscard]] BlockId blockAt(int worldX, int worldY, float heightAtX) const;

    [[nodiscard]] const BiomeDefinition& biome(std::string_view id) const;
    [[nodiscard]] const BiomeDefinition* tryGetBiome(std::string_view id) const noexcept;
    [[nodiscard]] std::vector<std::string> biomeIds() const;
    [[nodiscard]] std::size_t biomeCount() const noexcept { return entries_.size(); }
    [[nodiscard]] int chunkSize() const noexcept { return chunkSize_; }
    [[nodiscard]] int transitionWidth() const noexcept { return settings_.transitionWidth; }

private:
    struct Entry
    {
        BiomeDefinition definition;
        std::vector<NoiseFn> layerNoise;
        NoiseFn hillsLow;
        NoiseFn hillsHigh;
    };

    [[nodiscard]] const Entry& entryForColumn(int chunkX) const;
    [[nodiscard]] float shapedHeight(const Entry& entry, float worldX, float baseHeight) const;

    ClimateSettings settings_;
    int chunkSize_{16};
    const NoiseFactory* noiseFactory_{nullptr};
    bool warnedMissingNoise_{false};
    NoiseFn temperatureNoise_;
    NoiseFn humidityNoise_;
    NoiseFn boundaryNoise_;
    NoiseFn detailNoise_;

    std::vector<Entry> entries_{};
    std::unordered_map<std::string, std::size_t> indexById_{};
    mutable std::unordered_map<int, std::size_t> columnCache_{};
    mutable bool sealed_{false};
};

} // namespace worldgen
