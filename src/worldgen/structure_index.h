#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>

#include "worldgen/noise_field.h"
#include "worldgen/structure_database.h"
#include "worldgen/worldgen_profile.h"

namespace worldgen
{

using SetBlockFn = std::function<void(int worldX, int worldY, BlockId block)>;
// Returns false when a structure cannot be built at the candidate column.
using FitsFn = std::function<bool(const StructureDefinition& definition)>;

// Decides where structures and ore cells go. Spacing between placements of
// the same structure is enforced against the positions accepted since the
// last clearPositionsForChunk().
class StructureSpatialIndex
{
public:
    StructureSpatialIndex(const NoiseFactory* noiseFactory, const StructureSettings& settings);

    void registerStructure(StructureDefinition definition);
    void registerOre(OreDefinition ore);

    // Starts a new accumulation window for the chunk about to be generated.
    // The whole history is dropped so regenerating a chunk repeats its choices.
    void clearPositionsForChunk(int chunkX);

    // Structures rejected by fits are passed over without being recorded.
    [[nodiscard]] const StructureDefinition* structureAt(int worldX,
                                                         int worldY,
                                                         std::string_view biomeId,
                                                         const FitsFn& fits = {});
    [[nodiscard]] const OreDefinition* oreAt(int worldX, int worldY) const;

    void placeStructure(double worldX,
                        double worldY,
                        const StructureDefinition& definition,
                        const SetBlockFn& setBlock) const;

    // Bucketed placement noise mapped to [0, 1].
    [[nodiscard]] float placementValue(int worldX) const;

    [[nodiscard]] const StructureDefinition& structure(std::string_view id) const;
    [[nodiscard]] const StructureDefinition* tryGetStructure(std::string_view id) const noexcept;
    [[nodiscard]] const std::vector<glm::vec2>& acceptedPositions(std::string_view id) const;
    [[nodiscard]] std::size_t structureCount() const noexcept { return structures_.size(); }
    [[nodiscard]] std::size_t oreCount() const noexcept { return ores_.size(); }

    void logBiomeStructureCompatibility(const std::vector<std::string>& biomeIds) const;

private:
    struct OreEntry
    {
        OreDefinition definition;
        NoiseFn noise;
    };

    StructureSettings settings_;
    const NoiseFactory* noiseFactory_{nullptr};
    bool warnedMissingNoise_{false};
    bool warnedNoStructures_{false};
    NoiseFn placementNoise_;
    NoiseFn oreNoise_;

    std::vector<StructureDefinition> structures_{};
    std::vector<std::vector<glm::vec2>> accepted_{};
    std::unordered_map<std::string, std::size_t> indexById_{};
    std::vector<OreEntry> ores_{};
};

} // namespace worldgen
