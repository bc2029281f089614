#include "worldgen/structure_index.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <glm/geometric.hpp>

#include "worldgen/grid_math.h"

namespace worldgen
{

namespace
{

// Finite and representable as an int after flooring.
bool isCellCoordinate(double value)
{
    if (!std::isfinite(value))
    {
        return false;
    }
    const double floored = std::floor(value);
    return floored >= static_cast<double>(std::numeric_limits<int>::min()) &&
           floored <= static_cast<double>(std::numeric_limits<int>::max());
}

} // namespace

StructureSpatialIndex::StructureSpatialIndex(const NoiseFactory* noiseFactory, const StructureSettings& settings)
    : settings_(settings),
      noiseFactory_(noiseFactory)
{
    if (settings_.placementBucketSize <= 0)
    {
        throw std::invalid_argument("Structure placement bucket size must be positive");
    }

    placementNoise_ = resolveNoise(noiseFactory_, "structures", settings_.placementFrequency, "Structures",
                                   warnedMissingNoise_);
    oreNoise_ = resolveNoise(noiseFactory_, "ores", 0.08f, "Structures", warnedMissingNoise_);
}

void StructureSpatialIndex::registerStructure(StructureDefinition definition)
{
    if (definition.id.empty())
    {
        throw std::invalid_argument("Structure definitions require an id");
    }
    if (indexById_.count(definition.id) != 0)
    {
        std::ostringstream oss;
        oss << "Duplicate structure id '" << definition.id << "'";
        throw std::runtime_error(oss.str());
    }

    indexById_.emplace(definition.id, structures_.size());
    structures_.push_back(std::move(definition));
    accepted_.emplace_back();
}

void StructureSpatialIndex::registerOre(OreDefinition ore)
{
    for (const OreEntry& existing : ores_)
    {
        if (existing.definition.id == ore.id)
        {
            std::ostringstream oss;
            oss << "Duplicate ore id '" << ore.id << "'";
            throw std::runtime_error(oss.str());
        }
    }

    OreEntry entry{};
    entry.noise = resolveNoise(noiseFactory_, "ore_" + ore.id, 0.15f, "Structures", warnedMissingNoise_);
    entry.definition = std::move(ore);
    ores_.push_back(std::move(entry));
}

void StructureSpatialIndex::clearPositionsForChunk(int /*chunkX*/)
{
    for (auto& positions : accepted_)
    {
        positions.clear();
    }
}

float StructureSpatialIndex::placementValue(int worldX) const
{
    const int bucket = floorDiv(worldX, settings_.placementBucketSize);
    return (placementNoise_(static_cast<float>(bucket), 0.0f) + 1.0f) * 0.5f;
}

const StructureDefinition* StructureSpatialIndex::structureAt(int worldX,
                                                              int worldY,
                                                              std::string_view biomeId,
                                                              const FitsFn& fits)
{
    if (structures_.empty())
    {
        if (!warnedNoStructures_)
        {
            std::cerr << "[Structures] No structures registered, skipping structure placement" << std::endl;
            warnedNoStructures_ = true;
        }
        return nullptr;
    }

    const glm::vec2 candidate(static_cast<float>(worldX), static_cast<float>(worldY));
    const float value = placementValue(worldX);

    for (std::size_t i = 0; i < structures_.size(); ++i)
    {
        const StructureDefinition& definition = structures_[i];
        if (!definition.allowsBiome(biomeId) || value > definition.rarity)
        {
            continue;
        }
        if (fits && !fits(definition))
        {
            continue;
        }

        bool tooClose = false;
        for (const glm::vec2& placed : accepted_[i])
        {
            if (glm::distance(placed, candidate) < definition.minDistance)
            {
                tooClose = true;
                break;
            }
        }
        if (tooClose)
        {
            continue;
        }

        accepted_[i].push_back(candidate);
        return &definition;
    }

    return nullptr;
}

const OreDefinition* StructureSpatialIndex::oreAt(int worldX, int worldY) const
{
    const float x = static_cast<float>(worldX);
    const float y = static_cast<float>(worldY);
    const float shared = oreNoise_(x, y);

    for (const OreEntry& entry : ores_)
    {
        const OreDefinition& ore = entry.definition;
        if (worldY < ore.minY || worldY > ore.maxY)
        {
            continue;
        }

        const float combined = shared * 0.6f + entry.noise(x, y) * 0.4f;
        if (combined > 0.6f - ore.rarity)
        {
            return &ore;
        }
    }
    return nullptr;
}

void StructureSpatialIndex::placeStructure(double worldX,
                                           double worldY,
                                           const StructureDefinition& definition,
                                           const SetBlockFn& setBlock) const
{
    const double baseY = worldY + static_cast<double>(definition.yOffset);

    for (std::size_t rowIndex = 0; rowIndex < definition.pattern.size(); ++rowIndex)
    {
        const std::vector<BlockId>& row = definition.pattern[rowIndex];
        const double rowStart = worldX - std::floor(static_cast<double>(row.size()) / 2.0);
        for (std::size_t column = 0; column < row.size(); ++column)
        {
            const BlockId block = row[column];
            if (block == kAirBlock)
            {
                continue;
            }

            const double cellX = rowStart + static_cast<double>(column);
            const double cellY = baseY + static_cast<double>(rowIndex);
            if (!isCellCoordinate(cellX) || !isCellCoordinate(cellY))
            {
                std::cerr << "[Structures] Coordinate out of range while placing '" << definition.id << "': x=" << cellX
                          << ", y=" << cellY << std::endl;
                continue;
            }

            setBlock(static_cast<int>(std::floor(cellX)), static_cast<int>(std::floor(cellY)), block);
        }
    }
}

const StructureDefinition& StructureSpatialIndex::structure(std::string_view id) const
{
    if (const StructureDefinition* definition = tryGetStructure(id))
    {
        return *definition;
    }

    std::ostringstream oss;
    oss << "Structure '" << id << "' not registered";
    throw std::out_of_range(oss.str());
}

const StructureDefinition* StructureSpatialIndex::tryGetStructure(std::string_view id) const noexcept
{
    auto it = indexById_.find(std::string(id));
    if (it == indexById_.end())
    {
        return nullptr;
    }
    return &structures_[it->second];
}

const std::vector<glm::vec2>& StructureSpatialIndex::acceptedPositions(std::string_view id) const
{
    auto it = indexById_.find(std::string(id));
    if (it == indexById_.end())
    {
        std::ostringstream oss;
        oss << "Structure '" << id << "' not registered";
        throw std::out_of_range(oss.str());
    }
    return accepted_[it->second];
}

void StructureSpatialIndex::logBiomeStructureCompatibility(const std::vector<std::string>& biomeIds) const
{
    if (structures_.empty())
    {
        std::cerr << "[Structures] No structures registered" << std::endl;
        return;
    }

    for (const std::string& biomeId : biomeIds)
    {
        std::cout << "[Structures] " << biomeId << ":";
        bool any = false;
        for (const StructureDefinition& definition : structures_)
        {
            if (definition.allowsBiome(biomeId))
            {
                std::cout << ' ' << definition.id;
                any = true;
            }
        }
        if (!any)
        {
            std::cout << " (none)";
        }
        std::cout << std::endl;
    }
}

} // namespace worldgen
