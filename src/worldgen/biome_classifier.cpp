#include "worldgen/biome_classifier.h"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <glm/gtc/constants.hpp>

#include "worldgen/grid_math.h"

namespace worldgen
{

BiomeClassifier::BiomeClassifier(const NoiseFactory* noiseFactory, const ClimateSettings& settings, int chunkSize)
    : settings_(settings),
      chunkSize_(chunkSize),
      noiseFactory_(noiseFactory)
{
    if (chunkSize_ <= 0)
    {
        throw std::invalid_argument("BiomeClassifier chunk size must be positive");
    }
    if (settings_.transitionWidth < 0 || settings_.transitionWidth > chunkSize_)
    {
        std::ostringstream oss;
        oss << "BiomeClassifier transition width " << settings_.transitionWidth << " must be within [0, "
            << chunkSize_ << "]";
        throw std::invalid_argument(oss.str());
    }

    temperatureNoise_ = resolveNoise(noiseFactory_, "temperature", settings_.temperatureFrequency,
                                     "BiomeClassifier", warnedMissingNoise_);
    humidityNoise_ = resolveNoise(noiseFactory_, "humidity", settings_.humidityFrequency, "BiomeClassifier",
                                  warnedMissingNoise_);
    boundaryNoise_ = resolveNoise(noiseFactory_, "biome_boundary", settings_.boundaryFrequency, "BiomeClassifier",
                                  warnedMissingNoise_);
    detailNoise_ = resolveNoise(noiseFactory_, "terrain_detail", settings_.detailFrequency, "BiomeClassifier",
                                warnedMissingNoise_);
}

void BiomeClassifier::registerBiome(BiomeDefinition biome)
{
    if (sealed_)
    {
        std::ostringstream oss;
        oss << "Cannot register biome '" << biome.id << "' after biome queries have started";
        throw std::logic_error(oss.str());
    }
    if (biome.id.empty())
    {
        throw std::invalid_argument("Biome definitions require an id");
    }
    if (indexById_.count(biome.id) != 0)
    {
        std::ostringstream oss;
        oss << "Duplicate biome id '" << biome.id << "'";
        throw std::runtime_error(oss.str());
    }

    Entry entry{};
    entry.layerNoise.reserve(biome.layers.size());
    for (const BiomeDefinition::Layer& layer : biome.layers)
    {
        entry.layerNoise.push_back(resolveNoise(noiseFactory_, biome.id + "_" + layer.name, layer.noiseFrequency,
                                                "BiomeClassifier", warnedMissingNoise_));
    }
    entry.hillsLow = resolveNoise(noiseFactory_, biome.id + "_hills_low", 0.01f, "BiomeClassifier",
                                  warnedMissingNoise_);
    entry.hillsHigh = resolveNoise(noiseFactory_, biome.id + "_hills_high", 0.05f, "BiomeClassifier",
                                   warnedMissingNoise_);
    entry.definition = std::move(biome);

    indexById_.emplace(entry.definition.id, entries_.size());
    entries_.push_back(std::move(entry));
}

ClimateSample BiomeClassifier::climateForColumn(int chunkX) const
{
    const float centerX = static_cast<float>(chunkX * chunkSize_) + static_cast<float>(chunkSize_) * 0.5f;
    const float jitter = boundaryNoise_(centerX, 0.0f) * settings_.boundaryAmplitude;

    ClimateSample sample{};
    sample.temperature = temperatureNoise_(centerX, 0.0f) + jitter;
    sample.humidity = humidityNoise_(centerX, 0.0f) + jitter;
    return sample;
}

const BiomeClassifier::Entry& BiomeClassifier::entryForColumn(int chunkX) const
{
    sealed_ = true;
    if (entries_.empty())
    {
        throw std::runtime_error("No biomes registered with BiomeClassifier");
    }

    auto cached = columnCache_.find(chunkX);
    if (cached != columnCache_.end())
    {
        return entries_[cached->second];
    }

    const ClimateSample climate = climateForColumn(chunkX);
    std::size_t selected = 0;
    for (std::size_t i = 0; i < entries_.size(); ++i)
    {
        if (entries_[i].definition.isApplicable(climate.temperature, climate.humidity))
        {
            selected = i;
            break;
        }
    }

    columnCache_.emplace(chunkX, selected);
    return entries_[selected];
}

const BiomeDefinition& BiomeClassifier::biomeForColumn(int chunkX) const
{
    return entryForColumn(chunkX).definition;
}

const BiomeDefinition& BiomeClassifier::biomeAt(int worldX, int /*worldY*/) const
{
    return biomeForColumn(floorDiv(worldX, chunkSize_));
}

float BiomeClassifier::shapedHeight(const Entry& entry, float worldX, float baseHeight) const
{
    const BiomeDefinition& biome = entry.definition;
    const float detail = detailNoise_(worldX * biome.peakFrequency, 0.0f);
    float hills = 0.0f;
    if (biome.rollingHills != 0.0f)
    {
        hills = entry.hillsLow(worldX, 0.0f) * 2.0f + entry.hillsHigh(worldX, 0.0f);
    }
    return biome.shapeHeight(baseHeight, detail, hills);
}

float BiomeClassifier::modifyHeight(float worldX, float baseHeight) const
{
    const int chunkX = static_cast<int>(std::floor(worldX / static_cast<float>(chunkSize_)));
    const Entry& primary = entryForColumn(chunkX);
    const float primaryHeight = shapedHeight(primary, worldX, baseHeight);

    const float halfTransition = static_cast<float>(settings_.transitionWidth) * 0.5f;
    const float fromStart = worldX - static_cast<float>(chunkX * chunkSize_);
    const float fromEnd = static_cast<float>(chunkSize_) - fromStart;
    if (halfTransition <= 0.0f || (fromStart >= halfTransition && fromEnd >= halfTransition))
    {
        return primaryHeight;
    }

    const bool nearStart = fromStart < halfTransition;
    const int neighborX = nearStart ? chunkX - 1 : chunkX + 1;
    const float distance = nearStart ? fromStart : fromEnd;

    const Entry& neighbor = entryForColumn(neighborX);
    const float neighborHeight = shapedHeight(neighbor, worldX, baseHeight);

    // w runs 0 -> 1 from the seam to half the transition width. Both columns
    // meet at the midpoint on the seam.
    const float w = (1.0f - std::cos(distance / halfTransition * glm::pi<float>())) * 0.5f;
    const float primaryWeight = 0.5f + 0.5f * w;
    return primaryHeight * primaryWeight + neighborHeight * (1.0f - primaryWeight);
}

BlockId BiomeClassifier::blockAt(int worldX, int worldY, float heightAtX) const
{
    const int depth = static_cast<int>(std::floor(heightAtX)) - worldY;
    if (depth < 0)
    {
        return kAirBlock;
    }

    const Entry& entry = entryForColumn(floorDiv(worldX, chunkSize_));
    const BiomeDefinition& biome = entry.definition;
    const BiomeDefinition::Layer* layer = biome.layerForDepth(depth);
    if (!layer)
    {
        return biome.fallbackBlock;
    }

    if (!layer->variants.empty())
    {
        const auto layerIndex = static_cast<std::size_t>(layer - biome.layers.data());
        const float noise = entry.layerNoise[layerIndex](static_cast<float>(worldX), static_cast<float>(worldY));
        for (const BiomeDefinition::LayerVariant& variant : layer->variants)
        {
            if (variant.matches(depth, noise))
            {
                return variant.block;
            }
        }
    }
    return layer->block;
}

const BiomeDefinition& BiomeClassifier::biome(std::string_view id) const
{
    if (const BiomeDefinition* definition = tryGetBiome(id))
    {
        return *definition;
    }

    std::ostringstream oss;
    oss << "Biome '" << id << "' not registered";
    throw std::out_of_range(oss.str());
}

const BiomeDefinition* BiomeClassifier::tryGetBiome(std::string_view id) const noexcept
{
    auto it = indexById_.find(std::string(id));
    if (it == indexById_.end())
    {
        return nullptr;
    }
    return &entries_[it->second].definition;
}

std::vector<std::string> BiomeClassifier::biomeIds() const
{
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const Entry& entry : entries_)
    {
        ids.push_back(entry.definition.id);
    }
    return ids;
}

} // namespace worldgen
