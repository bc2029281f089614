#include "worldgen/biome_database.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <toml++/toml.h>

#include "worldgen/toml_fields.h"

namespace worldgen
{
namespace
{
using detail::optionalFloat;
using detail::optionalInt;
using detail::requireFloat;
using detail::requireInt;
using detail::requireString;
using detail::resolveBlock;

BiomeDefinition::Layer parseLayer(const toml::table& table,
                                  const BlockRegistry& blocks,
                                  const std::filesystem::path& filePath)
{
    BiomeDefinition::Layer layer{};
    layer.name = requireString(table, "name", filePath);
    layer.minDepth = requireInt(table, "min_depth", filePath);
    layer.maxDepth = optionalInt(table, "max_depth");
    layer.block = resolveBlock(blocks, requireString(table, "block", filePath), filePath);
    layer.noiseFrequency = optionalFloat(table, "noise_frequency").value_or(layer.noiseFrequency);

    if (layer.minDepth < 0 || (layer.maxDepth && *layer.maxDepth < layer.minDepth))
    {
        std::ostringstream oss;
        oss << "Layer '" << layer.name << "' in " << filePath << " has an invalid depth range";
        throw std::runtime_error(oss.str());
    }
    if (!std::isfinite(layer.noiseFrequency) || layer.noiseFrequency <= 0.0f)
    {
        std::ostringstream oss;
        oss << "Layer '" << layer.name << "' in " << filePath << " needs a positive noise_frequency";
        throw std::runtime_error(oss.str());
    }

    if (const toml::array* variants = table["variant"].as_array())
    {
        for (const toml::node& node : *variants)
        {
            const toml::table* variantTable = node.as_table();
            if (!variantTable)
            {
                std::ostringstream oss;
                oss << "Variants of layer '" << layer.name << "' in " << filePath << " must be tables";
                throw std::runtime_error(oss.str());
            }

            BiomeDefinition::LayerVariant variant{};
            variant.block = resolveBlock(blocks, requireString(*variantTable, "block", filePath), filePath);
            variant.above = optionalFloat(*variantTable, "above");
            variant.below = optionalFloat(*variantTable, "below");
            variant.minDepth = optionalInt(*variantTable, "min_depth");
            layer.variants.push_back(variant);
        }
    }

    return layer;
}

} // namespace

const BiomeDefinition::Layer* BiomeDefinition::layerForDepth(int depth) const noexcept
{
    for (const Layer& layer : layers)
    {
        if (layer.containsDepth(depth))
        {
            return &layer;
        }
    }
    return nullptr;
}

bool BiomeDefinition::supportsStructureOn(BlockId block) const noexcept
{
    return std::find(structureFoundations.begin(), structureFoundations.end(), block) != structureFoundations.end();
}

BiomeDatabase::BiomeDatabase(const std::filesystem::path& directory, const BlockRegistry& blocks)
{
    loadFromDirectory(directory, blocks);
}

const BiomeDefinition& BiomeDatabase::biome(const std::string& id) const
{
    if (const BiomeDefinition* definition = tryGetBiome(id))
    {
        return *definition;
    }

    std::ostringstream oss;
    oss << "Biome '" << id << "' not found";
    throw std::out_of_range(oss.str());
}

const BiomeDefinition* BiomeDatabase::tryGetBiome(const std::string& id) const noexcept
{
    auto it = indexById_.find(id);
    if (it == indexById_.end())
    {
        return nullptr;
    }
    return &definitions_[it->second];
}

void BiomeDatabase::loadFromDirectory(const std::filesystem::path& directory, const BlockRegistry& blocks)
{
    const std::vector<std::filesystem::path> files = detail::listTomlFiles(directory, "Biome");
    if (files.empty())
    {
        std::ostringstream oss;
        oss << "No biome configuration files found in " << directory;
        throw std::runtime_error(oss.str());
    }

    definitions_.clear();
    indexById_.clear();

    for (const std::filesystem::path& path : files)
    {
        BiomeDefinition definition = parseBiomeFile(path, blocks);
        if (indexById_.count(definition.id) != 0)
        {
            std::ostringstream oss;
            oss << "Duplicate biome id '" << definition.id << "' in " << path;
            throw std::runtime_error(oss.str());
        }
        indexById_.emplace(definition.id, definitions_.size());
        definitions_.push_back(std::move(definition));
    }
}

BiomeDefinition BiomeDatabase::parseBiomeFile(const std::filesystem::path& path, const BlockRegistry& blocks)
{
    toml::table table = toml::parse_file(path.string());

    BiomeDefinition definition{};
    definition.id = requireString(table, "id", path);
    definition.name = requireString(table, "name", path);
    detail::readRange(table, "temperature", definition.minTemperature, definition.maxTemperature, path);
    detail::readRange(table, "humidity", definition.minHumidity, definition.maxHumidity, path);
    definition.heightMultiplier = requireFloat(table, "height_multiplier", path);
    definition.heightAddition = requireFloat(table, "height_addition", path);
    definition.terrainVariability = requireFloat(table, "terrain_variability", path);
    definition.peakFrequency = requireFloat(table, "peak_frequency", path);
    definition.rollingHills = optionalFloat(table, "rolling_hills").value_or(0.0f);

    for (const float value : {definition.heightMultiplier, definition.heightAddition, definition.terrainVariability,
                              definition.peakFrequency, definition.rollingHills})
    {
        if (!std::isfinite(value))
        {
            std::ostringstream oss;
            oss << "Biome '" << definition.id << "' in " << path << " has non-finite terrain parameters";
            throw std::runtime_error(oss.str());
        }
    }
    if (definition.peakFrequency <= 0.0f)
    {
        std::ostringstream oss;
        oss << "Biome '" << definition.id << "' in " << path << " needs a positive peak_frequency";
        throw std::runtime_error(oss.str());
    }

    if (auto fallback = table["fallback_block"].value<std::string>())
    {
        definition.fallbackBlock = resolveBlock(blocks, *fallback, path);
    }

    const toml::array* layers = table["layer"].as_array();
    if (!layers || layers->empty())
    {
        std::ostringstream oss;
        oss << "Biome '" << definition.id << "' in " << path << " declares no [[layer]] entries";
        throw std::runtime_error(oss.str());
    }
    for (const toml::node& node : *layers)
    {
        const toml::table* layerTable = node.as_table();
        if (!layerTable)
        {
            std::ostringstream oss;
            oss << "Layers in " << path << " must be tables";
            throw std::runtime_error(oss.str());
        }
        definition.layers.push_back(parseLayer(*layerTable, blocks, path));
    }

    for (const std::string& blockName : detail::readStringArray(table, "structure_blocks", path))
    {
        definition.structureFoundations.push_back(resolveBlock(blocks, blockName, path));
    }
    if (definition.structureFoundations.empty())
    {
        for (const BlockDefinition& block : blocks.definitions())
        {
            if (block.capabilities.structureFoundation)
            {
                definition.structureFoundations.push_back(block.id);
            }
        }
    }

    return definition;
}

} // namespace worldgen
