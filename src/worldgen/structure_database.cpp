#include "worldgen/structure_database.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <toml++/toml.h>

#include "worldgen/toml_fields.h"

namespace worldgen
{
namespace
{
using detail::optionalInt;
using detail::requireFloat;
using detail::requireInt;
using detail::requireString;
using detail::resolveBlock;

constexpr char kEmptyCell = '.';

std::vector<std::vector<BlockId>> parsePattern(const toml::table& table,
                                               const std::string& structureId,
                                               const BlockRegistry& blocks,
                                               const std::filesystem::path& filePath)
{
    std::unordered_map<char, BlockId> legend;
    if (const toml::table* legendTable = table["legend"].as_table())
    {
        for (const auto& [key, node] : *legendTable)
        {
            auto blockName = node.value<std::string>();
            if (key.str().size() != 1 || !blockName)
            {
                std::ostringstream oss;
                oss << "Legend of structure '" << structureId << "' in " << filePath
                    << " must map single characters to block names";
                throw std::runtime_error(oss.str());
            }
            legend.emplace(key.str().front(), resolveBlock(blocks, *blockName, filePath));
        }
    }

    const std::vector<std::string> rows = detail::readStringArray(table, "pattern", filePath);
    if (rows.empty())
    {
        std::ostringstream oss;
        oss << "Structure '" << structureId << "' in " << filePath << " has an empty pattern";
        throw std::runtime_error(oss.str());
    }

    // Rows are authored top-down; stored bottom-up.
    std::vector<std::vector<BlockId>> pattern;
    pattern.reserve(rows.size());
    for (auto rowIt = rows.rbegin(); rowIt != rows.rend(); ++rowIt)
    {
        std::vector<BlockId> row;
        row.reserve(rowIt->size());
        for (const char cell : *rowIt)
        {
            if (cell == kEmptyCell || cell == ' ')
            {
                row.push_back(kAirBlock);
                continue;
            }

            auto legendIt = legend.find(cell);
            if (legendIt == legend.end())
            {
                std::ostringstream oss;
                oss << "Structure '" << structureId << "' in " << filePath << " uses '" << cell
                    << "' which has no legend entry";
                throw std::runtime_error(oss.str());
            }
            row.push_back(legendIt->second);
        }
        pattern.push_back(std::move(row));
    }
    return pattern;
}

StructureDefinition parseStructure(const toml::table& table,
                                   const BlockRegistry& blocks,
                                   const std::filesystem::path& filePath)
{
    StructureDefinition definition{};
    definition.id = requireString(table, "id", filePath);
    definition.name = requireString(table, "name", filePath);
    definition.rarity = requireFloat(table, "rarity", filePath);
    definition.minDistance = requireFloat(table, "min_distance", filePath);
    definition.validBiomes = detail::readStringArray(table, "valid_biomes", filePath);
    definition.yOffset = optionalInt(table, "y_offset").value_or(definition.yOffset);
    definition.pattern = parsePattern(table, definition.id, blocks, filePath);

    if (!std::isfinite(definition.rarity) || definition.rarity < 0.0f || definition.rarity > 1.0f)
    {
        std::ostringstream oss;
        oss << "Structure '" << definition.id << "' in " << filePath << " needs a rarity in [0, 1]";
        throw std::runtime_error(oss.str());
    }
    if (!std::isfinite(definition.minDistance) || definition.minDistance < 0.0f)
    {
        std::ostringstream oss;
        oss << "Structure '" << definition.id << "' in " << filePath << " needs a non-negative min_distance";
        throw std::runtime_error(oss.str());
    }
    return definition;
}

OreDefinition parseOre(const toml::table& table, const BlockRegistry& blocks, const std::filesystem::path& filePath)
{
    OreDefinition ore{};
    ore.id = requireString(table, "id", filePath);
    ore.block = resolveBlock(blocks, requireString(table, "block", filePath), filePath);
    ore.rarity = requireFloat(table, "rarity", filePath);
    ore.minY = requireInt(table, "min_y", filePath);
    ore.maxY = requireInt(table, "max_y", filePath);

    if (!std::isfinite(ore.rarity) || ore.rarity < 0.0f || ore.rarity > 1.0f || ore.minY > ore.maxY)
    {
        std::ostringstream oss;
        oss << "Ore '" << ore.id << "' in " << filePath << " needs a rarity in [0, 1] and min_y <= max_y";
        throw std::runtime_error(oss.str());
    }
    return ore;
}

template <typename Parse>
void parseArrayOfTables(const toml::table& root,
                        std::string_view key,
                        const std::filesystem::path& filePath,
                        Parse&& parse)
{
    const toml::array* array = root[key].as_array();
    if (!array)
    {
        return;
    }
    for (const toml::node& node : *array)
    {
        const toml::table* entry = node.as_table();
        if (!entry)
        {
            std::ostringstream oss;
            oss << "Entries of '" << key << "' in " << filePath << " must be tables";
            throw std::runtime_error(oss.str());
        }
        parse(*entry);
    }
}

} // namespace

int StructureDefinition::width() const noexcept
{
    std::size_t widest = 0;
    for (const auto& row : pattern)
    {
        widest = std::max(widest, row.size());
    }
    return static_cast<int>(widest);
}

bool StructureDefinition::allowsBiome(std::string_view biomeId) const noexcept
{
    return std::find(validBiomes.begin(), validBiomes.end(), biomeId) != validBiomes.end();
}

StructureDatabase::StructureDatabase(const std::filesystem::path& directory, const BlockRegistry& blocks)
{
    for (const std::filesystem::path& path : detail::listTomlFiles(directory, "Structure"))
    {
        parseFile(path, blocks);
    }
}

void StructureDatabase::parseFile(const std::filesystem::path& path, const BlockRegistry& blocks)
{
    toml::table table = toml::parse_file(path.string());

    std::unordered_set<std::string> seenIds;
    for (const StructureDefinition& existing : structures_)
    {
        seenIds.insert(existing.id);
    }
    for (const OreDefinition& existing : ores_)
    {
        seenIds.insert(existing.id);
    }

    auto claimId = [&](const std::string& id) {
        if (!seenIds.insert(id).second)
        {
            std::ostringstream oss;
            oss << "Duplicate structure or ore id '" << id << "' in " << path;
            throw std::runtime_error(oss.str());
        }
    };

    parseArrayOfTables(table, "structure", path, [&](const toml::table& entry) {
        StructureDefinition definition = parseStructure(entry, blocks, path);
        claimId(definition.id);
        structures_.push_back(std::move(definition));
    });
    parseArrayOfTables(table, "ore", path, [&](const toml::table& entry) {
        OreDefinition ore = parseOre(entry, blocks, path);
        claimId(ore.id);
        ores_.push_back(std::move(ore));
    });
}

} // namespace worldgen
