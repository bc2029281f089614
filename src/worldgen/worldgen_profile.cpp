#include "worldgen/worldgen_profile.h"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <toml++/toml.h>

namespace worldgen
{
namespace
{
float readFloat(const toml::table& table, std::string_view key, float fallback)
{
    if (auto value = table[key].value<double>())
    {
        return static_cast<float>(*value);
    }
    if (auto valueF = table[key].value<float>())
    {
        return *valueF;
    }
    return fallback;
}

int readInt(const toml::table& table, std::string_view key, int fallback)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        return static_cast<int>(*value);
    }
    return fallback;
}

[[noreturn]] void throwInvalid(std::string_view section,
                               std::string_view key,
                               const std::filesystem::path& filePath,
                               std::string_view requirement)
{
    std::ostringstream oss;
    oss << "Value '" << section << '.' << key << "' in " << filePath << " must be " << requirement;
    throw std::runtime_error(oss.str());
}

void requirePositive(float value, std::string_view section, std::string_view key, const std::filesystem::path& filePath)
{
    if (!std::isfinite(value) || value <= 0.0f)
    {
        throwInvalid(section, key, filePath, "positive and finite");
    }
}

void requireNonNegative(float value,
                        std::string_view section,
                        std::string_view key,
                        const std::filesystem::path& filePath)
{
    if (!std::isfinite(value) || value < 0.0f)
    {
        throwInvalid(section, key, filePath, "non-negative and finite");
    }
}

void requireFinite(float value, std::string_view section, std::string_view key, const std::filesystem::path& filePath)
{
    if (!std::isfinite(value))
    {
        throwInvalid(section, key, filePath, "finite");
    }
}

void applyHeightSettings(const toml::table& table, HeightSettings& settings, const std::filesystem::path& filePath)
{
    settings.baseFrequency = readFloat(table, "base_frequency", settings.baseFrequency);
    settings.baseWeight = readFloat(table, "base_weight", settings.baseWeight);
    settings.detailFrequency = readFloat(table, "detail_frequency", settings.detailFrequency);
    settings.detailWeight = readFloat(table, "detail_weight", settings.detailWeight);
    settings.amplitude = readFloat(table, "amplitude", settings.amplitude);
    settings.baseLevel = readFloat(table, "base_level", settings.baseLevel);
    settings.worldTop = readInt(table, "world_top", settings.worldTop);
    settings.worldBottom = readInt(table, "world_bottom", settings.worldBottom);

    requirePositive(settings.baseFrequency, "height", "base_frequency", filePath);
    requirePositive(settings.detailFrequency, "height", "detail_frequency", filePath);
    requireNonNegative(settings.baseWeight, "height", "base_weight", filePath);
    requireNonNegative(settings.detailWeight, "height", "detail_weight", filePath);
    requireNonNegative(settings.amplitude, "height", "amplitude", filePath);
    requireFinite(settings.baseLevel, "height", "base_level", filePath);

    if (settings.baseWeight + settings.detailWeight <= 0.0f)
    {
        throwInvalid("height", "base_weight", filePath, "non-zero when combined with detail_weight");
    }
    if (settings.worldTop - settings.worldBottom < 2)
    {
        throwInvalid("height", "world_top", filePath, "at least two rows above world_bottom");
    }
}

void applyClimateSettings(const toml::table& table, ClimateSettings& settings, const std::filesystem::path& filePath)
{
    settings.temperatureFrequency = readFloat(table, "temperature_frequency", settings.temperatureFrequency);
    settings.humidityFrequency = readFloat(table, "humidity_frequency", settings.humidityFrequency);
    settings.boundaryFrequency = readFloat(table, "boundary_frequency", settings.boundaryFrequency);
    settings.boundaryAmplitude = readFloat(table, "boundary_amplitude", settings.boundaryAmplitude);
    settings.detailFrequency = readFloat(table, "detail_frequency", settings.detailFrequency);
    settings.transitionWidth = readInt(table, "transition_width", settings.transitionWidth);

    requirePositive(settings.temperatureFrequency, "climate", "temperature_frequency", filePath);
    requirePositive(settings.humidityFrequency, "climate", "humidity_frequency", filePath);
    requirePositive(settings.boundaryFrequency, "climate", "boundary_frequency", filePath);
    requirePositive(settings.detailFrequency, "climate", "detail_frequency", filePath);
    requireNonNegative(settings.boundaryAmplitude, "climate", "boundary_amplitude", filePath);
    if (settings.transitionWidth < 0)
    {
        throwInvalid("climate", "transition_width", filePath, "non-negative");
    }
}

void applyStructureSettings(const toml::table& table,
                            StructureSettings& settings,
                            const std::filesystem::path& filePath)
{
    settings.placementBucketSize = readInt(table, "placement_bucket_size", settings.placementBucketSize);
    settings.placementFrequency = readFloat(table, "placement_frequency", settings.placementFrequency);
    settings.checkInterval = readInt(table, "check_interval", settings.checkInterval);

    if (settings.placementBucketSize <= 0)
    {
        throwInvalid("structures", "placement_bucket_size", filePath, "positive");
    }
    requirePositive(settings.placementFrequency, "structures", "placement_frequency", filePath);
    if (settings.checkInterval <= 0)
    {
        throwInvalid("structures", "check_interval", filePath, "positive");
    }
}

void applyStreamingSettings(const toml::table& table,
                            StreamingSettings& settings,
                            const std::filesystem::path& filePath)
{
    settings.tileSize = readInt(table, "tile_size", settings.tileSize);
    settings.viewMargin = readInt(table, "view_margin", settings.viewMargin);
    settings.hysteresis = readInt(table, "hysteresis", settings.hysteresis);
    settings.lookAheadDistance = readInt(table, "look_ahead_distance", settings.lookAheadDistance);
    settings.forceLoadRadius = readInt(table, "force_load_radius", settings.forceLoadRadius);
    settings.chunksPerFrame = readInt(table, "chunks_per_frame", settings.chunksPerFrame);

    if (const toml::array* viewport = table["viewport"].as_array())
    {
        if (viewport->size() != 2 || !(*viewport)[0].is_integer() || !(*viewport)[1].is_integer())
        {
            throwInvalid("streaming", "viewport", filePath, "an array of two integers");
        }
        settings.viewportSize.x = static_cast<int>((*viewport)[0].value_or(std::int64_t{0}));
        settings.viewportSize.y = static_cast<int>((*viewport)[1].value_or(std::int64_t{0}));
    }

    const int maxHidden = readInt(table, "max_hidden_chunks", static_cast<int>(settings.maxHiddenChunks));
    if (maxHidden < 0)
    {
        throwInvalid("streaming", "max_hidden_chunks", filePath, "non-negative");
    }
    settings.maxHiddenChunks = static_cast<std::size_t>(maxHidden);

    if (settings.tileSize <= 0)
    {
        throwInvalid("streaming", "tile_size", filePath, "positive");
    }
    if (settings.viewportSize.x <= 0 || settings.viewportSize.y <= 0)
    {
        throwInvalid("streaming", "viewport", filePath, "positive in both dimensions");
    }
    if (settings.viewMargin < 0 || settings.hysteresis < 0 || settings.lookAheadDistance < 0 ||
        settings.forceLoadRadius < 0)
    {
        throwInvalid("streaming", "view_margin/hysteresis/look_ahead_distance/force_load_radius", filePath,
                     "non-negative");
    }
    if (settings.chunksPerFrame <= 0)
    {
        throwInvalid("streaming", "chunks_per_frame", filePath, "positive");
    }
}

} // namespace

WorldgenProfile WorldgenProfile::load(const std::filesystem::path& path)
{
    WorldgenProfile profile{};
    if (!std::filesystem::exists(path))
    {
        return profile;
    }

    toml::table table = toml::parse_file(path.string());

    if (auto seedText = table["seed"].value<std::string>())
    {
        profile.seed = *seedText;
    }
    else if (auto seedNumber = table["seed"].value<std::int64_t>())
    {
        profile.seed = std::to_string(*seedNumber);
    }
    if (profile.seed.empty())
    {
        std::ostringstream oss;
        oss << "Seed in " << path << " must not be empty";
        throw std::runtime_error(oss.str());
    }

    profile.chunkSize = readInt(table, "chunk_size", profile.chunkSize);
    if (profile.chunkSize <= 0)
    {
        throwInvalid("world", "chunk_size", path, "positive");
    }

    if (const toml::table* heightTable = table["height"].as_table())
    {
        applyHeightSettings(*heightTable, profile.height, path);
    }
    if (const toml::table* climateTable = table["climate"].as_table())
    {
        applyClimateSettings(*climateTable, profile.climate, path);
    }
    if (const toml::table* structureTable = table["structures"].as_table())
    {
        applyStructureSettings(*structureTable, profile.structures, path);
    }
    if (const toml::table* streamingTable = table["streaming"].as_table())
    {
        applyStreamingSettings(*streamingTable, profile.streaming, path);
    }

    // Wider bands would overlap inside a chunk column.
    if (profile.climate.transitionWidth > profile.chunkSize)
    {
        throwInvalid("climate", "transition_width", path, "no larger than chunk_size");
    }

    return profile;
}

} // namespace worldgen
