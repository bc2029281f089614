#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <glm/vec2.hpp>

namespace worldgen
{

struct HeightSettings
{
    float baseFrequency{0.02f};
    float baseWeight{0.7f};
    float detailFrequency{0.05f};
    float detailWeight{0.3f};
    float amplitude{20.0f};
    float baseLevel{0.0f};
    int worldTop{256};
    int worldBottom{-120};
};

struct ClimateSettings
{
    float temperatureFrequency{0.01f};
    float humidityFrequency{0.01f};
    float boundaryFrequency{0.02f};
    float boundaryAmplitude{0.2f};
    float detailFrequency{0.05f};
    int transitionWidth{8};
};

struct StructureSettings
{
    int placementBucketSize{4};
    float placementFrequency{0.2f};
    int checkInterval{3};
};

struct StreamingSettings
{
    int tileSize{16};
    glm::ivec2 viewportSize{1280, 720};
    int viewMargin{2};
    int hysteresis{1};
    int lookAheadDistance{2};
    int forceLoadRadius{3};
    int chunksPerFrame{2};
    // Zero keeps every generated chunk resident.
    std::size_t maxHiddenChunks{0};
};

struct WorldgenProfile
{
    std::string seed{"worldgen"};
    int chunkSize{16};
    HeightSettings height{};
    ClimateSettings climate{};
    StructureSettings structures{};
    StreamingSettings streaming{};

    static WorldgenProfile load(const std::filesystem::path& path);
};

} // namespace worldgen
