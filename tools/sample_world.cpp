#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "world.h"

namespace
{

constexpr int kColumnRadiusChunks = 3;
constexpr int kCsvHalfWidth = 256;
constexpr int kRowsBelowSurface = 24;
constexpr int kRowsAboveSurface = 12;

void printTerrainStrip(World& world, int minX, int maxX)
{
    int highest = world.profile().height.worldBottom;
    int lowest = world.profile().height.worldTop;
    for (int x = minX; x <= maxX; ++x)
    {
        const int surface = static_cast<int>(std::floor(world.surfaceHeight(x)));
        highest = std::max(highest, surface);
        lowest = std::min(lowest, surface);
    }

    const int chunkSize = world.profile().chunkSize;
    for (int y = highest + kRowsAboveSurface; y >= lowest - kRowsBelowSurface; --y)
    {
        std::cout << std::setw(5) << y << ' ';
        for (int x = minX; x <= maxX; ++x)
        {
            std::cout << world.blockAt(x, y).glyph;
        }
        std::cout << '\n';
    }

    std::cout << "      ";
    for (int x = minX; x <= maxX; x += chunkSize)
    {
        std::string label = world.biomeAt(x, 0).id;
        label.resize(static_cast<std::size_t>(chunkSize), ' ');
        std::cout << label;
    }
    std::cout << std::endl;
}

int writeColumnCsv(World& world, const std::filesystem::path& path)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out)
    {
        std::cerr << "Failed to open " << path << " for writing" << std::endl;
        return -1;
    }

    out << "world_x,biome,base_height,surface_height\n";
    out << std::fixed << std::setprecision(3);
    int written = 0;
    for (int x = -kCsvHalfWidth; x < kCsvHalfWidth; ++x)
    {
        out << x << ',' << world.biomeAt(x, 0).id << ',' << world.heightAt(x) << ',' << world.surfaceHeight(x)
            << '\n';
        ++written;
    }
    return written;
}

} // namespace

int main(int argc, char** argv)
{
    const std::filesystem::path profilePath = argc > 1 ? argv[1] : "assets/worldgen.toml";
    const std::filesystem::path assetDir = argc > 2 ? argv[2] : "assets";

    try
    {
        const worldgen::WorldgenProfile profile = worldgen::WorldgenProfile::load(profilePath);
        World world(profile, WorldDefinitions::load(assetDir));
        world.structures().logBiomeStructureCompatibility(world.biomes().biomeIds());

        const float tile = static_cast<float>(profile.streaming.tileSize);
        const float spawnX = 0.0f;
        const float spawnY = std::floor(world.surfaceHeight(0)) * tile;
        world.spawn({spawnX, spawnY});

        const int chunkSize = profile.chunkSize;
        printTerrainStrip(world, -kColumnRadiusChunks * chunkSize, (kColumnRadiusChunks + 1) * chunkSize - 1);

        const ChunkProfilingSnapshot snapshot = world.chunkManager().sampleProfilingSnapshot();
        std::cout << "Generated " << snapshot.generatedChunks << " chunks (avg " << std::fixed
                  << std::setprecision(3) << snapshot.averageGenerationMs << " ms), " << snapshot.visibleChunks
                  << " visible" << std::endl;

        const std::filesystem::path csvPath = "world_columns.csv";
        const int written = writeColumnCsv(world, csvPath);
        if (written < 0)
        {
            return EXIT_FAILURE;
        }
        std::cout << "Wrote " << written << " samples to " << csvPath.string() << std::endl;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "sample_world failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return 0;
}
