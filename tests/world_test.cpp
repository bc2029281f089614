#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <utility>

#include "test_definitions.h"
#include "world.h"

using namespace worldgen;

namespace
{

int surfaceAt(const World& world, int worldX)
{
    return static_cast<int>(std::floor(world.surfaceHeight(worldX)));
}

} // namespace

TEST(WorldTest, BlockAtMatchesLayering)
{
    World world(testing_support::makeProfile(), testing_support::makeDefinitions());

    const int surface = surfaceAt(world, 0);
    EXPECT_EQ(world.blockAt(0, surface + 20).id, kAirBlock);
    EXPECT_EQ(world.blockAt(0, surface - 2).id, blocks::kDirt);
    EXPECT_EQ(world.blockAt(0, surface - 30).id, blocks::kStone);
    EXPECT_EQ(world.biomeAt(0, surface).id, "plains");
}

TEST(WorldTest, OutsideVerticalBoundsNeedsNoChunks)
{
    World world(testing_support::makeProfile(), testing_support::makeDefinitions());

    EXPECT_EQ(world.blockAt(0, 1000).id, kAirBlock);
    EXPECT_EQ(world.blockAt(0, -500).id, blocks::kBedrock);
    EXPECT_EQ(world.blockAt(0, -120).id, blocks::kBedrock);
    EXPECT_EQ(world.chunkManager().loadedCount(), 0u);
}

TEST(WorldTest, EditsOverrideGeneratedTerrain)
{
    World world(testing_support::makeProfile(), testing_support::makeDefinitions());
    const int surface = surfaceAt(world, 5);
    (void)world.blockAt(5, surface + 3);

    world.setBlockAt(5, surface - 10, kAirBlock);
    world.setBlockAt(5, surface + 3, "cobblestone");

    EXPECT_EQ(world.blockAt(5, surface - 10).id, kAirBlock);
    EXPECT_EQ(world.blockAt(5, surface + 3).id, blocks::kCobblestone);
    EXPECT_EQ(world.modifiedBlocks().size(), 2u);

    // Loaded grids are patched in place as well.
    const glm::ivec2 chunkCoord(0, static_cast<int>(std::floor((surface + 3) / 16.0)));
    const Chunk* chunk = world.chunkManager().findChunk(chunkCoord);
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->grid.at(5, wrapIndex(surface + 3, 16)), blocks::kCobblestone);

    world.setBlockAt(5, surface + 3, blocks::kSand);
    EXPECT_EQ(world.modifiedBlocks().size(), 2u);
    EXPECT_EQ(world.blockAt(5, surface + 3).id, blocks::kSand);
}

TEST(WorldTest, EditsApplyToChunksGeneratedLater)
{
    World world(testing_support::makeProfile(), testing_support::makeDefinitions());

    world.setBlockAt(100, 40, blocks::kIce);
    EXPECT_EQ(world.chunkManager().findChunk({6, 2}), nullptr);

    const Chunk& chunk = world.chunkManager().ensureGenerated({6, 2});
    EXPECT_EQ(chunk.grid.at(100 - 96, 40 - 32), blocks::kIce);
}

TEST(WorldTest, EditsSurviveEviction)
{
    worldgen::WorldgenProfile profile = testing_support::makeProfile();
    profile.streaming.maxHiddenChunks = 1;
    World world(profile, testing_support::makeDefinitions());

    (void)world.blockAt(-200, 60);
    world.setBlockAt(-200, 60, blocks::kGoldOre);
    (void)world.blockAt(-150, 60);
    (void)world.blockAt(-100, 60);
    (void)world.blockAt(-50, 60);

    const glm::ivec2 editedChunk(floorDiv(-200, 16), floorDiv(60, 16));
    EXPECT_EQ(world.chunkManager().findChunk(editedChunk), nullptr);

    const Chunk& regenerated = world.chunkManager().ensureGenerated(editedChunk);
    EXPECT_EQ(regenerated.grid.at(wrapIndex(-200, 16), wrapIndex(60, 16)), blocks::kGoldOre);
}

TEST(WorldTest, ClearingEditsRestoresTerrain)
{
    World world(testing_support::makeProfile(), testing_support::makeDefinitions());
    const int surface = surfaceAt(world, 7);
    const BlockId generated = world.blockAt(7, surface).id;

    world.setBlockAt(7, surface, blocks::kSnow);
    EXPECT_EQ(world.blockAt(7, surface).id, blocks::kSnow);

    world.clearModifiedBlocks();
    EXPECT_TRUE(world.modifiedBlocks().empty());
    EXPECT_EQ(world.blockAt(7, surface).id, generated);

    const Chunk* chunk = world.chunkManager().findChunk({0, floorDiv(surface, 16)});
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->grid.at(7, wrapIndex(surface, 16)), generated);
}

TEST(WorldTest, RejectsUnknownBlocks)
{
    World world(testing_support::makeProfile(), testing_support::makeDefinitions());

    EXPECT_THROW(world.setBlockAt(0, 0, static_cast<BlockId>(999)), std::out_of_range);
    EXPECT_THROW(world.setBlockAt(0, 0, "cheese"), std::runtime_error);
    EXPECT_TRUE(world.modifiedBlocks().empty());
}

TEST(WorldTest, PlaceStructureStampsOnSurface)
{
    World world(testing_support::makeProfile(), testing_support::makeDefinitions());
    const int x = 40;
    const int surface = surfaceAt(world, x);

    world.placeStructure("tree", x);
    EXPECT_EQ(world.blockAt(x, surface + 1).id, blocks::kOakLog);
    EXPECT_EQ(world.blockAt(x, surface + 2).id, blocks::kOakLog);
    EXPECT_EQ(world.blockAt(x - 1, surface + 3).id, blocks::kOakLeaves);
    EXPECT_EQ(world.modifiedBlocks().size(), 5u);

    EXPECT_THROW(world.placeStructure("castle", x), std::out_of_range);
}

TEST(WorldTest, SpawnAndUpdateStreamChunks)
{
    const worldgen::WorldgenProfile profile = testing_support::makeProfile();
    World world(profile, testing_support::makeDefinitions());

    EXPECT_EQ(world.spawn({0.0f, 0.0f}), 9);
    EXPECT_EQ(world.chunkManager().visibleCount(), 9u);

    FrameInput frame{};
    frame.camera = {2048.0f, 0.0f};
    frame.playerPosition = {2048.0f, 0.0f};
    frame.playerVelocity = {3.0f, 0.0f};
    world.update(frame);

    EXPECT_EQ(world.chunkManager().direction(), Direction::Right);
    const ChunkProfilingSnapshot snapshot = world.chunkManager().sampleProfilingSnapshot();
    EXPECT_EQ(snapshot.generatedChunks, 9 + profile.streaming.chunksPerFrame);
    EXPECT_GT(snapshot.queuedChunks, 0u);
}

TEST(WorldTest, RequiresBiomes)
{
    WorldDefinitions definitions = testing_support::makeDefinitions();
    definitions.biomes.clear();
    EXPECT_THROW(World(testing_support::makeProfile(), std::move(definitions)), std::runtime_error);
}

TEST(WorldTest, ShippedAssetsBuildAWorld)
{
    const WorldgenProfile profile = WorldgenProfile::load(testing_support::assetDir() / "worldgen.toml");
    World world(profile, WorldDefinitions::load(testing_support::assetDir()));

    EXPECT_EQ(world.biomes().biomeCount(), 10u);
    EXPECT_EQ(world.structures().structureCount(), 10u);
    EXPECT_EQ(world.structures().oreCount(), 5u);

    const int surface = surfaceAt(world, 0);
    EXPECT_TRUE(world.blocks().capabilities(world.blockAt(0, surface - 1).id).solid);
    EXPECT_EQ(world.blockAt(0, profile.height.worldBottom).id, blocks::kBedrock);
}
