#include <gtest/gtest.h>

#include <stdexcept>

#include "test_definitions.h"
#include "worldgen/block_registry.h"

using namespace worldgen;

TEST(BlockRegistryTest, BuiltinPaletteIsComplete)
{
    const BlockRegistry registry = testing_support::builtinBlocks();

    EXPECT_EQ(registry.blockCount(), 33u);
    EXPECT_EQ(registry.idOf("air"), kAirBlock);
    EXPECT_EQ(registry.idOf("stone"), blocks::kStone);
    EXPECT_EQ(registry.idOf("mushroom_cap"), blocks::kMushroomCap);
    EXPECT_EQ(registry.block(blocks::kBedrock).name, "bedrock");
}

TEST(BlockRegistryTest, CapabilitiesDriveGeneration)
{
    const BlockRegistry registry = testing_support::builtinBlocks();

    EXPECT_FALSE(registry.capabilities(kAirBlock).solid);
    EXPECT_TRUE(registry.capabilities(kAirBlock).replaceable);
    EXPECT_TRUE(registry.capabilities(blocks::kStone).oreHost);
    EXPECT_TRUE(registry.capabilities(blocks::kDeepslate).oreHost);
    EXPECT_FALSE(registry.capabilities(blocks::kDirt).oreHost);
    EXPECT_TRUE(registry.capabilities(blocks::kGrass).structureFoundation);
    EXPECT_TRUE(registry.capabilities(blocks::kOakLeaves).replaceable);
    EXPECT_FALSE(registry.capabilities(blocks::kOakLog).replaceable);
}

TEST(BlockRegistryTest, RejectsDuplicates)
{
    BlockRegistry registry;
    registry.add({kAirBlock, "air", ' ', 0u, {}});

    EXPECT_THROW(registry.add({kAirBlock, "void", ' ', 0u, {}}), std::runtime_error);
    EXPECT_THROW(registry.add({7, "air", ' ', 0u, {}}), std::runtime_error);
    EXPECT_THROW(registry.add({8, "", ' ', 0u, {}}), std::invalid_argument);
    EXPECT_EQ(registry.blockCount(), 1u);
}

TEST(BlockRegistryTest, UnknownLookups)
{
    const BlockRegistry registry = testing_support::builtinBlocks();

    EXPECT_EQ(registry.tryGetBlock(900), nullptr);
    EXPECT_FALSE(registry.contains(900));
    EXPECT_THROW((void)registry.block(900), std::out_of_range);
    EXPECT_THROW((void)registry.idOf("unobtainium"), std::runtime_error);
}
