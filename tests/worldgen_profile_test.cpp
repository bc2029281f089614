#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "test_definitions.h"
#include "worldgen/worldgen_profile.h"

using namespace worldgen;

namespace
{

class ProfileFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        path_ = std::filesystem::temp_directory_path() /
                ("worldgen_profile_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                 ".toml");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& contents)
    {
        std::ofstream out(path_);
        out << contents;
    }

    std::filesystem::path path_;
};

} // namespace

TEST(WorldgenProfileTest, MissingFileUsesDefaults)
{
    const WorldgenProfile profile = WorldgenProfile::load("definitely/not/here.toml");
    EXPECT_EQ(profile.seed, "worldgen");
    EXPECT_EQ(profile.chunkSize, 16);
    EXPECT_EQ(profile.structures.checkInterval, 3);
    EXPECT_EQ(profile.streaming.maxHiddenChunks, 0u);
}

TEST(WorldgenProfileTest, ShippedProfileLoads)
{
    const WorldgenProfile profile = WorldgenProfile::load(testing_support::assetDir() / "worldgen.toml");
    EXPECT_EQ(profile.seed, "1234567890");
    EXPECT_EQ(profile.chunkSize, 16);
    EXPECT_EQ(profile.height.worldTop, 256);
    EXPECT_EQ(profile.height.worldBottom, -120);
    EXPECT_EQ(profile.streaming.tileSize, 16);
}

TEST_F(ProfileFileTest, OverridesSections)
{
    write(R"(
seed = 42
chunk_size = 32

[height]
amplitude = 35.0
world_top = 128

[climate]
transition_width = 6

[streaming]
viewport = [640, 480]
max_hidden_chunks = 64
)");

    const WorldgenProfile profile = WorldgenProfile::load(path_);
    EXPECT_EQ(profile.seed, "42");
    EXPECT_EQ(profile.chunkSize, 32);
    EXPECT_FLOAT_EQ(profile.height.amplitude, 35.0f);
    EXPECT_EQ(profile.height.worldTop, 128);
    EXPECT_EQ(profile.climate.transitionWidth, 6);
    EXPECT_EQ(profile.streaming.viewportSize.x, 640);
    EXPECT_EQ(profile.streaming.viewportSize.y, 480);
    EXPECT_EQ(profile.streaming.maxHiddenChunks, 64u);
}

TEST_F(ProfileFileTest, RejectsInvalidValues)
{
    write("chunk_size = 0\n");
    EXPECT_THROW(WorldgenProfile::load(path_), std::runtime_error);

    write("[height]\nworld_top = -200\n");
    EXPECT_THROW(WorldgenProfile::load(path_), std::runtime_error);

    write("[height]\nworld_bottom = 10\nworld_top = 11\n");
    EXPECT_THROW(WorldgenProfile::load(path_), std::runtime_error);
}

TEST_F(ProfileFileTest, TransitionWidthIsBoundedByChunkSize)
{
    write("chunk_size = 16\n[climate]\ntransition_width = 16\n");
    EXPECT_EQ(WorldgenProfile::load(path_).climate.transitionWidth, 16);

    write("chunk_size = 16\n[climate]\ntransition_width = 24\n");
    EXPECT_THROW(WorldgenProfile::load(path_), std::runtime_error);

    write("chunk_size = 4\n");
    EXPECT_THROW(WorldgenProfile::load(path_), std::runtime_error);
}

TEST_F(ProfileFileTest, RejectsMalformedToml)
{
    write("seed = \"unterminated\n");
    EXPECT_THROW(WorldgenProfile::load(path_), std::runtime_error);
}
