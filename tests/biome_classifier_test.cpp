#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "test_definitions.h"
#include "worldgen/biome_classifier.h"

using namespace worldgen;

namespace
{

// Two biomes with very different shaping so seams are visible.
BiomeClassifier makeContrastingClassifier(const NoiseFactory& factory, const ClimateSettings& settings)
{
    BiomeClassifier classifier(&factory, settings, 16);

    BiomeDefinition lowlands = testing_support::makeBiome("lowlands", -2.0f, 0.0f);
    lowlands.heightAddition = -30.0f;
    lowlands.minHumidity = -2.0f;
    lowlands.maxHumidity = 2.0f;

    BiomeDefinition highlands = testing_support::makeBiome("highlands", 0.0f, 2.0f);
    highlands.heightMultiplier = 1.5f;
    highlands.heightAddition = 40.0f;
    highlands.minHumidity = -2.0f;
    highlands.maxHumidity = 2.0f;

    classifier.registerBiome(lowlands);
    classifier.registerBiome(highlands);
    return classifier;
}

} // namespace

TEST(BiomeClassifierTest, SameSeedSameColumns)
{
    NoiseFactory factory("1234567890");
    const ClimateSettings settings{};
    const BiomeClassifier first = makeContrastingClassifier(factory, settings);
    const BiomeClassifier second = makeContrastingClassifier(factory, settings);

    for (int chunkX = -40; chunkX <= 40; ++chunkX)
    {
        EXPECT_EQ(first.biomeForColumn(chunkX).id, second.biomeForColumn(chunkX).id);
    }
    for (int x = -300; x <= 300; x += 5)
    {
        EXPECT_FLOAT_EQ(first.modifyHeight(static_cast<float>(x), 10.0f),
                        second.modifyHeight(static_cast<float>(x), 10.0f));
    }
}

TEST(BiomeClassifierTest, BiomeIsConstantAcrossChunkColumn)
{
    NoiseFactory factory("column");
    const BiomeClassifier classifier = makeContrastingClassifier(factory, ClimateSettings{});

    for (int chunkX = -5; chunkX <= 5; ++chunkX)
    {
        const std::string& expected = classifier.biomeForColumn(chunkX).id;
        for (int localX = 0; localX < 16; ++localX)
        {
            EXPECT_EQ(classifier.biomeAt(chunkX * 16 + localX, -50).id, expected);
            EXPECT_EQ(classifier.biomeAt(chunkX * 16 + localX, 200).id, expected);
        }
    }
}

TEST(BiomeClassifierTest, HeightIsContinuousAcrossSeams)
{
    NoiseFactory factory("seams");
    const BiomeClassifier classifier = makeContrastingClassifier(factory, ClimateSettings{});

    int differingSeams = 0;
    for (int chunkX = -30; chunkX <= 30; ++chunkX)
    {
        const float seam = static_cast<float>(chunkX * 16);
        const float left = classifier.modifyHeight(seam - 0.001f, 5.0f);
        const float right = classifier.modifyHeight(seam, 5.0f);
        EXPECT_NEAR(left, right, 0.5f) << "seam at x=" << seam;

        if (classifier.biomeForColumn(chunkX - 1).id != classifier.biomeForColumn(chunkX).id)
        {
            ++differingSeams;
        }
    }
    EXPECT_GT(differingSeams, 0);
}

TEST(BiomeClassifierTest, InteriorColumnsUsePrimaryBiomeOnly)
{
    NoiseFactory factory("interior");
    ClimateSettings settings{};
    settings.transitionWidth = 8;
    const BiomeClassifier classifier = makeContrastingClassifier(factory, settings);

    ClimateSettings noBlend = settings;
    noBlend.transitionWidth = 0;
    const BiomeClassifier unblended = makeContrastingClassifier(factory, noBlend);

    for (int chunkX = -10; chunkX <= 10; ++chunkX)
    {
        for (int localX = 4; localX <= 12; ++localX)
        {
            const float x = static_cast<float>(chunkX * 16 + localX);
            EXPECT_FLOAT_EQ(classifier.modifyHeight(x, 12.0f), unblended.modifyHeight(x, 12.0f));
        }
    }
}

TEST(BiomeClassifierTest, LayersFollowDepth)
{
    NoiseFactory factory("layers");
    BiomeClassifier classifier(&factory, ClimateSettings{}, 16);
    classifier.registerBiome(testing_support::makeBiome("plains"));

    EXPECT_EQ(classifier.blockAt(3, 21, 20.0f), kAirBlock);
    EXPECT_EQ(classifier.blockAt(3, 20, 20.0f), blocks::kGrass);
    EXPECT_EQ(classifier.blockAt(3, 17, 20.0f), blocks::kDirt);
    EXPECT_EQ(classifier.blockAt(3, 15, 20.0f), blocks::kStone);
    EXPECT_EQ(classifier.blockAt(3, -90, 20.0f), blocks::kStone);
}

TEST(BiomeClassifierTest, FallbackBlockBelowLastLayer)
{
    NoiseFactory factory("fallback");
    BiomeClassifier classifier(&factory, ClimateSettings{}, 16);

    BiomeDefinition shallow = testing_support::makeBiome("shallow");
    shallow.layers.pop_back();
    shallow.fallbackBlock = blocks::kGravel;
    classifier.registerBiome(shallow);

    EXPECT_EQ(classifier.blockAt(0, 0, 10.0f), blocks::kGravel);
}

TEST(BiomeClassifierTest, FirstBiomeWhenNoneApplies)
{
    NoiseFactory factory("none");
    BiomeClassifier classifier(&factory, ClimateSettings{}, 16);

    BiomeDefinition frozen = testing_support::makeBiome("frozen", 5.0f, 6.0f);
    BiomeDefinition scorched = testing_support::makeBiome("scorched", -6.0f, -5.0f);
    classifier.registerBiome(frozen);
    classifier.registerBiome(scorched);

    for (int chunkX = -10; chunkX <= 10; ++chunkX)
    {
        EXPECT_EQ(classifier.biomeForColumn(chunkX).id, "frozen");
    }
}

TEST(BiomeClassifierTest, QueriesWithoutBiomesThrow)
{
    NoiseFactory factory("empty");
    const BiomeClassifier classifier(&factory, ClimateSettings{}, 16);

    EXPECT_THROW((void)classifier.biomeAt(0, 0), std::runtime_error);
    EXPECT_THROW((void)classifier.modifyHeight(0.0f, 1.0f), std::runtime_error);
}

TEST(BiomeClassifierTest, RejectsTransitionWiderThanChunk)
{
    NoiseFactory factory("bands");
    ClimateSettings settings{};

    settings.transitionWidth = 24;
    EXPECT_THROW((void)BiomeClassifier(&factory, settings, 16), std::invalid_argument);
    settings.transitionWidth = -1;
    EXPECT_THROW((void)BiomeClassifier(&factory, settings, 16), std::invalid_argument);

    settings.transitionWidth = 16;
    const BiomeClassifier widest = makeContrastingClassifier(factory, settings);
    float largestStep = 0.0f;
    for (float x = -480.0f; x < 480.0f; x += 0.25f)
    {
        largestStep = std::max(largestStep, std::abs(widest.modifyHeight(x + 0.25f, 5.0f) -
                                                     widest.modifyHeight(x, 5.0f)));
    }
    EXPECT_LT(largestStep, 10.0f);
}

TEST(BiomeClassifierTest, RegistrationClosesAfterFirstQuery)
{
    NoiseFactory factory("sealed");
    BiomeClassifier classifier(&factory, ClimateSettings{}, 16);
    classifier.registerBiome(testing_support::makeBiome("plains"));

    EXPECT_THROW(classifier.registerBiome(testing_support::makeBiome("plains")), std::runtime_error);

    (void)classifier.biomeAt(0, 0);
    EXPECT_THROW(classifier.registerBiome(testing_support::makeBiome("desert")), std::logic_error);
    EXPECT_EQ(classifier.biomeCount(), 1u);
}

TEST(BiomeClassifierTest, ClimateJitterAppliesToBothAxes)
{
    NoiseFactory factory("climate");
    ClimateSettings calm{};
    calm.boundaryAmplitude = 0.0f;
    ClimateSettings jittered{};
    jittered.boundaryAmplitude = 0.2f;

    BiomeClassifier a(&factory, calm, 16);
    BiomeClassifier b(&factory, jittered, 16);

    for (int chunkX = -8; chunkX <= 8; ++chunkX)
    {
        const ClimateSample base = a.climateForColumn(chunkX);
        const ClimateSample shifted = b.climateForColumn(chunkX);
        EXPECT_NEAR(shifted.temperature - base.temperature, shifted.humidity - base.humidity, 1e-5f);
        EXPECT_LE(std::abs(shifted.temperature - base.temperature), 0.2f + 1e-5f);
    }
}
