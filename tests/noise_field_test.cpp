#include <gtest/gtest.h>

#include <cmath>

#include "worldgen/noise_field.h"

using namespace worldgen;

TEST(NoiseFieldTest, SameSeedAndChannelAgree)
{
    NoiseFactory first("1234567890");
    NoiseFactory second("1234567890");

    const NoiseFn a = first.create("height_base", 0.02f);
    const NoiseFn b = second.create("height_base", 0.02f);
    for (int x = -200; x <= 200; x += 7)
    {
        EXPECT_FLOAT_EQ(a(static_cast<float>(x), 3.0f), b(static_cast<float>(x), 3.0f));
    }
}

TEST(NoiseFieldTest, ChannelsAreIndependent)
{
    NoiseFactory factory("1234567890");
    const NoiseFn temperature = factory.create("temperature", 0.05f);
    const NoiseFn humidity = factory.create("humidity", 0.05f);

    int differing = 0;
    for (int x = 0; x < 64; ++x)
    {
        const float fx = static_cast<float>(x) + 0.5f;
        if (temperature(fx, 0.0f) != humidity(fx, 0.0f))
        {
            ++differing;
        }
    }
    EXPECT_GT(differing, 32);
}

TEST(NoiseFieldTest, ValuesStayInUnitRange)
{
    NoiseFactory factory("range");
    const NoiseFn field = factory.create("range", 0.37f);
    for (int y = -20; y <= 20; ++y)
    {
        for (int x = -20; x <= 20; ++x)
        {
            const float value = field(static_cast<float>(x) * 1.3f, static_cast<float>(y) * 0.7f);
            ASSERT_TRUE(std::isfinite(value));
            EXPECT_GE(value, -1.0f);
            EXPECT_LE(value, 1.0f);
        }
    }
}

TEST(NoiseFieldTest, HashSeedSeparatesChannels)
{
    EXPECT_EQ(hashSeed("seed", "a"), hashSeed("seed", "a"));
    EXPECT_NE(hashSeed("seed", "a"), hashSeed("seed", "b"));
    EXPECT_NE(hashSeed("seed1", "a"), hashSeed("seed2", "a"));
}

TEST(NoiseFieldTest, MissingFactoryFallsBackOnce)
{
    bool warned = false;
    const NoiseFn first = resolveNoise(nullptr, "temperature", 0.1f, "Test", warned);
    EXPECT_TRUE(warned);

    const NoiseFn second = resolveNoise(nullptr, "humidity", 0.1f, "Test", warned);
    EXPECT_TRUE(warned);

    EXPECT_FLOAT_EQ(first(10.0f, 0.0f), fallbackNoise(10.0f, 0.0f));
    EXPECT_FLOAT_EQ(second(-4.0f, 9.0f), fallbackNoise(-4.0f, 9.0f));
    EXPECT_FLOAT_EQ(fallbackNoise(0.0f, 0.0f), 0.5f);
}
