#include "worldgen/noise_field.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <utility>

#include <glm/geometric.hpp>

namespace worldgen
{

const std::array<glm::vec2, 8> SimplexNoise::kGradients = {
    glm::vec2(1.0f, 0.0f),
    glm::vec2(-1.0f, 0.0f),
    glm::vec2(0.0f, 1.0f),
    glm::vec2(0.0f, -1.0f),
    glm::vec2(0.70710678f, 0.70710678f),
    glm::vec2(-0.70710678f, 0.70710678f),
    glm::vec2(0.70710678f, -0.70710678f),
    glm::vec2(-0.70710678f, -0.70710678f)};

SimplexNoise::SimplexNoise(std::uint32_t seed)
{
    std::array<int, 256> temp;
    std::iota(temp.begin(), temp.end(), 0);

    std::mt19937 rng(seed);
    std::shuffle(temp.begin(), temp.end(), rng);

    for (int i = 0; i < 256; ++i)
    {
        const int value = temp[static_cast<std::size_t>(i)];
        permutation_[i] = permutation_[i + 256] = value;
        permutationMod8_[i] = permutationMod8_[i + 256] = value & 7;
    }
}

float SimplexNoise::noise(float x, float y) const noexcept
{
    constexpr float F2 = 0.3660254037844386f;
    constexpr float G2 = 0.21132486540518713f;

    const float s = (x + y) * F2;
    const int i = static_cast<int>(std::floor(x + s));
    const int j = static_cast<int>(std::floor(y + s));
    const float t = static_cast<float>(i + j) * G2;
    const float x0 = x - (static_cast<float>(i) - t);
    const float y0 = y - (static_cast<float>(j) - t);

    const int i1 = x0 > y0 ? 1 : 0;
    const int j1 = x0 > y0 ? 0 : 1;

    const float x1 = x0 - static_cast<float>(i1) + G2;
    const float y1 = y0 - static_cast<float>(j1) + G2;
    const float x2 = x0 - 1.0f + 2.0f * G2;
    const float y2 = y0 - 1.0f + 2.0f * G2;

    const int ii = i & 255;
    const int jj = j & 255;

    const int gi0 = permutationMod8_[ii + permutation_[jj]];
    const int gi1 = permutationMod8_[ii + i1 + permutation_[jj + j1]];
    const int gi2 = permutationMod8_[ii + 1 + permutation_[jj + 1]];

    auto corner = [](float tc, int gradient, float cx, float cy) {
        if (tc <= 0.0f)
        {
            return 0.0f;
        }
        const float tcSq = tc * tc;
        return tcSq * tcSq * glm::dot(kGradients[static_cast<std::size_t>(gradient)], glm::vec2(cx, cy));
    };

    const float n0 = corner(0.5f - x0 * x0 - y0 * y0, gi0, x0, y0);
    const float n1 = corner(0.5f - x1 * x1 - y1 * y1, gi1, x1, y1);
    const float n2 = corner(0.5f - x2 * x2 - y2 * y2, gi2, x2, y2);

    return std::clamp(70.0f * (n0 + n1 + n2), -1.0f, 1.0f);
}

std::uint32_t hashSeed(std::string_view seed, std::string_view channel) noexcept
{
    std::uint32_t hash = 2166136261u;
    for (const std::string_view part : {seed, channel})
    {
        for (const char c : part)
        {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= 16777619u;
        }
    }
    return hash;
}

float fallbackNoise(float x, float /*y*/) noexcept
{
    return std::sin(x * 0.1f) * 0.5f + 0.5f;
}

NoiseFactory::NoiseFactory(std::string seed)
    : seed_(std::move(seed))
{
}

NoiseFn NoiseFactory::create(std::string_view channel, float frequency) const
{
    auto field = std::make_shared<const SimplexNoise>(hashSeed(seed_, channel));
    return [field, frequency](float x, float y) {
        return field->noise(x * frequency, y * frequency);
    };
}

NoiseFn resolveNoise(const NoiseFactory* factory,
                     std::string_view channel,
                     float frequency,
                     std::string_view owner,
                     bool& warned)
{
    if (factory)
    {
        return factory->create(channel, frequency);
    }

    if (!warned)
    {
        std::cerr << "[" << owner << "] No noise factory provided, using fallback noise for channel '" << channel
                  << "'" << std::endl;
        warned = true;
    }
    return [](float x, float y) {
        return fallbackNoise(x, y);
    };
}

} // namespace worldgen
