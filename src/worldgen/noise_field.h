#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <glm/vec2.hpp>

namespace worldgen
{

// Pure 2D field returning values in [-1, 1].
using NoiseFn = std::function<float(float x, float y)>;

class SimplexNoise
{
public:
    explicit SimplexNoise(std::uint32_t seed);

    [[nodiscard]] float noise(float x, float y) const noexcept;

private:
    std::array<int, 512> permutation_{};
    std::array<int, 512> permutationMod8_{};

    static const std::array<glm::vec2, 8> kGradients;
};

// FNV-1a over the world seed followed by the channel name.
[[nodiscard]] std::uint32_t hashSeed(std::string_view seed, std::string_view channel) noexcept;

// Deterministic stand-in used when no factory was injected.
[[nodiscard]] float fallbackNoise(float x, float y) noexcept;

class NoiseFactory
{
public:
    explicit NoiseFactory(std::string seed);

    // Same (seed, channel, frequency) always yields the same field.
    [[nodiscard]] NoiseFn create(std::string_view channel, float frequency) const;
    [[nodiscard]] const std::string& seed() const noexcept { return seed_; }

private:
    std::string seed_;
};

// Resolves a channel through the factory, or through fallbackNoise when the
// factory is null. The first fallback per owner is reported on std::cerr.
[[nodiscard]] NoiseFn resolveNoise(const NoiseFactory* factory,
                                   std::string_view channel,
                                   float frequency,
                                   std::string_view owner,
                                   bool& warned);

} // namespace worldgen
