#pragma once

#include "worldgen/noise_field.h"
#include "worldgen/worldgen_profile.h"

namespace worldgen
{

// Terrain height before biome shaping: a low-frequency base octave plus a
// weaker detail octave, normalised and scaled into the world's vertical range.
class HeightProfile
{
public:
    HeightProfile(const NoiseFactory* noiseFactory, const HeightSettings& settings);

    [[nodiscard]] float sample(float worldX) const;
    [[nodiscard]] int heightAt(int worldX) const;

    [[nodiscard]] const HeightSettings& settings() const noexcept { return settings_; }

private:
    HeightSettings settings_;
    bool warnedMissingNoise_{false};
    NoiseFn baseNoise_;
    NoiseFn detailNoise_;
};

} // namespace worldgen
