#include "worldgen/height_profile.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace worldgen
{

HeightProfile::HeightProfile(const NoiseFactory* noiseFactory, const HeightSettings& settings)
    : settings_(settings)
{
    if (settings_.baseWeight + settings_.detailWeight <= 0.0f)
    {
        throw std::invalid_argument("HeightProfile requires a positive combined octave weight");
    }
    if (settings_.worldTop - settings_.worldBottom < 2)
    {
        std::ostringstream oss;
        oss << "HeightProfile world top " << settings_.worldTop << " must be at least two rows above bottom " << settings_.worldBottom;
        throw std::invalid_argument(oss.str());
    }

    baseNoise_ = resolveNoise(noiseFactory, "height_base", settings_.baseFrequency, "HeightProfile",
                              warnedMissingNoise_);
    detailNoise_ = resolveNoise(noiseFactory, "height_detail", settings_.detailFrequency, "HeightProfile",
                                warnedMissingNoise_);
}

float HeightProfile::sample(float worldX) const
{
    const float combined = baseNoise_(worldX, 0.0f) * settings_.baseWeight +
                           detailNoise_(worldX, 0.0f) * settings_.detailWeight;
    const float normalized = combined / (settings_.baseWeight + settings_.detailWeight);
    const float height = settings_.baseLevel + normalized * settings_.amplitude;

    // Leave one row of headroom below the ceiling and above the bedrock floor.
    const float low = static_cast<float>(settings_.worldBottom + 1);
    const float high = static_cast<float>(settings_.worldTop - 1);
    return std::clamp(height, low, high);
}

int HeightProfile::heightAt(int worldX) const
{
    return static_cast<int>(std::floor(sample(static_cast<float>(worldX))));
}

} // namespace worldgen
