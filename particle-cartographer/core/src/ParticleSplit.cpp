#include "pc/core/util/ParticleSplit.hpp"

#include <string>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/Logging.hpp"
#include "pc/core/util/Morphology.hpp"

namespace pc {

static void requireNonEmpty(const Volume& volume)
{
    if (volume.size() == 0) {
        throw InputError("input volume is empty");
    }
}

LabelVolume splitParticles(const Volume& volume, int radius,
                           const SplitParams& params,
                           uint32_t* particleCount)
{
    requireNonEmpty(volume);
    if (radius < 0) {
        throw InputError("split radius must be >= 0, got " + std::to_string(radius));
    }

    Logger()->debug("Eroding volume (radius={})", radius);
    const Volume seeds = erodeBall(volume, radius);

    uint32_t numSeeds = 0;
    const LabelVolume seedLabels = labelComponents(seeds, params.seedConnectivity, &numSeeds);
    Logger()->debug("Seed regions after erosion: {} (connectivity={})",
                    numSeeds, toInt(params.seedConnectivity));

    if (numSeeds == 0) {
        Logger()->warn("No seeds left after erosion at radius {}", radius);
        LabelVolume empty = LabelVolume::from_shape(shapeOf(volume));
        empty.fill(0);
        if (particleCount) *particleCount = 0;
        return empty;
    }

    DistanceVolume landscape = distanceTransform(volume);
    for (auto& v : landscape) {
        v = -v;
    }

    LabelVolume labels = seededWatershed(landscape, seedLabels, volume, params.floodConnectivity);
    const uint32_t n = relabelSequential(labels);

    Logger()->info("split radius={} -> particles: {}", radius, n);
    if (particleCount) *particleCount = n;
    return labels;
}

LabelVolume labelVolume(const Volume& volume, Connectivity connectivity,
                        uint32_t* particleCount)
{
    requireNonEmpty(volume);
    uint32_t n = 0;
    LabelVolume labels = labelComponents(volume, connectivity, &n);
    Logger()->info("Volume labeling complete: {} components", n);
    if (particleCount) *particleCount = n;
    return labels;
}

}  // namespace pc
