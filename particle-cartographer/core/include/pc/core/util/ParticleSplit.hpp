#pragma once

#include <cstdint>

#include "pc/core/types/Volume.hpp"

namespace pc {

/**
 * @brief Connectivities used while splitting, independent of contact counting
 *
 * seedConnectivity labels the eroded seed blobs. floodConnectivity is the
 * neighbourhood the watershed grows through.
 */
struct SplitParams {
    Connectivity seedConnectivity = Connectivity::Corner;
    Connectivity floodConnectivity = Connectivity::Face;
};

/**
 * @brief Split touching particles by erosion-seeded watershed
 *
 * 1. Erode the foreground with a ball of the given radius so thin necks
 *    between touching particles disappear.
 * 2. Label the surviving blobs as seeds. Particles that erode away entirely
 *    do not come back.
 * 3. Flood the seeds over the negated distance transform of the original
 *    foreground, restricted to that foreground.
 *
 * Pure function of its arguments; the input is only read.
 *
 * @param volume Binary foreground (ZYX)
 * @param radius Erosion radius in voxels, 0 keeps the foreground as one seed mask
 * @param params Seed and flood connectivities
 * @param particleCount Optional output, number of ids in the result
 * @return Label volume with contiguous ids 1..N, 0 outside the foreground.
 *         All zero when erosion leaves nothing.
 * @throws InputError for an empty volume or a negative radius
 */
LabelVolume splitParticles(const Volume& volume, int radius,
                           const SplitParams& params = {},
                           uint32_t* particleCount = nullptr);

/**
 * @brief Label connected foreground components without splitting
 * @throws InputError for an empty volume
 */
LabelVolume labelVolume(const Volume& volume, Connectivity connectivity,
                        uint32_t* particleCount = nullptr);

}  // namespace pc
