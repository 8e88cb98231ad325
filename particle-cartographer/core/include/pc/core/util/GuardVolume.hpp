#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "pc/core/types/Volume.hpp"
#include "pc/core/util/ParticleMetrics.hpp"

namespace pc {

/**
 * @brief Margin policy for excluding field-of-view truncated particles
 *
 * margin = max(ceil(maxEquivalentRadius * marginScale), minMarginVoxels),
 * capped at maxMarginFraction of the smallest axis.
 */
struct GuardParams {
    double marginScale = 0.3;
    int minMarginVoxels = 10;
    double maxMarginFraction = 0.06;
};

struct GuardPartition {
    int margin = 0;
    std::vector<uint32_t> interior;  ///< Ascending ids
    std::vector<uint32_t> boundary;  ///< Ascending ids
};

/**
 * @brief Guard margin in voxels for a volume shape and largest particle radius
 *
 * The result is always >= 0 and strictly below half of every dimension.
 * @throws InputError for negative policy values
 */
int computeGuardMargin(const Shape3& shape, double maxEqRadius, const GuardParams& params = {});

int computeGuardMargin(const LabelVolume& labels, const GuardParams& params = {});

// 1 inside [margin, dim - margin) on all three axes, 0 in the band
Volume guardMask(const Shape3& shape, int margin);

/**
 * @brief Split particles into interior and boundary-touching sets
 *
 * A particle is interior iff its bounding box lies within [margin, dim - margin)
 * on every axis.
 */
GuardPartition filterInterior(const std::map<uint32_t, ParticleStats>& stats,
                              const Shape3& shape, int margin);

GuardPartition filterInterior(const LabelVolume& labels, int margin);

}  // namespace pc
