#include "pc/core/util/GuardVolume.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/Logging.hpp"

namespace pc {

int computeGuardMargin(const Shape3& shape, double maxEqRadius, const GuardParams& params)
{
    if (params.marginScale < 0.0 || params.minMarginVoxels < 0 || params.maxMarginFraction < 0.0) {
        throw InputError("guard policy values must be non-negative");
    }
    if (!std::isfinite(maxEqRadius) || maxEqRadius < 0.0) {
        throw InputError("largest particle radius must be finite and >= 0");
    }

    const std::size_t minDim = std::min({shape[0], shape[1], shape[2]});
    if (minDim == 0) return 0;

    const int calculated = static_cast<int>(std::ceil(maxEqRadius * params.marginScale));
    int margin = std::max(calculated, params.minMarginVoxels);

    int maxAllowed = static_cast<int>(std::floor(static_cast<double>(minDim) * params.maxMarginFraction));
    maxAllowed = std::min(maxAllowed, static_cast<int>((minDim - 1) / 2));

    if (margin > maxAllowed) {
        Logger()->debug("Guard margin {} exceeds maximum allowed {} for shape {}x{}x{}, using {}",
                        margin, maxAllowed, shape[0], shape[1], shape[2], maxAllowed);
        margin = maxAllowed;
    }

    Logger()->debug("Guard margin: {} voxels (calculated: {}, min: {}, max allowed: {})",
                    margin, calculated, params.minMarginVoxels, maxAllowed);
    return margin;
}

int computeGuardMargin(const LabelVolume& labels, const GuardParams& params)
{
    return computeGuardMargin(shapeOf(labels), maxEquivalentRadius(computeParticleStats(labels)), params);
}

Volume guardMask(const Shape3& shape, int margin)
{
    if (margin < 0) {
        throw InputError("guard margin must be >= 0, got " + std::to_string(margin));
    }

    Volume mask = Volume::from_shape(shape);
    mask.fill(0);
    const int m = margin;
    for (int z = m; z < static_cast<int>(shape[0]) - m; ++z) {
        for (int y = m; y < static_cast<int>(shape[1]) - m; ++y) {
            for (int x = m; x < static_cast<int>(shape[2]) - m; ++x) {
                mask(z, y, x) = 1;
            }
        }
    }
    return mask;
}

GuardPartition filterInterior(const std::map<uint32_t, ParticleStats>& stats,
                              const Shape3& shape, int margin)
{
    if (margin < 0) {
        throw InputError("guard margin must be >= 0, got " + std::to_string(margin));
    }

    GuardPartition out;
    out.margin = margin;
    for (const auto& [id, p] : stats) {
        bool inside = true;
        for (int a = 0; a < 3; ++a) {
            const int hi = static_cast<int>(shape[a]) - margin;
            if (p.bboxMin[a] < margin || p.bboxMax[a] >= hi) {
                inside = false;
                break;
            }
        }
        (inside ? out.interior : out.boundary).push_back(id);
    }

    Logger()->debug("Interior particle filtering: {} interior out of {} total ({} excluded)",
                    out.interior.size(), stats.size(), out.boundary.size());
    return out;
}

GuardPartition filterInterior(const LabelVolume& labels, int margin)
{
    return filterInterior(computeParticleStats(labels), shapeOf(labels), margin);
}

}  // namespace pc
