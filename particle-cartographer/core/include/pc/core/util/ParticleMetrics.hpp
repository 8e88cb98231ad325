#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include <opencv2/core/mat.hpp>
#include <opencv2/core/matx.hpp>

#include "pc/core/types/Volume.hpp"

namespace pc {

/**
 * @brief Per-particle geometry gathered in one pass over a label volume
 */
struct ParticleStats {
    uint64_t volume = 0;   ///< Voxel count
    cv::Vec3i bboxMin;     ///< Inclusive (z, y, x)
    cv::Vec3i bboxMax;     ///< Inclusive (z, y, x)
};

// Keyed by particle id, background excluded
std::map<uint32_t, ParticleStats> computeParticleStats(const LabelVolume& labels);

// Voxel counts keyed by particle id
std::map<uint32_t, uint64_t> particleVolumes(const LabelVolume& labels);

struct LargestParticle {
    double ratio = 0.0;           ///< largest / total, 0 when nothing is labeled
    uint64_t largestVolume = 0;
    uint64_t totalVolume = 0;
};

LargestParticle largestParticleRatio(const std::map<uint32_t, ParticleStats>& stats);
LargestParticle largestParticleRatio(const LabelVolume& labels);

// ============================================================================
// Dominance
// ============================================================================

/**
 * @brief Cumulative volume share of the k largest particles
 * @throws InputError if k < 1
 */
double topKShare(const std::vector<uint64_t>& volumes, int k = 1);

// Herfindahl-Hirschman index, sum of squared volume shares. 0 for no particles.
double herfindahlIndex(const std::vector<uint64_t>& volumes);

// Gini coefficient of the volume distribution in [0, 1]
double giniCoefficient(const std::vector<uint64_t>& volumes);

std::vector<uint64_t> volumeList(const std::map<uint32_t, ParticleStats>& stats);

// ============================================================================
// Size
// ============================================================================

// Radius of the sphere with the same volume, (3V / 4pi)^(1/3)
double equivalentRadius(uint64_t volume);

double maxEquivalentRadius(const std::map<uint32_t, ParticleStats>& stats);

// ============================================================================
// Curves and partitions
// ============================================================================

/**
 * @brief Kneedle-style knee of a curve
 *
 * x and y are min-max normalised, the knee is the argmax of y - x.
 * Fewer than three points yields 0; a flat axis normalises to all zeros.
 * @throws InputError if x and y differ in length
 */
std::size_t detectKneePoint(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Trailing moving average, partial windows at the start
 *
 * A window of 1 returns the input.
 */
std::vector<double> movingAverage(const std::vector<double>& values, int window);

/**
 * @brief Variation of Information between two labelings (bits)
 *
 * VI = H(A) + H(B) - 2 I(A;B). 0 for identical partitions, independent of id values.
 *
 * @param ignoreBackground Restrict to voxels that are foreground in either labeling
 * @throws InputError if the shapes differ
 */
double variationOfInformation(const LabelVolume& a, const LabelVolume& b,
                              bool ignoreBackground = true);

// ============================================================================
// Mask agreement
// ============================================================================

/**
 * @brief Dice coefficient 2|A&B| / (|A| + |B|) of two single-channel 2D masks
 *
 * Any nonzero pixel is foreground. Two empty masks score 1.
 * @throws InputError if the masks differ in size or are not single-channel
 */
double diceCoefficient(const cv::Mat& a, const cv::Mat& b);

// Intersection over union of two masks, same conventions as diceCoefficient()
double intersectionOverUnion(const cv::Mat& a, const cv::Mat& b);

/**
 * @brief Mean Dice between labels > 0 and ground-truth slices
 *
 * @param groundTruth Slice index along axis -> 2D mask. Indices outside the
 *        volume and masks of the wrong size are skipped.
 * @param axis 0 (z), 1 (y) or 2 (x)
 * @return 0 when no slice could be compared
 * @throws InputError for any other axis
 */
double meanSliceDice(const LabelVolume& labels, const std::map<int, cv::Mat>& groundTruth,
                     int axis = 0);

}  // namespace pc
