#pragma once

#include <cstdint>
#include <vector>

#include <opencv2/core/matx.hpp>
#include <xtensor/containers/xtensor.hpp>

#include "pc/core/types/Volume.hpp"

namespace pc {

using DistanceVolume = xt::xtensor<float, 3>;

/**
 * @brief Exact squared Euclidean distance from every voxel to the nearest background voxel
 *
 * Computed with edt::edtsq. Background voxels get 0.
 *
 * @param foreground Binary volume (ZYX), any nonzero value is foreground
 * @param outsideIsBackground Frame the volume with one background voxel per
 *        face before the transform. Used by erosion. When false, a volume
 *        without background voxels yields +infinity everywhere.
 */
DistanceVolume squaredDistanceTransform(const Volume& foreground, bool outsideIsBackground);

// Euclidean distance transform (edt::binary_edt), faces are not background
DistanceVolume distanceTransform(const Volume& foreground);

// Offsets (dz, dy, dx) with dz^2+dy^2+dx^2 <= radius^2, origin included
std::vector<cv::Vec3i> ballOffsets(int radius);

/**
 * @brief Binary erosion by a ball of integer radius
 *
 * The structuring element holds every offset with dz^2+dy^2+dx^2 <= radius^2.
 * Voxels beyond the array faces count as background, so particles touching
 * the faces shrink from that side too. Radius 0 returns a copy of the input.
 *
 * @throws InputError if radius is negative
 */
Volume erodeBall(const Volume& foreground, int radius);

/**
 * @brief Connected-component labeling with cc3d
 *
 * All nonzero values are one class. Ids are contiguous from 1 and follow the raster order of each component's
 * first voxel.
 *
 * @param count Optional output for the number of components
 */
LabelVolume labelComponents(const Volume& foreground, Connectivity connectivity,
                            uint32_t* count = nullptr);

/**
 * @brief Marker-controlled watershed by priority flooding
 *
 * Markers grow into unlabeled mask voxels in order of increasing landscape
 * value; equal values are resolved by insertion order, so the result is
 * deterministic. Growth of a label stops where it meets another label.
 * Marker voxels outside the mask are dropped.
 *
 * @param landscape Elevation, same shape as markers
 * @param markers Seed labels (0 = unlabeled)
 * @param mask Region that may be flooded
 * @param connectivity Flooding neighbourhood
 */
LabelVolume seededWatershed(const DistanceVolume& landscape,
                            const LabelVolume& markers,
                            const Volume& mask,
                            Connectivity connectivity = Connectivity::Face);

// Map the ids present in labels onto 1..N keeping their relative order. Returns N.
uint32_t relabelSequential(LabelVolume& labels);

}  // namespace pc
