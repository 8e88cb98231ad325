#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <opencv2/core/matx.hpp>
#include <xtensor/containers/xtensor.hpp>

namespace pc {

// Binarized CT stack, ZYX ordering. Nonzero voxels are foreground.
using Volume = xt::xtensor<uint8_t, 3>;

// Particle labels, ZYX ordering. 0 is background, every positive id is one particle.
using LabelVolume = xt::xtensor<uint32_t, 3>;

using Shape3 = std::array<std::size_t, 3>;

enum class Connectivity : int {
    Face = 6,
    Edge = 18,
    Corner = 26
};

/**
 * @brief Convert the 6/18/26 selector used in configuration files and CLI flags
 * @throws InputError for any other value
 */
Connectivity connectivityFromInt(int n);

inline int toInt(Connectivity c) noexcept { return static_cast<int>(c); }

/**
 * @brief Neighbour offsets (dz, dy, dx) for a connectivity, excluding (0,0,0)
 *
 * Face: |dz|+|dy|+|dx| == 1, Edge: <= 2, Corner: all 26.
 */
const std::vector<cv::Vec3i>& neighborOffsets(Connectivity c);

/**
 * @brief Lexicographically positive half of neighborOffsets()
 *
 * Scanning only these offsets visits every unordered voxel pair once.
 */
const std::vector<cv::Vec3i>& forwardNeighborOffsets(Connectivity c);

inline Shape3 shapeOf(const Volume& v) noexcept
{
    return {v.shape()[0], v.shape()[1], v.shape()[2]};
}

inline Shape3 shapeOf(const LabelVolume& v) noexcept
{
    return {v.shape()[0], v.shape()[1], v.shape()[2]};
}

inline bool inBounds(const Shape3& s, int z, int y, int x) noexcept
{
    return z >= 0 && y >= 0 && x >= 0 &&
           z < static_cast<int>(s[0]) && y < static_cast<int>(s[1]) && x < static_cast<int>(s[2]);
}

}  // namespace pc
