#pragma once

/**
 * @file
 *
 * Builders for small binary volumes with known particle layouts, shared by
 * the core tests
 */

#include <cstddef>

#include "pc/core/types/Volume.hpp"

namespace pc::testing
{

inline Volume EmptyVolume(std::size_t nz, std::size_t ny, std::size_t nx)
{
    Volume v = Volume::from_shape({nz, ny, nx});
    v.fill(0);
    return v;
}

// Voxels with squared distance to the centre <= r*r
inline void AddSphere(Volume& v, int cz, int cy, int cx, int r)
{
    const Shape3 s = shapeOf(v);
    for (int z = cz - r; z <= cz + r; ++z) {
        for (int y = cy - r; y <= cy + r; ++y) {
            for (int x = cx - r; x <= cx + r; ++x) {
                if (!inBounds(s, z, y, x)) continue;
                const int dz = z - cz, dy = y - cy, dx = x - cx;
                if (dz * dz + dy * dy + dx * dx <= r * r) {
                    v(z, y, x) = 1;
                }
            }
        }
    }
}

// Half-open box [z0, z1) x [y0, y1) x [x0, x1)
inline void AddBox(Volume& v, int z0, int y0, int x0, int z1, int y1, int x1)
{
    const Shape3 s = shapeOf(v);
    for (int z = z0; z < z1; ++z) {
        for (int y = y0; y < y1; ++y) {
            for (int x = x0; x < x1; ++x) {
                if (inBounds(s, z, y, x)) v(z, y, x) = 1;
            }
        }
    }
}

inline std::size_t CountForeground(const Volume& v)
{
    std::size_t n = 0;
    for (const auto b : v) n += b ? 1 : 0;
    return n;
}

/**
 * Two spheres of radius r on the x axis, surfaces two voxels apart, joined by
 * a one-voxel-wide bridge along x.
 */
inline Volume NeckedSpheres(int r, std::size_t nz, std::size_t ny, std::size_t nx)
{
    Volume v = EmptyVolume(nz, ny, nx);
    const int cz = static_cast<int>(nz) / 2;
    const int cy = static_cast<int>(ny) / 2;
    const int cxA = static_cast<int>(nx) / 2 - r - 1;
    const int cxB = static_cast<int>(nx) / 2 + r + 1;
    AddSphere(v, cz, cy, cxA, r);
    AddSphere(v, cz, cy, cxB, r);
    AddBox(v, cz, cy, cxA, cz + 1, cy + 1, cxB + 1);
    return v;
}

}  // namespace pc::testing
