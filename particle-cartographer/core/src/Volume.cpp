#include "pc/core/types/Volume.hpp"

#include <cstdlib>
#include <string>

#include "pc/core/util/Errors.hpp"

namespace pc {

namespace {

std::vector<cv::Vec3i> buildOffsets(int maxManhattan, bool forwardOnly)
{
    std::vector<cv::Vec3i> out;
    for (int dz = -1; dz <= 1; ++dz) {
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                if (dz == 0 && dy == 0 && dx == 0)
                    continue;
                if (std::abs(dz) + std::abs(dy) + std::abs(dx) > maxManhattan)
                    continue;
                if (forwardOnly) {
                    // keep (dz,dy,dx) > (0,0,0) in lexicographic order
                    bool positive = dz > 0 || (dz == 0 && (dy > 0 || (dy == 0 && dx > 0)));
                    if (!positive)
                        continue;
                }
                out.emplace_back(dz, dy, dx);
            }
        }
    }
    return out;
}

int manhattanLimit(Connectivity c)
{
    switch (c) {
        case Connectivity::Face: return 1;
        case Connectivity::Edge: return 2;
        case Connectivity::Corner: return 3;
    }
    return 3;
}

}  // namespace

Connectivity connectivityFromInt(int n)
{
    switch (n) {
        case 6: return Connectivity::Face;
        case 18: return Connectivity::Edge;
        case 26: return Connectivity::Corner;
        default:
            throw InputError("connectivity must be 6, 18 or 26, got " + std::to_string(n));
    }
}

const std::vector<cv::Vec3i>& neighborOffsets(Connectivity c)
{
    static const std::vector<cv::Vec3i> face = buildOffsets(1, false);
    static const std::vector<cv::Vec3i> edge = buildOffsets(2, false);
    static const std::vector<cv::Vec3i> corner = buildOffsets(3, false);
    switch (manhattanLimit(c)) {
        case 1: return face;
        case 2: return edge;
        default: return corner;
    }
}

const std::vector<cv::Vec3i>& forwardNeighborOffsets(Connectivity c)
{
    static const std::vector<cv::Vec3i> face = buildOffsets(1, true);
    static const std::vector<cv::Vec3i> edge = buildOffsets(2, true);
    static const std::vector<cv::Vec3i> corner = buildOffsets(3, true);
    switch (manhattanLimit(c)) {
        case 1: return face;
        case 2: return edge;
        default: return corner;
    }
}

}  // namespace pc
