#include "pc/core/util/Morphology.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "edt.hpp"
#include "cc3d.hpp"

#include "pc/core/util/Errors.hpp"

namespace pc {

static inline std::size_t flatIndex(const Shape3& s, int z, int y, int x) noexcept
{
    return (static_cast<std::size_t>(z) * s[1] + static_cast<std::size_t>(y)) * s[2] +
           static_cast<std::size_t>(x);
}

// Without any background voxel the distance is unbounded
static inline float finiteOrInf(float v) noexcept
{
    return std::isfinite(v) ? v : std::numeric_limits<float>::infinity();
}

static int edtThreads()
{
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

// ============================================================================
// Distance transform
// ============================================================================

DistanceVolume squaredDistanceTransform(const Volume& foreground, bool outsideIsBackground)
{
    const Shape3 s = shapeOf(foreground);
    DistanceVolume out = DistanceVolume::from_shape(s);
    if (foreground.size() == 0) {
        return out;
    }

    // edt expects x fastest, which is the row-major ZYX layout. With
    // outsideIsBackground the volume is framed by one background voxel per face.
    const std::size_t pad = outsideIsBackground ? 1 : 0;
    const std::size_t pz = s[0] + 2 * pad;
    const std::size_t py = s[1] + 2 * pad;
    const std::size_t px = s[2] + 2 * pad;

    std::vector<uint8_t> binary(pz * py * px, 0);
    for (std::size_t z = 0; z < s[0]; ++z) {
        for (std::size_t y = 0; y < s[1]; ++y) {
            for (std::size_t x = 0; x < s[2]; ++x) {
                binary[((z + pad) * py + (y + pad)) * px + (x + pad)] = foreground(z, y, x) ? 1 : 0;
            }
        }
    }

    std::unique_ptr<float[]> sq(edt::edtsq<uint8_t>(
        binary.data(), px, py, pz,
        1.0f, 1.0f, 1.0f, false, edtThreads()));

    for (std::size_t z = 0; z < s[0]; ++z) {
        for (std::size_t y = 0; y < s[1]; ++y) {
            for (std::size_t x = 0; x < s[2]; ++x) {
                out(z, y, x) = finiteOrInf(sq[((z + pad) * py + (y + pad)) * px + (x + pad)]);
            }
        }
    }
    return out;
}

DistanceVolume distanceTransform(const Volume& foreground)
{
    const Shape3 s = shapeOf(foreground);
    DistanceVolume out = DistanceVolume::from_shape(s);
    const std::size_t total = foreground.size();
    if (total == 0) {
        return out;
    }

    std::vector<uint8_t> binary(total);
    const uint8_t* src = foreground.data();
    for (std::size_t i = 0; i < total; ++i) {
        binary[i] = src[i] ? 1 : 0;
    }

    std::unique_ptr<float[]> d(edt::binary_edt<uint8_t>(
        binary.data(), s[2], s[1], s[0],
        1.0f, 1.0f, 1.0f, false, edtThreads()));
    std::transform(d.get(), d.get() + total, out.data(), finiteOrInf);
    return out;
}

// ============================================================================
// Erosion
// ============================================================================

std::vector<cv::Vec3i> ballOffsets(int radius)
{
    if (radius < 0) {
        throw InputError("ball radius must be >= 0, got " + std::to_string(radius));
    }
    std::vector<cv::Vec3i> out;
    const int r2 = radius * radius;
    for (int dz = -radius; dz <= radius; ++dz) {
        for (int dy = -radius; dy <= radius; ++dy) {
            for (int dx = -radius; dx <= radius; ++dx) {
                if (dz * dz + dy * dy + dx * dx <= r2) {
                    out.emplace_back(dz, dy, dx);
                }
            }
        }
    }
    return out;
}

Volume erodeBall(const Volume& foreground, int radius)
{
    if (radius < 0) {
        throw InputError("erosion radius must be >= 0, got " + std::to_string(radius));
    }
    if (radius == 0) {
        return foreground;
    }

    // A voxel survives iff no background voxel lies within the ball, i.e. the
    // squared distance to the nearest background exceeds radius^2.
    const DistanceVolume sq = squaredDistanceTransform(foreground, true);
    const float r2 = static_cast<float>(radius) * static_cast<float>(radius);

    Volume out = Volume::from_shape(shapeOf(foreground));
    const uint8_t* src = foreground.data();
    const float* d = sq.data();
    uint8_t* dst = out.data();
    const std::size_t total = foreground.size();
    for (std::size_t i = 0; i < total; ++i) {
        dst[i] = (src[i] && d[i] > r2) ? 1 : 0;
    }
    return out;
}

// ============================================================================
// Connected components
// ============================================================================

LabelVolume labelComponents(const Volume& foreground, Connectivity connectivity, uint32_t* count)
{
    const Shape3 s = shapeOf(foreground);
    LabelVolume labels = LabelVolume::from_shape(s);
    labels.fill(0);
    const std::size_t total = foreground.size();
    if (total == 0) {
        if (count) *count = 0;
        return labels;
    }

    // cc3d keeps distinct input values apart, so collapse the mask to 0/1
    std::vector<uint8_t> binary(total);
    const uint8_t* src = foreground.data();
    for (std::size_t i = 0; i < total; ++i) {
        binary[i] = src[i] ? 1 : 0;
    }

    std::size_t n = 0;
    cc3d::connected_components3d<uint8_t, uint32_t>(
        binary.data(),
        static_cast<int64_t>(s[2]), static_cast<int64_t>(s[1]), static_cast<int64_t>(s[0]),
        total, toInt(connectivity), labels.data(), n);

    if (count) *count = static_cast<uint32_t>(n);
    return labels;
}

// ============================================================================
// Watershed
// ============================================================================

namespace {

struct FloodEntry {
    float value;
    uint64_t age;
    std::size_t index;
};

struct FloodOrder {
    bool operator()(const FloodEntry& a, const FloodEntry& b) const noexcept
    {
        if (a.value != b.value) return a.value > b.value;
        return a.age > b.age;
    }
};

}  // namespace

LabelVolume seededWatershed(const DistanceVolume& landscape,
                            const LabelVolume& markers,
                            const Volume& mask,
                            Connectivity connectivity)
{
    const Shape3 s = shapeOf(markers);
    if (shapeOf(mask) != s || landscape.shape()[0] != s[0] ||
        landscape.shape()[1] != s[1] || landscape.shape()[2] != s[2]) {
        throw InputError("watershed inputs must share one shape");
    }

    LabelVolume out = LabelVolume::from_shape(s);
    out.fill(0);

    const auto& offsets = neighborOffsets(connectivity);
    const uint8_t* m = mask.data();
    const uint32_t* mk = markers.data();
    const float* elev = landscape.data();
    uint32_t* lab = out.data();

    std::priority_queue<FloodEntry, std::vector<FloodEntry>, FloodOrder> heap;
    uint64_t age = 0;

    const std::size_t total = markers.size();
    for (std::size_t i = 0; i < total; ++i) {
        if (mk[i] != 0 && m[i]) {
            lab[i] = mk[i];
            heap.push({elev[i], age++, i});
        }
    }

    const std::size_t plane = s[1] * s[2];
    while (!heap.empty()) {
        const FloodEntry cur = heap.top();
        heap.pop();

        const int z = static_cast<int>(cur.index / plane);
        const int y = static_cast<int>((cur.index % plane) / s[2]);
        const int x = static_cast<int>(cur.index % s[2]);

        for (const auto& o : offsets) {
            const int nz = z + o[0];
            const int ny = y + o[1];
            const int nx = x + o[2];
            if (!inBounds(s, nz, ny, nx)) continue;
            const std::size_t n = flatIndex(s, nz, ny, nx);
            if (!m[n] || lab[n] != 0) continue;
            lab[n] = lab[cur.index];
            heap.push({elev[n], age++, n});
        }
    }

    return out;
}

uint32_t relabelSequential(LabelVolume& labels)
{
    uint32_t maxId = 0;
    for (const auto v : labels) maxId = std::max(maxId, v);
    if (maxId == 0) return 0;

    std::vector<uint32_t> remap(static_cast<std::size_t>(maxId) + 1, 0);
    for (const auto v : labels) {
        if (v != 0) remap[v] = 1;
    }
    uint32_t next = 0;
    for (std::size_t id = 1; id < remap.size(); ++id) {
        if (remap[id]) remap[id] = ++next;
    }
    for (auto& v : labels) {
        v = remap[v];
    }
    return next;
}

}  // namespace pc
