#include "pc/core/util/ParticleMetrics.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numbers>
#include <numeric>
#include <string>
#include <unordered_map>

#include <opencv2/core.hpp>

#include "pc/core/util/Errors.hpp"

namespace pc {

std::map<uint32_t, ParticleStats> computeParticleStats(const LabelVolume& labels)
{
    std::map<uint32_t, ParticleStats> stats;
    const Shape3 s = shapeOf(labels);
    const uint32_t* lab = labels.data();

    std::size_t idx = 0;
    for (int z = 0; z < static_cast<int>(s[0]); ++z) {
        for (int y = 0; y < static_cast<int>(s[1]); ++y) {
            for (int x = 0; x < static_cast<int>(s[2]); ++x, ++idx) {
                const uint32_t id = lab[idx];
                if (id == 0) continue;

                auto [it, inserted] = stats.try_emplace(id);
                ParticleStats& p = it->second;
                if (inserted) {
                    p.bboxMin = cv::Vec3i(z, y, x);
                    p.bboxMax = cv::Vec3i(z, y, x);
                } else {
                    p.bboxMin[0] = std::min(p.bboxMin[0], z);
                    p.bboxMin[1] = std::min(p.bboxMin[1], y);
                    p.bboxMin[2] = std::min(p.bboxMin[2], x);
                    p.bboxMax[0] = std::max(p.bboxMax[0], z);
                    p.bboxMax[1] = std::max(p.bboxMax[1], y);
                    p.bboxMax[2] = std::max(p.bboxMax[2], x);
                }
                ++p.volume;
            }
        }
    }
    return stats;
}

std::map<uint32_t, uint64_t> particleVolumes(const LabelVolume& labels)
{
    std::map<uint32_t, uint64_t> volumes;
    for (const auto id : labels) {
        if (id != 0) ++volumes[id];
    }
    return volumes;
}

LargestParticle largestParticleRatio(const std::map<uint32_t, ParticleStats>& stats)
{
    LargestParticle out;
    for (const auto& [id, p] : stats) {
        out.totalVolume += p.volume;
        out.largestVolume = std::max(out.largestVolume, p.volume);
    }
    if (out.totalVolume > 0) {
        out.ratio = static_cast<double>(out.largestVolume) / static_cast<double>(out.totalVolume);
    }
    return out;
}

LargestParticle largestParticleRatio(const LabelVolume& labels)
{
    return largestParticleRatio(computeParticleStats(labels));
}

// ============================================================================
// Dominance
// ============================================================================

std::vector<uint64_t> volumeList(const std::map<uint32_t, ParticleStats>& stats)
{
    std::vector<uint64_t> volumes;
    volumes.reserve(stats.size());
    for (const auto& [id, p] : stats) {
        volumes.push_back(p.volume);
    }
    return volumes;
}

static double totalOf(const std::vector<uint64_t>& volumes)
{
    return static_cast<double>(std::accumulate(volumes.begin(), volumes.end(), uint64_t{0}));
}

double topKShare(const std::vector<uint64_t>& volumes, int k)
{
    if (k < 1) {
        throw InputError("top-k share needs k >= 1, got " + std::to_string(k));
    }
    const double total = totalOf(volumes);
    if (volumes.empty() || total <= 0.0) return 0.0;

    std::vector<uint64_t> sorted = volumes;
    std::sort(sorted.begin(), sorted.end(), std::greater<>());
    const std::size_t n = std::min(sorted.size(), static_cast<std::size_t>(k));
    const double top = static_cast<double>(
        std::accumulate(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(n), uint64_t{0}));
    return top / total;
}

double herfindahlIndex(const std::vector<uint64_t>& volumes)
{
    const double total = totalOf(volumes);
    if (volumes.empty() || total <= 0.0) return 0.0;

    double hhi = 0.0;
    for (const auto v : volumes) {
        const double share = static_cast<double>(v) / total;
        hhi += share * share;
    }
    return hhi;
}

double giniCoefficient(const std::vector<uint64_t>& volumes)
{
    const std::size_t n = volumes.size();
    const double total = totalOf(volumes);
    if (n < 2 || total <= 0.0) return 0.0;

    std::vector<uint64_t> sorted = volumes;
    std::sort(sorted.begin(), sorted.end());

    // Lorenz-curve form: (n + 1 - 2 * sum((n + 1 - i) x_i) / sum(x)) / n, i from 1
    double weighted = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        weighted += static_cast<double>(n - i) * static_cast<double>(sorted[i]);
    }
    const double dn = static_cast<double>(n);
    const double gini = (dn + 1.0 - 2.0 * weighted / total) / dn;
    return std::clamp(gini, 0.0, 1.0);
}

// ============================================================================
// Size
// ============================================================================

double equivalentRadius(uint64_t volume)
{
    return std::cbrt(3.0 * static_cast<double>(volume) / (4.0 * std::numbers::pi));
}

double maxEquivalentRadius(const std::map<uint32_t, ParticleStats>& stats)
{
    uint64_t largest = 0;
    for (const auto& [id, p] : stats) {
        largest = std::max(largest, p.volume);
    }
    return largest == 0 ? 0.0 : equivalentRadius(largest);
}

// ============================================================================
// Curves and partitions
// ============================================================================

static std::vector<double> normalise(const std::vector<double>& v)
{
    const auto [lo, hi] = std::minmax_element(v.begin(), v.end());
    const double range = *hi - *lo;
    std::vector<double> out(v.size(), 0.0);
    if (range <= 0.0) return out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        out[i] = (v[i] - *lo) / range;
    }
    return out;
}

std::size_t detectKneePoint(const std::vector<double>& x, const std::vector<double>& y)
{
    if (x.size() != y.size()) {
        throw InputError("knee detection needs x and y of equal length");
    }
    if (x.size() < 3) return 0;

    const auto xn = normalise(x);
    const auto yn = normalise(y);

    std::size_t knee = 0;
    double best = yn[0] - xn[0];
    for (std::size_t i = 1; i < xn.size(); ++i) {
        const double diff = yn[i] - xn[i];
        if (diff > best) {
            best = diff;
            knee = i;
        }
    }
    return knee;
}

std::vector<double> movingAverage(const std::vector<double>& values, int window)
{
    if (window < 1) {
        throw InputError("moving average window must be >= 1, got " + std::to_string(window));
    }
    if (window == 1) return values;

    std::vector<double> out(values.size(), 0.0);
    double sum = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        sum += values[i];
        if (i >= static_cast<std::size_t>(window)) {
            sum -= values[i - static_cast<std::size_t>(window)];
        }
        const std::size_t len = std::min(i + 1, static_cast<std::size_t>(window));
        out[i] = sum / static_cast<double>(len);
    }
    return out;
}

template<typename Map>
static double entropyBits(const Map& counts, double n)
{
    double h = 0.0;
    for (const auto& [key, c] : counts) {
        const double p = static_cast<double>(c) / n;
        h -= p * std::log2(p);
    }
    return h;
}

double variationOfInformation(const LabelVolume& a, const LabelVolume& b, bool ignoreBackground)
{
    if (shapeOf(a) != shapeOf(b)) {
        throw InputError("variation of information needs label volumes of equal shape");
    }

    std::unordered_map<uint32_t, uint64_t> countA;
    std::unordered_map<uint32_t, uint64_t> countB;
    std::unordered_map<uint64_t, uint64_t> joint;
    uint64_t n = 0;

    const uint32_t* pa = a.data();
    const uint32_t* pb = b.data();
    const std::size_t total = a.size();
    for (std::size_t i = 0; i < total; ++i) {
        if (ignoreBackground && pa[i] == 0 && pb[i] == 0) continue;
        ++countA[pa[i]];
        ++countB[pb[i]];
        ++joint[(static_cast<uint64_t>(pa[i]) << 32) | pb[i]];
        ++n;
    }
    if (n == 0) return 0.0;

    // VI = H(A) + H(B) - 2 I(A;B) = 2 H(A,B) - H(A) - H(B)
    const double dn = static_cast<double>(n);
    const double vi = 2.0 * entropyBits(joint, dn) - entropyBits(countA, dn) - entropyBits(countB, dn);
    return std::max(0.0, vi);
}

// ============================================================================
// Mask agreement
// ============================================================================

static void requireComparable(const cv::Mat& a, const cv::Mat& b)
{
    if (a.size() != b.size()) {
        throw InputError("masks must have the same size");
    }
    if (a.channels() != 1 || b.channels() != 1) {
        throw InputError("masks must be single-channel");
    }
}

double diceCoefficient(const cv::Mat& a, const cv::Mat& b)
{
    requireComparable(a, b);
    const cv::Mat ma = a != 0;
    const cv::Mat mb = b != 0;
    const double sum = static_cast<double>(cv::countNonZero(ma)) + cv::countNonZero(mb);
    if (sum == 0.0) return 1.0;
    return 2.0 * cv::countNonZero(ma & mb) / sum;
}

double intersectionOverUnion(const cv::Mat& a, const cv::Mat& b)
{
    requireComparable(a, b);
    const cv::Mat ma = a != 0;
    const cv::Mat mb = b != 0;
    const int unionCount = cv::countNonZero(ma | mb);
    if (unionCount == 0) return 1.0;
    return static_cast<double>(cv::countNonZero(ma & mb)) / unionCount;
}

// labels > 0 on one slice, as an 8-bit mask
static cv::Mat foregroundSlice(const LabelVolume& labels, int axis, int index)
{
    const Shape3 s = shapeOf(labels);
    const int nz = static_cast<int>(s[0]);
    const int ny = static_cast<int>(s[1]);
    const int nx = static_cast<int>(s[2]);

    if (axis == 0) {
        cv::Mat m(ny, nx, CV_8UC1);
        for (int y = 0; y < ny; ++y)
            for (int x = 0; x < nx; ++x)
                m.at<uint8_t>(y, x) = labels(index, y, x) ? 255 : 0;
        return m;
    }
    if (axis == 1) {
        cv::Mat m(nz, nx, CV_8UC1);
        for (int z = 0; z < nz; ++z)
            for (int x = 0; x < nx; ++x)
                m.at<uint8_t>(z, x) = labels(z, index, x) ? 255 : 0;
        return m;
    }
    cv::Mat m(nz, ny, CV_8UC1);
    for (int z = 0; z < nz; ++z)
        for (int y = 0; y < ny; ++y)
            m.at<uint8_t>(z, y) = labels(z, y, index) ? 255 : 0;
    return m;
}

double meanSliceDice(const LabelVolume& labels, const std::map<int, cv::Mat>& groundTruth, int axis)
{
    if (axis < 0 || axis > 2) {
        throw InputError("slice axis must be 0, 1 or 2, got " + std::to_string(axis));
    }

    const int extent = static_cast<int>(shapeOf(labels)[static_cast<std::size_t>(axis)]);
    double sum = 0.0;
    int used = 0;
    for (const auto& [index, gt] : groundTruth) {
        if (index < 0 || index >= extent) continue;
        const cv::Mat pred = foregroundSlice(labels, axis, index);
        if (pred.size() != gt.size() || gt.channels() != 1) continue;
        sum += diceCoefficient(pred, gt);
        ++used;
    }
    return used == 0 ? 0.0 : sum / used;
}

}  // namespace pc
