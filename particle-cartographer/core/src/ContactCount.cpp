#include "pc/core/util/ContactCount.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "pc/core/util/Logging.hpp"

namespace pc {

ContactRecord::ContactRecord(std::set<Pair> pairs, const std::vector<uint32_t>& presentIds)
    : pairs_(std::move(pairs))
{
    for (const auto id : presentIds) {
        counts_.emplace(id, 0);
    }
    for (const auto& [a, b] : pairs_) {
        ++counts_[a];
        ++counts_[b];
    }
}

int ContactRecord::count(uint32_t id) const
{
    const auto it = counts_.find(id);
    return it == counts_.end() ? 0 : it->second;
}

bool ContactRecord::touching(uint32_t a, uint32_t b) const
{
    if (a == b) return false;
    return pairs_.contains({std::min(a, b), std::max(a, b)});
}

std::vector<uint32_t> ContactRecord::neighbors(uint32_t id) const
{
    std::vector<uint32_t> out;
    for (const auto& [a, b] : pairs_) {
        if (a == id) out.push_back(b);
        else if (b == id) out.push_back(a);
    }
    std::sort(out.begin(), out.end());
    return out;
}

ContactRecord countContacts(const LabelVolume& labels, Connectivity connectivity)
{
    const Shape3 s = shapeOf(labels);
    const int nz = static_cast<int>(s[0]);
    const int ny = static_cast<int>(s[1]);
    const int nx = static_cast<int>(s[2]);
    const auto& offsets = forwardNeighborOffsets(connectivity);
    const uint32_t* lab = labels.data();

    std::set<ContactRecord::Pair> pairs;
    std::set<uint32_t> present;

    // Slices are scanned in parallel, each thread collecting its own pairs
    #pragma omp parallel
    {
        std::set<ContactRecord::Pair> localPairs;
        std::set<uint32_t> localIds;

        #pragma omp for schedule(dynamic, 1)
        for (int z = 0; z < nz; ++z) {
            for (int y = 0; y < ny; ++y) {
                for (int x = 0; x < nx; ++x) {
                    const std::size_t idx = (static_cast<std::size_t>(z) * s[1] + y) * s[2] + x;
                    const uint32_t id = lab[idx];
                    if (id == 0) continue;
                    localIds.insert(id);

                    for (const auto& o : offsets) {
                        const int zz = z + o[0];
                        const int yy = y + o[1];
                        const int xx = x + o[2];
                        if (!inBounds(s, zz, yy, xx)) continue;
                        const uint32_t other =
                            lab[(static_cast<std::size_t>(zz) * s[1] + yy) * s[2] + xx];
                        if (other == 0 || other == id) continue;
                        localPairs.emplace(std::min(id, other), std::max(id, other));
                    }
                }
            }
        }

        #pragma omp critical
        {
            pairs.insert(localPairs.begin(), localPairs.end());
            present.insert(localIds.begin(), localIds.end());
        }
    }

    Logger()->debug("Contact scan: {} particles, {} touching pairs (connectivity={})",
                    present.size(), pairs.size(), toInt(connectivity));
    return ContactRecord(std::move(pairs), std::vector<uint32_t>(present.begin(), present.end()));
}

// ============================================================================
// Statistics
// ============================================================================

// Linear interpolation between closest ranks on a sorted sample
static double percentile(const std::vector<int>& sorted, double q)
{
    if (sorted.empty()) return 0.0;
    const double pos = q * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(pos));
    const auto hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

ContactStatistics summarizeContacts(const ContactRecord& record,
                                    const std::vector<uint32_t>& ids,
                                    const std::vector<uint32_t>& excludeIds,
                                    int autoExcludeThreshold)
{
    ContactStatistics stats;
    const std::set<uint32_t> excluded(excludeIds.begin(), excludeIds.end());

    std::vector<int> values;
    values.reserve(ids.size());
    for (const auto id : ids) {
        if (excluded.contains(id)) continue;
        const int c = record.count(id);
        if (c > autoExcludeThreshold) {
            Logger()->warn("Auto-excluding particle {} with {} contacts (> {})", id, c, autoExcludeThreshold);
            ++stats.autoExcluded;
            continue;
        }
        values.push_back(c);
    }

    if (values.empty()) {
        return stats;
    }

    std::sort(values.begin(), values.end());
    const double n = static_cast<double>(values.size());

    double sum = 0.0;
    for (const auto v : values) sum += v;
    const double mean = sum / n;

    double var = 0.0;
    for (const auto v : values) var += (v - mean) * (v - mean);

    stats.totalParticles = static_cast<int>(values.size());
    stats.mean = mean;
    stats.median = percentile(values, 0.5);
    stats.stdDev = std::sqrt(var / n);
    stats.min = values.front();
    stats.max = values.back();
    stats.q25 = percentile(values, 0.25);
    stats.q75 = percentile(values, 0.75);
    return stats;
}

}  // namespace pc
