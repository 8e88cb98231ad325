#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <utility>
#include <vector>

#include "pc/core/types/Volume.hpp"

namespace pc {

/**
 * @brief Particle adjacency of one label volume
 *
 * Every particle present in the labeling has an entry in counts(), isolated
 * particles included with a count of 0. Pairs are unordered and stored with
 * first < second, each touching pair exactly once.
 */
class ContactRecord {
public:
    using Pair = std::pair<uint32_t, uint32_t>;

    ContactRecord() = default;
    ContactRecord(std::set<Pair> pairs, const std::vector<uint32_t>& presentIds);

    [[nodiscard]] const std::set<Pair>& pairs() const noexcept { return pairs_; }
    [[nodiscard]] const std::map<uint32_t, int>& counts() const noexcept { return counts_; }

    // 0 for ids not present in the labeling
    [[nodiscard]] int count(uint32_t id) const;
    [[nodiscard]] bool touching(uint32_t a, uint32_t b) const;

    // Ids of the particles touching id, ascending
    [[nodiscard]] std::vector<uint32_t> neighbors(uint32_t id) const;

private:
    std::set<Pair> pairs_;
    std::map<uint32_t, int> counts_;
};

/**
 * @brief Count distinct touching neighbours of every particle
 *
 * Each voxel pair within the neighbourhood is inspected once. A pair of
 * particles counts once however long their shared interface is.
 */
ContactRecord countContacts(const LabelVolume& labels, Connectivity connectivity = Connectivity::Corner);

// ============================================================================
// Statistics
// ============================================================================

struct ContactStatistics {
    int totalParticles = 0;
    double mean = 0.0;
    double median = 0.0;
    double stdDev = 0.0;   ///< Population standard deviation
    int min = 0;
    int max = 0;
    double q25 = 0.0;
    double q75 = 0.0;
    int autoExcluded = 0;  ///< Particles dropped by the outlier threshold
};

/**
 * @brief Summarise contact counts of a particle subset
 *
 * @param ids Particles to include. Ids without an entry in the record count as 0.
 * @param excludeIds Explicitly removed before the threshold is applied
 * @param autoExcludeThreshold Counts above this are treated as artefacts and dropped
 */
ContactStatistics summarizeContacts(const ContactRecord& record,
                                    const std::vector<uint32_t>& ids,
                                    const std::vector<uint32_t>& excludeIds = {},
                                    int autoExcludeThreshold = 200);

}  // namespace pc
