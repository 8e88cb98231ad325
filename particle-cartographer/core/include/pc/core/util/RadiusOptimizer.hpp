#pragma once

#include <optional>
#include <string>

#include "pc/core/types/OptimizationResult.hpp"
#include "pc/core/types/Volume.hpp"
#include "pc/core/util/ContactCount.hpp"
#include "pc/core/util/GuardVolume.hpp"
#include "pc/core/util/OptimizerParams.hpp"
#include "pc/core/util/Progress.hpp"

namespace pc {

// Guard-filtered contact analysis of one labeling
struct ContactAnalysis {
    GuardPartition partition;
    ContactRecord contacts;
    ContactStatistics interiorStats;
};

ContactAnalysis analyzeContacts(const LabelVolume& labels,
                                const std::map<uint32_t, ParticleStats>& stats,
                                const OptimizerParams& params);

/**
 * @brief Metrics of one labeling
 *
 * Geometry metrics cover all particles, contact metrics interior particles only.
 * @param previous Labeling of the previous radius for the VI term, or nullptr
 */
OptimizationResult evaluateLabels(const LabelVolume& labels, int radius,
                                  const OptimizerParams& params,
                                  const LabelVolume* previous = nullptr);

/**
 * @brief Sweep the radius candidates in ascending order and select the best one
 *
 * Inputs are validated before the first radius. Only the previous labeling is
 * kept during the sweep; the selected labeling is regenerated at the end when
 * params.retainBestLabels is set.
 *
 * @throws InputError for an empty volume or invalid params
 * @throws RadiusProcessingError if any radius fails
 * @throws OptimizationCancelled if the token is set at a radius boundary
 * @throws OptimizationFailure if both selection stages fail
 */
OptimizationSummary optimizeRadius(const Volume& volume,
                                   const OptimizerParams& params,
                                   const ProgressCallback& progress = {},
                                   const CancellationToken* cancel = nullptr);

struct OptimizationOutcome {
    enum class Status {
        Completed,
        Cancelled,
        Failed
    };

    Status status = Status::Failed;
    std::optional<OptimizationSummary> summary;  ///< Set only for Completed
    std::string message;
};

std::string toString(OptimizationOutcome::Status status);

// optimizeRadius() with every terminal condition folded into one record
OptimizationOutcome runOptimization(const Volume& volume,
                                    const OptimizerParams& params,
                                    const ProgressCallback& progress = {},
                                    const CancellationToken* cancel = nullptr);

}  // namespace pc
