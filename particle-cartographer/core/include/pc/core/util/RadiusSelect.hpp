#pragma once

#include <string>
#include <vector>

#include "pc/core/types/OptimizationResult.hpp"

namespace pc {

struct SelectionPolicy {
    double tauRatio = 0.03;        ///< Max acceptable largest-particle ratio
    double contactsMin = 5.0;
    double contactsMax = 9.0;
    int smoothingWindow = 1;       ///< Moving average over particle counts, 1 = off
    double targetContacts = 6.0;   ///< Pareto tie-break reference

    // @throws InputError for tau outside (0, 1], min > max or window < 1
    void validate() const;

    [[nodiscard]] bool contactsInRange(double c) const noexcept
    {
        return c >= contactsMin && c <= contactsMax;
    }
};

struct Selection {
    int radius = 0;
    SelectionMethod method = SelectionMethod::ConstraintBased;
    std::string reason;
    std::string explanation;
};

/**
 * @brief Rule-based choice over a complete, ascending result sequence
 *
 * First match wins:
 *   - peak_and_contacts: R_peak has mean contacts in range
 *   - contacts_only: first radius >= r* with mean contacts in range
 *   - r_peak: R_peak, when it differs from r*
 *   - r_star: smallest radius meeting the ratio threshold
 *   - max_r: no radius met the ratio threshold
 *
 * Radii without particles never qualify as r* or R_peak.
 *
 * @throws SelectionFailure for an empty sequence, non-finite metrics or
 *         radii that are not strictly ascending
 */
Selection selectByConstraints(const std::vector<OptimizationResult>& results,
                              const SelectionPolicy& policy);

/**
 * @brief Pareto choice over (HHI, knee distance, VI instability)
 *
 * Objectives are min-max normalised independently. Among the non-dominated
 * radii the one nearest to the origin wins, ties broken by smaller radius,
 * lower HHI, then contacts closer to targetContacts.
 *
 * @throws SelectionFailure for an empty sequence or non-finite metrics
 */
Selection selectByPareto(const std::vector<OptimizationResult>& results,
                         const SelectionPolicy& policy);

/**
 * @brief Constraint-based selection with the Pareto choice as fallback
 * @throws OptimizationFailure when both stages fail
 */
Selection selectRadius(const std::vector<OptimizationResult>& results,
                       const SelectionPolicy& policy);

}  // namespace pc
