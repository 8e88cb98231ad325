#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pc/core/types/Volume.hpp"

namespace pc {

// Metrics of one tested radius. Built once by the optimizer and never changed.
struct OptimizationResult {
    int radius = 0;
    int particleCount = 0;
    double largestParticleRatio = 0.0;  ///< largestParticleVolume / totalVolume, 0 if nothing labeled
    uint64_t totalVolume = 0;
    uint64_t largestParticleVolume = 0;
    double hhi = 0.0;

    // Contact statistics over interior particles only
    double meanContacts = 0.0;
    double medianContacts = 0.0;
    int maxContacts = 0;
    int interiorParticleCount = 0;
    int excludedParticleCount = 0;
    int guardMargin = 0;

    double viToPrevious = 0.0;          ///< 0 for the first radius
    double processingTime = 0.0;        ///< Seconds
};

enum class SelectionMethod {
    ConstraintBased,
    ParetoFallback
};

inline std::string toString(SelectionMethod m)
{
    return m == SelectionMethod::ConstraintBased ? "constraint-based" : "pareto-fallback";
}

// Terminal artifact of one optimization run
struct OptimizationSummary {
    int bestRadius = 0;
    std::vector<OptimizationResult> results;  ///< Ascending radius
    SelectionMethod method = SelectionMethod::ConstraintBased;
    std::string reason;
    std::string explanation;
    double totalProcessingTime = 0.0;
    std::optional<LabelVolume> bestLabels;

    [[nodiscard]] const OptimizationResult* resultForRadius(int radius) const
    {
        for (const auto& r : results) {
            if (r.radius == radius) return &r;
        }
        return nullptr;
    }
};

}  // namespace pc
