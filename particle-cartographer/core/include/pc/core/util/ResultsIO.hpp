#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "pc/core/types/OptimizationResult.hpp"
#include "pc/core/util/OptimizerParams.hpp"
#include "pc/core/util/RadiusOptimizer.hpp"

namespace pc {

// One row per tested radius, ascending
void writeResultsCsv(const OptimizationSummary& summary, const std::filesystem::path& path);

nlohmann::json summaryToJson(const OptimizationSummary& summary, const OptimizerParams& params);

// particle_id,contacts for the interior particles of a labeling
void writeContactsCsv(const ContactAnalysis& analysis, const std::filesystem::path& path);

/**
 * @brief Raw little-endian uint32 labels plus a JSON sidecar
 *
 * Writes <stem>.raw and <stem>.json (shape, dtype, order).
 */
void writeLabelVolume(const LabelVolume& labels, const std::filesystem::path& dir, const std::string& stem);

// Reads what writeLabelVolume() wrote. Throws std::runtime_error on size or dtype mismatch.
LabelVolume readLabelVolume(const std::filesystem::path& dir, const std::string& stem);

/**
 * @brief Write every artefact of a completed run into dir
 *
 * optimization_results.csv, optimization_summary.json and, when the summary
 * holds the selected labeling, best_labels.raw/.json and contact_counts.csv.
 */
void exportResults(const OptimizationSummary& summary, const OptimizerParams& params,
                   const std::filesystem::path& dir);

}  // namespace pc
