#include "pc/core/util/RadiusOptimizer.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/Logging.hpp"
#include "pc/core/util/ParticleMetrics.hpp"
#include "pc/core/util/ParticleSplit.hpp"

namespace pc {

using Clock = std::chrono::steady_clock;

static double secondsSince(Clock::time_point start)
{
    return std::chrono::duration<double>(Clock::now() - start).count();
}

ContactAnalysis analyzeContacts(const LabelVolume& labels,
                                const std::map<uint32_t, ParticleStats>& stats,
                                const OptimizerParams& params)
{
    ContactAnalysis out;
    const int margin = computeGuardMargin(shapeOf(labels), maxEquivalentRadius(stats), params.guard);
    out.partition = filterInterior(stats, shapeOf(labels), margin);

    if (params.computeContacts) {
        out.contacts = countContacts(labels, params.contactConnectivity);
        out.interiorStats = summarizeContacts(out.contacts, out.partition.interior, {},
                                              params.autoExcludeThreshold);
    }
    return out;
}

OptimizationResult evaluateLabels(const LabelVolume& labels, int radius,
                                  const OptimizerParams& params,
                                  const LabelVolume* previous)
{
    const auto stats = computeParticleStats(labels);
    const LargestParticle largest = largestParticleRatio(stats);

    OptimizationResult r;
    r.radius = radius;
    r.particleCount = static_cast<int>(stats.size());
    r.largestParticleRatio = largest.ratio;
    r.totalVolume = largest.totalVolume;
    r.largestParticleVolume = largest.largestVolume;
    r.hhi = herfindahlIndex(volumeList(stats));

    const ContactAnalysis contacts = analyzeContacts(labels, stats, params);
    r.guardMargin = contacts.partition.margin;
    r.interiorParticleCount = static_cast<int>(contacts.partition.interior.size());
    r.excludedParticleCount = static_cast<int>(contacts.partition.boundary.size());
    r.meanContacts = contacts.interiorStats.mean;
    r.medianContacts = contacts.interiorStats.median;
    r.maxContacts = contacts.interiorStats.max;

    if (previous) {
        r.viToPrevious = variationOfInformation(*previous, labels);
    }
    return r;
}

OptimizationSummary optimizeRadius(const Volume& volume,
                                   const OptimizerParams& params,
                                   const ProgressCallback& progress,
                                   const CancellationToken* cancel)
{
    if (volume.size() == 0) {
        throw InputError("input volume is empty");
    }
    params.validate();

    const auto runStart = Clock::now();
    const std::size_t n = params.radii.size();
    Logger()->info("Optimizing erosion radius over {} candidates ({}..{}), volume {}x{}x{}",
                   n, params.radii.front(), params.radii.back(),
                   volume.shape()[0], volume.shape()[1], volume.shape()[2]);

    OptimizationSummary summary;
    summary.results.reserve(n);
    std::optional<LabelVolume> previous;

    for (std::size_t i = 0; i < n; ++i) {
        const int radius = params.radii[i];
        if (cancel && cancel->cancelled()) {
            Logger()->info("Optimization cancelled before radius {}", radius);
            throw OptimizationCancelled(radius);
        }

        const auto start = Clock::now();
        OptimizationResult result;
        LabelVolume labels;
        try {
            labels = splitParticles(volume, radius, params.split);
            result = evaluateLabels(labels, radius, params, previous ? &*previous : nullptr);
        } catch (const std::exception& e) {
            Logger()->error("Processing radius {} failed: {}", radius, e.what());
            throw RadiusProcessingError(radius, e.what());
        }
        result.processingTime = secondsSince(start);
        previous = std::move(labels);

        Logger()->info("r={}: particles={}, largest ratio={}, mean contacts={} ({} interior, {} excluded, margin {})",
                       radius, result.particleCount, result.largestParticleRatio, result.meanContacts,
                       result.interiorParticleCount, result.excludedParticleCount, result.guardMargin);
        summary.results.push_back(result);

        if (progress) {
            ProgressEvent event;
            event.radius = radius;
            event.particleCount = result.particleCount;
            event.meanContacts = result.meanContacts;
            event.largestParticleRatio = result.largestParticleRatio;
            event.percentComplete = 90.0 * static_cast<double>(i + 1) / static_cast<double>(n);
            progress(event);
        }
    }

    const Selection selection = selectRadius(summary.results, params.selection);
    summary.bestRadius = selection.radius;
    summary.method = selection.method;
    summary.reason = selection.reason;
    summary.explanation = selection.explanation;

    if (params.retainBestLabels) {
        if (summary.results.back().radius == selection.radius) {
            summary.bestLabels = std::move(previous);
        } else {
            Logger()->debug("Regenerating labels for radius {}", selection.radius);
            try {
                summary.bestLabels = splitParticles(volume, selection.radius, params.split);
            } catch (const std::exception& e) {
                throw RadiusProcessingError(selection.radius, e.what());
            }
        }
    }

    summary.totalProcessingTime = secondsSince(runStart);
    Logger()->info("Best radius: {} ({}, {}) in {}s", summary.bestRadius, toString(summary.method),
                   summary.reason, summary.totalProcessingTime);
    return summary;
}

std::string toString(OptimizationOutcome::Status status)
{
    switch (status) {
        case OptimizationOutcome::Status::Completed: return "completed";
        case OptimizationOutcome::Status::Cancelled: return "cancelled";
        case OptimizationOutcome::Status::Failed: return "failed";
    }
    return "unknown";
}

OptimizationOutcome runOptimization(const Volume& volume,
                                    const OptimizerParams& params,
                                    const ProgressCallback& progress,
                                    const CancellationToken* cancel)
{
    OptimizationOutcome outcome;
    try {
        outcome.summary = optimizeRadius(volume, params, progress, cancel);
        outcome.status = OptimizationOutcome::Status::Completed;
        outcome.message = "best radius " + std::to_string(outcome.summary->bestRadius) +
                          " (" + outcome.summary->reason + ")";
    } catch (const OptimizationCancelled& e) {
        outcome.status = OptimizationOutcome::Status::Cancelled;
        outcome.message = e.what();
    } catch (const std::exception& e) {
        Logger()->error("Optimization failed: {}", e.what());
        outcome.status = OptimizationOutcome::Status::Failed;
        outcome.message = e.what();
    }
    return outcome;
}

}  // namespace pc
