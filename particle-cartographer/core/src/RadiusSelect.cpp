#include "pc/core/util/RadiusSelect.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <tuple>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/Logging.hpp"
#include "pc/core/util/ParticleMetrics.hpp"

namespace pc {

void SelectionPolicy::validate() const
{
    if (!(tauRatio > 0.0 && tauRatio <= 1.0)) {
        throw InputError(std::format("tau_ratio must be in (0, 1], got {}", tauRatio));
    }
    if (!std::isfinite(contactsMin) || !std::isfinite(contactsMax)) {
        throw InputError("contact range bounds must be finite");
    }
    if (contactsMin > contactsMax) {
        throw InputError(std::format("contact range min {} exceeds max {}", contactsMin, contactsMax));
    }
    if (smoothingWindow < 1) {
        throw InputError(std::format("smoothing window must be >= 1, got {}", smoothingWindow));
    }
}

// ============================================================================
// Constraint-based selection
// ============================================================================

static void checkSequence(const std::vector<OptimizationResult>& results, bool requireAscending)
{
    if (results.empty()) {
        throw SelectionFailure("no optimization results to select from");
    }
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        if (!std::isfinite(r.largestParticleRatio) || !std::isfinite(r.meanContacts) ||
            !std::isfinite(r.hhi) || !std::isfinite(r.viToPrevious)) {
            throw SelectionFailure(std::format("non-finite metrics at radius {}", r.radius));
        }
        if (requireAscending && i > 0 && results[i - 1].radius >= r.radius) {
            throw SelectionFailure(std::format("radii not strictly ascending at radius {}", r.radius));
        }
    }
}

static bool meetsRatio(const OptimizationResult& r, double tau)
{
    return r.particleCount > 0 && r.largestParticleRatio <= tau;
}

static Selection constraintChoice(const OptimizationResult& r, const char* reason, std::string detail)
{
    Selection s;
    s.radius = r.radius;
    s.method = SelectionMethod::ConstraintBased;
    s.reason = reason;
    s.explanation = std::format("Best radius r={} ({}): {}; ratio={:.4f}, particles={}, mean contacts={:.2f}",
                                r.radius, reason, detail, r.largestParticleRatio,
                                r.particleCount, r.meanContacts);
    return s;
}

Selection selectByConstraints(const std::vector<OptimizationResult>& results,
                              const SelectionPolicy& policy)
{
    checkSequence(results, true);

    const std::size_t n = results.size();
    std::size_t star = n;
    for (std::size_t i = 0; i < n; ++i) {
        if (meetsRatio(results[i], policy.tauRatio)) {
            star = i;
            break;
        }
    }

    if (star == n) {
        return constraintChoice(results.back(), "max_r",
                                std::format("no radius reached largest-particle ratio <= {}", policy.tauRatio));
    }

    std::vector<double> counts(n);
    for (std::size_t i = 0; i < n; ++i) {
        counts[i] = static_cast<double>(results[i].particleCount);
    }
    const std::vector<double> smoothed = movingAverage(counts, policy.smoothingWindow);

    std::size_t peak = star;
    for (std::size_t i = star + 1; i < n; ++i) {
        if (meetsRatio(results[i], policy.tauRatio) && smoothed[i] > smoothed[peak]) {
            peak = i;
        }
    }
    Logger()->debug("Selection: r*={} R_peak={}", results[star].radius, results[peak].radius);

    if (policy.contactsInRange(results[peak].meanContacts)) {
        return constraintChoice(results[peak], "peak_and_contacts",
                                std::format("peak particle count with contacts in [{}, {}]",
                                            policy.contactsMin, policy.contactsMax));
    }

    for (std::size_t i = star; i < n; ++i) {
        if (results[i].particleCount > 0 && policy.contactsInRange(results[i].meanContacts)) {
            return constraintChoice(results[i], "contacts_only",
                                    std::format("first radius from r*={} with contacts in [{}, {}]",
                                                results[star].radius, policy.contactsMin,
                                                policy.contactsMax));
        }
    }

    if (peak != star) {
        return constraintChoice(results[peak], "r_peak", "peak particle count, contacts out of range");
    }

    return constraintChoice(results[star], "r_star",
                            std::format("smallest radius with largest-particle ratio <= {}", policy.tauRatio));
}

// ============================================================================
// Pareto fallback
// ============================================================================

static std::vector<double> normalised(const std::vector<double>& v)
{
    const auto [lo, hi] = std::minmax_element(v.begin(), v.end());
    std::vector<double> out(v.size(), 0.0);
    if (*hi <= *lo) return out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        out[i] = (v[i] - *lo) / (*hi - *lo);
    }
    return out;
}

Selection selectByPareto(const std::vector<OptimizationResult>& results,
                         const SelectionPolicy& policy)
{
    checkSequence(results, false);
    const std::size_t n = results.size();

    std::vector<double> radii(n), counts(n), hhis(n), kneeDist(n), instab(n);
    for (std::size_t i = 0; i < n; ++i) {
        radii[i] = results[i].radius;
        counts[i] = results[i].particleCount;
        hhis[i] = results[i].hhi;
    }

    const std::size_t knee = detectKneePoint(radii, counts);
    for (std::size_t i = 0; i < n; ++i) {
        kneeDist[i] = std::abs(static_cast<double>(i) - static_cast<double>(knee));

        // Mean VI to the neighbouring radii that exist
        double sum = 0.0;
        int terms = 0;
        if (i > 0) {
            sum += results[i].viToPrevious;
            ++terms;
        }
        if (i + 1 < n) {
            sum += results[i + 1].viToPrevious;
            ++terms;
        }
        instab[i] = terms > 0 ? sum / terms : 0.0;
    }

    const auto h = normalised(hhis);
    const auto k = normalised(kneeDist);
    const auto v = normalised(instab);

    auto dominates = [&](std::size_t a, std::size_t b) {
        const bool noWorse = h[a] <= h[b] && k[a] <= k[b] && v[a] <= v[b];
        const bool better = h[a] < h[b] || k[a] < k[b] || v[a] < v[b];
        return noWorse && better;
    };

    std::vector<std::size_t> candidates;
    for (std::size_t i = 0; i < n; ++i) {
        bool dominated = false;
        for (std::size_t j = 0; j < n && !dominated; ++j) {
            dominated = j != i && dominates(j, i);
        }
        if (!dominated) candidates.push_back(i);
    }

    auto key = [&](std::size_t i) {
        const double dist = std::sqrt(h[i] * h[i] + k[i] * k[i] + v[i] * v[i]);
        return std::make_tuple(dist, results[i].radius, hhis[i],
                               std::abs(results[i].meanContacts - policy.targetContacts));
    };

    const std::size_t best = *std::min_element(candidates.begin(), candidates.end(),
                                               [&](std::size_t a, std::size_t b) { return key(a) < key(b); });

    Selection s;
    s.radius = results[best].radius;
    s.method = SelectionMethod::ParetoFallback;
    s.reason = "pareto-fallback";
    s.explanation = std::format("Pareto+distance selection: r={}; knee@r={}, HHI={:.3f}, knee_dist={:.0f}, "
                                "instabVI={:.3f}",
                                s.radius, results[knee].radius, hhis[best], kneeDist[best], instab[best]);
    return s;
}

// ============================================================================
// Two-stage selection
// ============================================================================

Selection selectRadius(const std::vector<OptimizationResult>& results,
                       const SelectionPolicy& policy)
{
    std::string constraintCause;
    try {
        Selection s = selectByConstraints(results, policy);
        Logger()->info("Selected radius {} ({})", s.radius, s.reason);
        return s;
    } catch (const SelectionFailure& e) {
        constraintCause = e.what();
        Logger()->warn("Constraint-based selection failed: {}. Falling back to Pareto selection", constraintCause);
    }

    try {
        Selection s = selectByPareto(results, policy);
        Logger()->info("Selected radius {} ({})", s.radius, s.reason);
        return s;
    } catch (const SelectionFailure& e) {
        throw OptimizationFailure(constraintCause, e.what());
    }
}

}  // namespace pc
