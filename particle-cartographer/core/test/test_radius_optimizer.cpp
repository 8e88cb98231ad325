#include "test.hpp"

#include <set>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/RadiusOptimizer.hpp"
#include "pc/testing/SyntheticVolumes.hpp"

using namespace pc;
using namespace pc::testing;

static OptimizerParams paramsFor(std::vector<int> radii)
{
    OptimizerParams p;
    p.radii = std::move(radii);
    return p;
}

// 2x2x2 grid of radius-5 spheres with 5 background voxels between neighbours
static Volume eightSpheres()
{
    Volume v = EmptyVolume(33, 33, 33);
    for (int z : {8, 24})
        for (int y : {8, 24})
            for (int x : {8, 24})
                AddSphere(v, z, y, x, 5);
    return v;
}

static void checkInvariants(const OptimizationSummary& s)
{
    for (const auto& r : s.results) {
        EXPECT_EQ(r.interiorParticleCount + r.excludedParticleCount, r.particleCount);
        if (r.totalVolume > 0) {
            EXPECT_NEAR(r.largestParticleRatio,
                        double(r.largestParticleVolume) / double(r.totalVolume), 1e-12);
        }
    }
}

TEST(RadiusOptimizer, SingleCubeFallsToMaxRadius)
{
    Volume v = EmptyVolume(30, 30, 30);
    AddBox(v, 5, 5, 5, 25, 25, 25);

    auto s = optimizeRadius(v, paramsFor({1, 2, 3}));
    ASSERT_EQ(s.results.size(), 3u);
    for (const auto& r : s.results) {
        EXPECT_EQ(r.particleCount, 1);
        EXPECT_FLOAT_EQ(r.meanContacts, 0.0);
        EXPECT_NEAR(r.largestParticleRatio, 1.0, 1e-12);
        EXPECT_EQ(r.totalVolume, uint64_t(8000));
    }
    EXPECT_EQ(s.bestRadius, 3);
    EXPECT_EQ(s.reason, std::string("max_r"));
    EXPECT_TRUE(s.method == SelectionMethod::ConstraintBased);
    checkInvariants(s);
}

TEST(RadiusOptimizer, VolumeFilledByOneCube)
{
    // The cube is the whole volume, so it touches every face
    Volume v = EmptyVolume(20, 20, 20);
    AddBox(v, 0, 0, 0, 20, 20, 20);

    auto s = optimizeRadius(v, paramsFor({1, 2, 3}));
    ASSERT_EQ(s.results.size(), 3u);
    for (const auto& r : s.results) {
        EXPECT_EQ(r.particleCount, 1);
        EXPECT_EQ(r.totalVolume, uint64_t(8000));
        EXPECT_NEAR(r.largestParticleRatio, 1.0, 1e-12);
        EXPECT_EQ(r.guardMargin, 1);
        EXPECT_EQ(r.interiorParticleCount, 0);
        EXPECT_EQ(r.excludedParticleCount, 1);
        EXPECT_FLOAT_EQ(r.meanContacts, 0.0);
    }
    EXPECT_EQ(s.bestRadius, 3);
    EXPECT_EQ(s.reason, std::string("max_r"));
    ASSERT_TRUE(s.bestLabels.has_value());
    EXPECT_EQ((*s.bestLabels)(0, 0, 0), 1u);
    EXPECT_EQ((*s.bestLabels)(19, 19, 19), 1u);
    checkInvariants(s);
}

TEST(RadiusOptimizer, SeparatedSpheres)
{
    const Volume v = eightSpheres();

    auto s = optimizeRadius(v, paramsFor({0, 1, 2}));
    ASSERT_EQ(s.results.size(), 3u);
    for (const auto& r : s.results) {
        EXPECT_EQ(r.particleCount, 8);
        EXPECT_NEAR(r.largestParticleRatio, 0.125, 1e-12);
        EXPECT_NEAR(r.hhi, 0.125, 1e-12);
        EXPECT_FLOAT_EQ(r.meanContacts, 0.0);
        EXPECT_EQ(r.interiorParticleCount, 8);
        EXPECT_NEAR(r.viToPrevious, 0.0, 1e-9);
    }
    EXPECT_EQ(s.bestRadius, 2);
    EXPECT_EQ(s.reason, std::string("max_r"));

    OptimizerParams loose = paramsFor({0, 1, 2});
    loose.selection.tauRatio = 0.2;
    auto t = optimizeRadius(v, loose);
    EXPECT_EQ(t.bestRadius, 0);
    EXPECT_EQ(t.reason, std::string("r_star"));
    checkInvariants(t);
}

TEST(RadiusOptimizer, NeckedSpheresSplit)
{
    const Volume v = NeckedSpheres(6, 32, 32, 40);
    OptimizerParams p = paramsFor({0, 1, 2, 3});
    p.guard.minMarginVoxels = 1;

    auto s = optimizeRadius(v, p);
    ASSERT_EQ(s.results.size(), 4u);
    EXPECT_EQ(s.results[0].particleCount, 1);
    EXPECT_FLOAT_EQ(s.results[0].meanContacts, 0.0);
    for (std::size_t i = 1; i < 4; ++i) {
        EXPECT_EQ(s.results[i].particleCount, 2);
        EXPECT_EQ(s.results[i].interiorParticleCount, 2);
        EXPECT_FLOAT_EQ(s.results[i].meanContacts, 1.0);
        EXPECT_EQ(s.results[i].maxContacts, 1);
    }
    EXPECT_GT(s.results[1].viToPrevious, 0.0);
    checkInvariants(s);
}

TEST(RadiusOptimizer, RetainsBestLabels)
{
    const Volume v = NeckedSpheres(6, 32, 32, 40);
    OptimizerParams p = paramsFor({0, 1, 2});
    p.selection.tauRatio = 0.6;

    auto s = optimizeRadius(v, p);
    ASSERT_TRUE(s.bestLabels.has_value());
    const auto* best = s.resultForRadius(s.bestRadius);
    ASSERT_TRUE(best != nullptr);

    std::set<uint32_t> ids;
    for (const auto id : *s.bestLabels) {
        if (id) ids.insert(id);
    }
    EXPECT_EQ(int(ids.size()), best->particleCount);
    EXPECT_TRUE(s.resultForRadius(42) == nullptr);

    p.retainBestLabels = false;
    EXPECT_FALSE(optimizeRadius(v, p).bestLabels.has_value());
}

TEST(RadiusOptimizer, ProgressIsMonotonic)
{
    const Volume v = eightSpheres();
    std::vector<ProgressEvent> events;
    auto s = optimizeRadius(v, paramsFor({0, 1, 2, 3}),
                            [&](const ProgressEvent& e) { events.push_back(e); });

    ASSERT_EQ(events.size(), 4u);
    for (std::size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].radius, s.results[i].radius);
        EXPECT_EQ(events[i].particleCount, s.results[i].particleCount);
        if (i > 0) EXPECT_GT(events[i].percentComplete, events[i - 1].percentComplete);
    }
    EXPECT_FLOAT_EQ(events.back().percentComplete, 90.0);
}

TEST(RadiusOptimizer, CancellationBetweenRadii)
{
    const Volume v = eightSpheres();
    CancellationToken token;
    int seen = 0;
    auto cancelAfterFirst = [&](const ProgressEvent&) {
        ++seen;
        token.cancel();
    };

    bool cancelled = false;
    try {
        optimizeRadius(v, paramsFor({0, 1, 2}), cancelAfterFirst, &token);
    } catch (const OptimizationCancelled& e) {
        cancelled = true;
        EXPECT_EQ(e.nextRadius(), 1);
    }
    EXPECT_TRUE(cancelled);
    EXPECT_EQ(seen, 1);

    auto outcome = runOptimization(v, paramsFor({0, 1}), {}, &token);
    EXPECT_TRUE(outcome.status == OptimizationOutcome::Status::Cancelled);
    EXPECT_FALSE(outcome.summary.has_value());
}

TEST(RadiusOptimizer, InputErrorsFailFast)
{
    const Volume empty = Volume::from_shape({0, 0, 0});
    EXPECT_THROW(optimizeRadius(empty, paramsFor({1})), InputError);

    Volume v = EmptyVolume(4, 4, 4);
    EXPECT_THROW(optimizeRadius(v, paramsFor({})), InputError);
    EXPECT_THROW(optimizeRadius(v, paramsFor({-1, 2})), InputError);
    EXPECT_THROW(optimizeRadius(v, paramsFor({2, 1})), InputError);

    OptimizerParams bad = paramsFor({1});
    bad.selection.contactsMin = 9;
    bad.selection.contactsMax = 5;
    int progressCalls = 0;
    EXPECT_THROW(optimizeRadius(v, bad, [&](const ProgressEvent&) { ++progressCalls; }), InputError);
    EXPECT_EQ(progressCalls, 0);
}

TEST(RunOptimization, TerminalOutcomes)
{
    Volume v = EmptyVolume(30, 30, 30);
    AddBox(v, 5, 5, 5, 25, 25, 25);

    auto ok = runOptimization(v, paramsFor({1, 2}));
    EXPECT_TRUE(ok.status == OptimizationOutcome::Status::Completed);
    ASSERT_TRUE(ok.summary.has_value());
    EXPECT_EQ(ok.summary->bestRadius, 2);

    auto failed = runOptimization(v, paramsFor({}));
    EXPECT_TRUE(failed.status == OptimizationOutcome::Status::Failed);
    EXPECT_FALSE(failed.summary.has_value());
    EXPECT_FALSE(failed.message.empty());
    EXPECT_EQ(toString(failed.status), std::string("failed"));
}

TEST(EvaluateLabels, GuardExcludesTruncatedParticles)
{
    Volume v = EmptyVolume(40, 40, 40);
    AddSphere(v, 20, 20, 14, 5);
    AddSphere(v, 20, 20, 25, 5);
    AddSphere(v, 20, 20, 2, 5);   // cut by the x = 0 face

    OptimizerParams p;
    p.guard.minMarginVoxels = 2;
    auto labels = splitParticles(v, 1, p.split);
    auto r = evaluateLabels(labels, 1, p);
    EXPECT_EQ(r.particleCount, 3);
    EXPECT_EQ(r.guardMargin, 2);
    EXPECT_EQ(r.interiorParticleCount, 2);
    EXPECT_EQ(r.excludedParticleCount, 1);
}
