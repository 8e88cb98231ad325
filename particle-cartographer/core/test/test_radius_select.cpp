#include "test.hpp"

#include <limits>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/RadiusSelect.hpp"

using namespace pc;

static OptimizationResult make(int radius, int count, double ratio, double contacts,
                               double hhi = 0.1, double vi = 0.0)
{
    OptimizationResult r;
    r.radius = radius;
    r.particleCount = count;
    r.largestParticleRatio = ratio;
    r.meanContacts = contacts;
    r.hhi = hhi;
    r.viToPrevious = vi;
    return r;
}

TEST(SelectByConstraints, PeakAndContacts)
{
    std::vector<OptimizationResult> rs{make(1, 10, 0.5, 1), make(2, 100, 0.02, 6), make(3, 80, 0.01, 7)};
    auto s = selectByConstraints(rs, SelectionPolicy{});
    EXPECT_EQ(s.radius, 2);
    EXPECT_EQ(s.reason, std::string("peak_and_contacts"));
    EXPECT_TRUE(s.method == SelectionMethod::ConstraintBased);
}

TEST(SelectByConstraints, ContactsOnly)
{
    std::vector<OptimizationResult> rs{make(1, 100, 0.02, 3), make(2, 90, 0.01, 6), make(3, 80, 0.01, 7)};
    auto s = selectByConstraints(rs, SelectionPolicy{});
    EXPECT_EQ(s.radius, 2);
    EXPECT_EQ(s.reason, std::string("contacts_only"));
}

TEST(SelectByConstraints, PeakWithoutContacts)
{
    std::vector<OptimizationResult> rs{make(1, 50, 0.02, 2), make(2, 90, 0.01, 3), make(3, 60, 0.01, 4)};
    auto s = selectByConstraints(rs, SelectionPolicy{});
    EXPECT_EQ(s.radius, 2);
    EXPECT_EQ(s.reason, std::string("r_peak"));
}

TEST(SelectByConstraints, RStar)
{
    std::vector<OptimizationResult> rs{make(1, 50, 0.02, 2), make(2, 40, 0.01, 3)};
    auto s = selectByConstraints(rs, SelectionPolicy{});
    EXPECT_EQ(s.radius, 1);
    EXPECT_EQ(s.reason, std::string("r_star"));
}

TEST(SelectByConstraints, MaxRadiusWhenRatioNeverMet)
{
    std::vector<OptimizationResult> rs{make(1, 1, 1.0, 0), make(2, 1, 1.0, 0), make(3, 1, 1.0, 0)};
    auto s = selectByConstraints(rs, SelectionPolicy{});
    EXPECT_EQ(s.radius, 3);
    EXPECT_EQ(s.reason, std::string("max_r"));
}

TEST(SelectByConstraints, EmptyRadiiNeverQualify)
{
    std::vector<OptimizationResult> rs{make(1, 0, 0.0, 0), make(2, 20, 0.5, 0)};
    auto s = selectByConstraints(rs, SelectionPolicy{});
    EXPECT_EQ(s.radius, 2);
    EXPECT_EQ(s.reason, std::string("max_r"));

    // A later empty radius is skipped when searching for the peak and for contacts
    std::vector<OptimizationResult> tail{make(1, 40, 0.02, 2), make(2, 0, 0.0, 6)};
    auto t = selectByConstraints(tail, SelectionPolicy{});
    EXPECT_EQ(t.radius, 1);
    EXPECT_EQ(t.reason, std::string("r_star"));
}

TEST(SelectByConstraints, SmoothingMovesPeak)
{
    std::vector<OptimizationResult> rs{make(1, 10, 0.01, 0), make(2, 100, 0.01, 0), make(3, 20, 0.01, 0),
                                       make(4, 95, 0.01, 0), make(5, 96, 0.01, 0)};
    SelectionPolicy raw;
    auto a = selectByConstraints(rs, raw);
    EXPECT_EQ(a.radius, 2);
    EXPECT_EQ(a.reason, std::string("r_peak"));

    SelectionPolicy smooth;
    smooth.smoothingWindow = 3;
    auto b = selectByConstraints(rs, smooth);
    EXPECT_EQ(b.radius, 4);
    EXPECT_EQ(b.reason, std::string("r_peak"));
}

TEST(SelectByConstraints, Deterministic)
{
    std::vector<OptimizationResult> rs{make(1, 50, 0.02, 2), make(2, 90, 0.01, 3), make(3, 60, 0.01, 4)};
    auto a = selectByConstraints(rs, SelectionPolicy{});
    auto b = selectByConstraints(rs, SelectionPolicy{});
    EXPECT_EQ(a.radius, b.radius);
    EXPECT_EQ(a.reason, b.reason);
}

TEST(SelectByConstraints, MalformedInputsFail)
{
    EXPECT_THROW(selectByConstraints({}, SelectionPolicy{}), SelectionFailure);

    std::vector<OptimizationResult> nan{make(1, 5, std::numeric_limits<double>::quiet_NaN(), 0)};
    EXPECT_THROW(selectByConstraints(nan, SelectionPolicy{}), SelectionFailure);

    std::vector<OptimizationResult> unordered{make(2, 5, 0.5, 0), make(1, 5, 0.5, 0)};
    EXPECT_THROW(selectByConstraints(unordered, SelectionPolicy{}), SelectionFailure);
}

TEST(SelectByPareto, NearestNonDominated)
{
    std::vector<OptimizationResult> rs{make(1, 10, 0.5, 0, 0.5, 0.0), make(2, 50, 0.1, 0, 0.1, 0.8),
                                       make(3, 55, 0.05, 0, 0.05, 0.1), make(4, 56, 0.06, 0, 0.06, 0.05)};
    auto s = selectByPareto(rs, SelectionPolicy{});
    EXPECT_EQ(s.radius, 3);
    EXPECT_EQ(s.reason, std::string("pareto-fallback"));
    EXPECT_TRUE(s.method == SelectionMethod::ParetoFallback);

    auto again = selectByPareto(rs, SelectionPolicy{});
    EXPECT_EQ(again.radius, s.radius);
}

TEST(SelectByPareto, TieBreaksOnSmallerRadius)
{
    std::vector<OptimizationResult> rs{make(1, 5, 0.2, 0), make(2, 5, 0.2, 0)};
    EXPECT_EQ(selectByPareto(rs, SelectionPolicy{}).radius, 1);
}

TEST(SelectRadius, FallsBackToPareto)
{
    std::vector<OptimizationResult> rs{make(3, 60, 0.05, 0, 0.05), make(1, 10, 0.5, 0, 0.5), make(2, 50, 0.1, 0, 0.1)};
    auto s = selectRadius(rs, SelectionPolicy{});
    EXPECT_TRUE(s.method == SelectionMethod::ParetoFallback);
    EXPECT_EQ(s.reason, std::string("pareto-fallback"));
}

TEST(SelectRadius, BothStagesFail)
{
    bool thrown = false;
    try {
        selectRadius({}, SelectionPolicy{});
    } catch (const OptimizationFailure& e) {
        thrown = true;
        EXPECT_FALSE(e.constraintCause().empty());
        EXPECT_FALSE(e.fallbackCause().empty());
    }
    EXPECT_TRUE(thrown);
}

TEST(SelectionPolicy, Validation)
{
    SelectionPolicy p;
    EXPECT_NO_THROW(p.validate());

    p.contactsMin = 10;
    EXPECT_THROW(p.validate(), InputError);

    p = SelectionPolicy{};
    p.tauRatio = 0.0;
    EXPECT_THROW(p.validate(), InputError);

    p = SelectionPolicy{};
    p.smoothingWindow = 0;
    EXPECT_THROW(p.validate(), InputError);
}
