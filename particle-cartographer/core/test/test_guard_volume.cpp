#include "test.hpp"

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/GuardVolume.hpp"
#include "pc/testing/SyntheticVolumes.hpp"

using namespace pc;
using namespace pc::testing;

TEST(GuardMargin, StrictlyBelowHalfOfEveryDimension)
{
    const std::vector<Shape3> shapes{
        {1, 1, 1}, {2, 3, 4}, {5, 5, 5}, {30, 30, 30}, {100, 200, 50}, {7, 300, 300}, {400, 400, 400}};
    const std::vector<double> radii{0.0, 3.5, 50.0, 1e4};
    const std::vector<GuardParams> policies{
        GuardParams{}, GuardParams{2.0, 14, 0.06}, GuardParams{0.3, 0, 0.49}, GuardParams{10.0, 1000, 0.45}};

    for (const auto& s : shapes)
        for (const double r : radii)
            for (const auto& p : policies) {
                const int m = computeGuardMargin(s, r, p);
                EXPECT_GE(m, 0);
                EXPECT_LT(2 * std::size_t(m), s[0]);
                EXPECT_LT(2 * std::size_t(m), s[1]);
                EXPECT_LT(2 * std::size_t(m), s[2]);
            }
}

TEST(GuardMargin, ScaleFloorAndCap)
{
    const Shape3 big{500, 500, 500};
    EXPECT_EQ(computeGuardMargin(big, 20.0), 10);    // ceil(6) below the floor
    EXPECT_EQ(computeGuardMargin(big, 100.0), 30);   // ceil(30)
    EXPECT_EQ(computeGuardMargin(big, 200.0), 30);   // capped at 6% of 500
    EXPECT_EQ(computeGuardMargin(big, 40.0, GuardParams{0.3, 1, 0.06}), 12);

    const Shape3 flat{500, 500, 50};
    EXPECT_EQ(computeGuardMargin(flat, 100.0), 3);
}

TEST(GuardMargin, FromLabels)
{
    LabelVolume l = LabelVolume::from_shape({40, 200, 200});
    l.fill(0);
    EXPECT_EQ(computeGuardMargin(l), 2);
}

TEST(GuardMargin, NegativePolicyThrows)
{
    EXPECT_THROW(computeGuardMargin(Shape3{10, 10, 10}, 1.0, GuardParams{-1.0, 10, 0.06}), InputError);
}

TEST(GuardMask, InteriorRegion)
{
    auto mask = guardMask({10, 10, 10}, 2);
    EXPECT_EQ(CountForeground(mask), std::size_t(6 * 6 * 6));
    EXPECT_EQ(mask(2, 2, 2), 1);
    EXPECT_EQ(mask(1, 5, 5), 0);
    EXPECT_EQ(mask(7, 7, 7), 1);
    EXPECT_EQ(mask(8, 5, 5), 0);

    EXPECT_EQ(CountForeground(guardMask({10, 10, 10}, 0)), std::size_t(1000));
    EXPECT_THROW(guardMask({10, 10, 10}, -1), InputError);
}

TEST(FilterInterior, BoundingBoxInsideBand)
{
    LabelVolume l = LabelVolume::from_shape({20, 20, 20});
    l.fill(0);
    auto box = [&](uint32_t id, int lo, int hi) {
        for (int z = lo; z < hi; ++z)
            for (int y = lo; y < hi; ++y)
                for (int x = lo; x < hi; ++x)
                    l(z, y, x) = id;
    };
    box(1, 2, 5);     // touches the band edge from inside
    box(2, 0, 2);     // in the band
    box(3, 15, 18);   // max 17 < 20 - 2
    box(4, 17, 19);   // max 18 reaches the band

    auto part = filterInterior(l, 2);
    EXPECT_EQ(part.margin, 2);
    ASSERT_EQ(part.interior.size(), 2u);
    ASSERT_EQ(part.boundary.size(), 2u);
    EXPECT_EQ(part.interior[0], 1u);
    EXPECT_EQ(part.interior[1], 3u);
    EXPECT_EQ(part.boundary[0], 2u);
    EXPECT_EQ(part.boundary[1], 4u);
}

TEST(FilterInterior, PartitionCoversAllParticles)
{
    Volume v = EmptyVolume(30, 30, 30);
    AddSphere(v, 5, 5, 5, 4);
    AddSphere(v, 15, 15, 15, 4);
    AddSphere(v, 25, 25, 25, 4);
    LabelVolume l = LabelVolume::from_shape({30, 30, 30});
    for (std::size_t i = 0; i < v.size(); ++i) {
        const int z = int(i / 900);
        l.data()[i] = v.data()[i] ? uint32_t(1 + z / 10) : 0u;
    }
    auto part = filterInterior(l, 3);
    EXPECT_EQ(part.interior.size() + part.boundary.size(), 3u);
    ASSERT_EQ(part.interior.size(), 1u);
    EXPECT_EQ(part.interior[0], 2u);
}
