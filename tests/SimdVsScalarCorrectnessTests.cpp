#include <gtest/gtest.h>
#include "BatchPredicates.hpp"
#include <array>
#include <limits>
#include <random>

using qbvh::AABB;
using qbvh::Point2;

namespace {

// A box that holds (0,0) and overlaps the unit query, and one that does neither
const AABB kHit(-1.f, -1.f, 1.f, 1.f);
const AABB kMiss(10.f, 10.f, 11.f, 11.f);

std::array<AABB, 4> boxes_for_mask(int mask, const AABB& hit, const AABB& miss) {
    std::array<AABB, 4> out;
    for (int lane = 0; lane < 4; ++lane) out[lane] = (mask & (1 << lane)) ? hit : miss;
    return out;
}

} // namespace

TEST(BatchPredicates, ContainsAllSixteenMasks) {
    const Point2 p(0.f, 0.f);
    for (int mask = 0; mask < 16; ++mask) {
        auto b = boxes_for_mask(mask, kHit, kMiss);
        EXPECT_EQ(qbvh::contains4_scalar(p, b[0], b[1], b[2], b[3]), mask);
        EXPECT_EQ(qbvh::contains4(p, b[0], b[1], b[2], b[3]), mask) << "backend " << qbvh::simd_backend_name();
    }
}

TEST(BatchPredicates, IntersectsAllSixteenMasks) {
    const AABB q(0.5f, 0.5f, 2.f, 2.f);
    for (int mask = 0; mask < 16; ++mask) {
        auto b = boxes_for_mask(mask, kHit, kMiss);
        EXPECT_EQ(qbvh::intersects4_scalar(q, b[0], b[1], b[2], b[3]), mask);
        EXPECT_EQ(qbvh::intersects4(q, b[0], b[1], b[2], b[3]), mask) << "backend " << qbvh::simd_backend_name();
    }
}

TEST(BatchPredicates, EmptyBoxesNeverMatch) {
    const AABB e = AABB::empty();
    for (int mask = 0; mask < 16; ++mask) {
        auto b = boxes_for_mask(mask, kHit, e);
        EXPECT_EQ(qbvh::contains4(Point2(0.f, 0.f), b[0], b[1], b[2], b[3]), mask);
        EXPECT_EQ(qbvh::intersects4(AABB(0.f, 0.f, 0.5f, 0.5f), b[0], b[1], b[2], b[3]), mask);
    }
    EXPECT_EQ(qbvh::intersects4(e, kHit, kHit, kHit, kHit), 0);
}

TEST(BatchPredicates, BoundaryLanesAreClosed) {
    // Point on each box's edge or corner in turn
    const AABB b0(0.f, 0.f, 1.f, 1.f);
    const AABB b1(1.f, 0.f, 2.f, 1.f);
    const AABB b2(0.f, 1.f, 1.f, 2.f);
    const AABB b3(1.f, 1.f, 2.f, 2.f);
    EXPECT_EQ(qbvh::contains4(Point2(1.f, 1.f), b0, b1, b2, b3), 0xF);
    EXPECT_EQ(qbvh::contains4(Point2(1.f, 0.5f), b0, b1, b2, b3), 0x3);
    EXPECT_EQ(qbvh::contains4(Point2(0.5f, 1.f), b0, b1, b2, b3), 0x5);

    const AABB touching(2.f, 2.f, 3.f, 3.f);
    EXPECT_EQ(qbvh::intersects4(touching, b0, b1, b2, b3), 0x8);
    EXPECT_EQ(qbvh::intersects4_scalar(touching, b0, b1, b2, b3), 0x8);
}

TEST(BatchPredicates, NaNLanesMatchScalar) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    const AABB nan_box(nan, nan, nan, nan);
    const AABB half_nan(-1.f, nan, 1.f, 1.f);
    const AABB infinite(-inf, -inf, inf, inf);

    const Point2 points[] = {Point2(0.f, 0.f), Point2(nan, 0.f), Point2(0.f, inf)};
    for (const Point2& p : points) {
        EXPECT_EQ(qbvh::contains4(p, nan_box, half_nan, infinite, kHit),
                  qbvh::contains4_scalar(p, nan_box, half_nan, infinite, kHit));
    }

    const AABB queries[] = {AABB(0.f, 0.f, 1.f, 1.f), nan_box, infinite, AABB::empty()};
    for (const AABB& q : queries) {
        EXPECT_EQ(qbvh::intersects4(q, nan_box, half_nan, infinite, kMiss),
                  qbvh::intersects4_scalar(q, nan_box, half_nan, infinite, kMiss));
    }
}

TEST(BatchPredicates, RandomQuadruplesMatchScalar) {
    std::mt19937 rng(2024);
    std::uniform_real_distribution<float> pos(-10.f, 10.f);
    std::uniform_real_distribution<float> ext(0.f, 6.f);
    std::uniform_int_distribution<int> coin(0, 9);

    auto random_box = [&] {
        if (coin(rng) == 0) return AABB::empty();
        const float x = pos(rng), y = pos(rng);
        return AABB(x, y, x + ext(rng), y + ext(rng));
    };

    for (int trial = 0; trial < 5000; ++trial) {
        const AABB b0 = random_box(), b1 = random_box(), b2 = random_box(), b3 = random_box();
        const Point2 p(pos(rng), pos(rng));
        const AABB q = random_box();

        const int contains_mask = qbvh::contains4(p, b0, b1, b2, b3);
        ASSERT_EQ(contains_mask, qbvh::contains4_scalar(p, b0, b1, b2, b3)) << "trial " << trial;
        ASSERT_EQ(qbvh::intersects4(q, b0, b1, b2, b3), qbvh::intersects4_scalar(q, b0, b1, b2, b3))
            << "trial " << trial;

        // Bit i is exactly the scalar predicate on lane i
        ASSERT_EQ((contains_mask & 1) != 0, b0.contains(p));
        ASSERT_EQ((contains_mask & 8) != 0, b3.contains(p));
    }
}
