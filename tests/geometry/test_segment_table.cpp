#include <gtest/gtest.h>
#include "geometry/segment_table.hpp"

using namespace bmc_2d;

TEST(SegmentTableTest, SolvesCrossing) {
    SegmentTable table({Edge({0.0, 0.0}, {1.0, 0.0}, 0)});
    double t = -1.0, u = -1.0;
    ASSERT_TRUE(table.solve(0, {0.25, 1.0}, {0.25, -1.0}, t, u));
    EXPECT_DOUBLE_EQ(t, 0.5);
    EXPECT_DOUBLE_EQ(u, 0.25);
}

TEST(SegmentTableTest, ParametersOutsideUnitRangeWhenMissing) {
    SegmentTable table({Edge({0.0, 0.0}, {1.0, 0.0}, 0)});
    double t = 0.0, u = 0.0;
    ASSERT_TRUE(table.solve(0, {2.0, 1.0}, {2.0, 0.5}, t, u));
    EXPECT_GT(t, 1.0);
    EXPECT_GT(u, 1.0);
}

TEST(SegmentTableTest, ParallelStepHasNoSolution) {
    SegmentTable table({Edge({0.0, 0.0}, {1.0, 0.0}, 0)});
    double t = 0.0, u = 0.0;
    EXPECT_FALSE(table.solve(0, {0.0, 1.0}, {1.0, 1.0}, t, u));
    EXPECT_FALSE(table.solve(0, {0.2, 0.0}, {0.8, 0.0}, t, u));
}

TEST(SegmentTableTest, LineIntersection) {
    Vec2 out;
    ASSERT_TRUE(line_intersection({1.0, 0.0}, {2.0, 0.0}, {0.0, 3.0}, {0.0, 4.0}, out));
    EXPECT_DOUBLE_EQ(out.x, 0.0);
    EXPECT_DOUBLE_EQ(out.y, 0.0);

    ASSERT_TRUE(line_intersection({0.0, 0.0}, {1.0, 1.0}, {0.0, 2.0}, {2.0, 0.0}, out));
    EXPECT_DOUBLE_EQ(out.x, 1.0);
    EXPECT_DOUBLE_EQ(out.y, 1.0);

    EXPECT_FALSE(line_intersection({0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, out));
}
