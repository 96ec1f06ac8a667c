#include <gtest/gtest.h>
#include "geometry/edge.hpp"
#include <cmath>
#include <random>
#include <stdexcept>

using namespace bmc_2d;

TEST(EdgeTest, LeftHandNormal) {
    Edge e({0.0, 0.0}, {2.0, 0.0}, 1);
    EXPECT_DOUBLE_EQ(e.normal().x, 0.0);
    EXPECT_DOUBLE_EQ(e.normal().y, 1.0);
    EXPECT_NEAR(e.normal_angle(), std::acos(-1.0) / 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(e.length(), 2.0);
    EXPECT_EQ(e.layer(), 1);
}

TEST(EdgeTest, FlipNormal) {
    Edge e({0.0, 0.0}, {0.0, 1.0}, 0);
    EXPECT_DOUBLE_EQ(e.normal().x, -1.0);
    e.flip_normal();
    EXPECT_DOUBLE_EQ(e.normal().x, 1.0);
    EXPECT_NEAR(e.normal_angle(), 0.0, 1e-12);
}

TEST(EdgeTest, PointAt) {
    Edge e({1.0, 1.0}, {3.0, 2.0}, 0);
    Vec2 mid = e.point_at(0.5);
    EXPECT_DOUBLE_EQ(mid.x, 2.0);
    EXPECT_DOUBLE_EQ(mid.y, 1.5);
}

TEST(EdgeTest, RejectsDegenerateEdge) {
    EXPECT_THROW(Edge({1.0, 1.0}, {1.0, 1.0}, 0), std::invalid_argument);
}

TEST(EdgeTest, InjectionDistribution) {
    Edge e({0.0, 0.0}, {1.0, 0.0}, 1);
    std::mt19937 rng(1);
    EXPECT_FALSE(e.has_in_prob());
    EXPECT_THROW(e.sample_injection_index(rng), std::logic_error);
    EXPECT_THROW(e.set_in_prob({0.5, 0.5}, {1.0}), std::invalid_argument);

    e.set_in_prob({0.0, 0.5, 0.0, 0.5}, {0.0, 0.5, 0.5, 1.0});
    EXPECT_TRUE(e.has_in_prob());

    // Empty bins are never drawn
    for (int i = 0; i < 1000; ++i) {
        FermiState n_f = e.sample_injection_index(rng);
        EXPECT_TRUE(n_f.bin == 1 || n_f.bin == 3) << "bin " << n_f.bin;
        EXPECT_DOUBLE_EQ(n_f.frac, 1.0);
    }
}

TEST(EdgeTest, InjectionIndexFollowsWeights) {
    std::vector<double> cum = {0.25, 1.0};
    std::mt19937 rng(7);
    int first = 0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        if (Edge::compute_injection_index(cum, rng).bin == 0) ++first;
    }
    EXPECT_NEAR(static_cast<double>(first) / n, 0.25, 0.02);
}
