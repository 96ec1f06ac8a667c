#include <gtest/gtest.h>
#include "band/bandstructure.hpp"
#include <cmath>
#include <stdexcept>

using namespace bmc_2d;

namespace {
    std::vector<Vec2> square_fermi_surface() {
        return {{1.0, 0.0}, {0.0, 1.0}, {-1.0, 0.0}, {0.0, -1.0}};
    }

    void expect_vec_near(const Vec2& a, const Vec2& b, double tol = 1e-12) {
        EXPECT_NEAR(a.x, b.x, tol);
        EXPECT_NEAR(a.y, b.y, tol);
    }
}

TEST(BandstructureTest, OrbitIsClosed) {
    Bandstructure band(Bandstructure::circular_fermi_surface(64, 1.0), 0.0, 1.0);
    EXPECT_EQ(band.n_bins(), 64);
    ASSERT_EQ(band.r().size(), 65u);
    EXPECT_EQ(band.r().front(), band.r().back());

    Vec2 sum;
    for (const auto& d : band.dr()) {
        sum += d;
    }
    EXPECT_NEAR(sum.x, 0.0, 1e-12);
    EXPECT_NEAR(sum.y, 0.0, 1e-12);
}

TEST(BandstructureTest, RealSpaceOrbitMapping) {
    Bandstructure band(square_fermi_surface(), 0.0, 2.0);
    // r = (k_y, -k_x) / |B|
    expect_vec_near(band.r_at(0), {0.0, -0.5});
    expect_vec_near(band.r_at(1), {0.5, 0.0});
    expect_vec_near(band.dr_at(0), {0.5, 0.5});
}

TEST(BandstructureTest, NegativeFieldReversesTraversal) {
    Bandstructure band(square_fermi_surface(), 0.0, -2.0);
    // First point is the last k point (0, -1)
    expect_vec_near(band.r_at(0), {-0.5, 0.0});
    expect_vec_near(band.r_at(1), {0.0, 0.5});
}

TEST(BandstructureTest, CrystalAngleRotatesFermiSurface) {
    const double half_pi = std::acos(-1.0) / 2.0;
    Bandstructure band(square_fermi_surface(), half_pi, 1.0);
    // k = (1, 0) rotated to (0, 1)
    expect_vec_near(band.r_at(0), {1.0, 0.0});
}

TEST(BandstructureTest, RejectsBadInput) {
    EXPECT_THROW(Bandstructure(square_fermi_surface(), 0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(Bandstructure({{1.0, 0.0}, {0.0, 1.0}}, 0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Bandstructure::circular_fermi_surface(2, 1.0), std::invalid_argument);
    EXPECT_THROW(Bandstructure::elliptical_fermi_surface(10, 1.0, -1.0), std::invalid_argument);
}

TEST(BandstructureTest, DropsRepeatedClosingPoint) {
    std::vector<Vec2> k = square_fermi_surface();
    k.push_back(k.front());
    Bandstructure band(k, 0.0, 1.0);
    EXPECT_EQ(band.n_bins(), 4);
}

TEST(BandstructureTest, FermiSurfaceGenerators) {
    for (const auto& k : Bandstructure::circular_fermi_surface(50, 0.7)) {
        EXPECT_NEAR(k.norm(), 0.7, 1e-12);
    }
    auto ellipse = Bandstructure::elliptical_fermi_surface(40, 2.0, 1.0);
    ASSERT_EQ(ellipse.size(), 40u);
    for (const auto& k : ellipse) {
        EXPECT_NEAR(k.x * k.x / 4.0 + k.y * k.y, 1.0, 1e-12);
    }
}

TEST(BandstructureTest, FermiPoint) {
    Bandstructure band(square_fermi_surface(), 0.0, 1.0);
    expect_vec_near(band.fermi_point({1, 1.0}), band.r_at(1));
    expect_vec_near(band.fermi_point({1, 0.0}), band.r_at(2));
    expect_vec_near(band.fermi_point({1, 0.5}), (band.r_at(1) + band.r_at(2)) * 0.5);
}

TEST(BandstructureTest, InjectionProbability) {
    Bandstructure band(Bandstructure::circular_fermi_surface(100, 1.0), 0.3, 1.5);
    const double angle = 1.1;
    const Vec2 n(std::cos(angle), std::sin(angle));
    InjectionProbability prob = band.calculate_injection_prob(angle);

    ASSERT_EQ(prob.in_prob.size(), 100u);
    double total = 0.0;
    for (int i = 0; i < band.n_bins(); ++i) {
        EXPECT_GE(prob.in_prob[i], 0.0);
        if (band.dr_at(i).dot(n) <= 0.0) {
            EXPECT_EQ(prob.in_prob[i], 0.0) << "bin " << i;
        }
        if (i > 0) {
            EXPECT_GE(prob.cum_prob[i], prob.cum_prob[i - 1]);
        }
        total += prob.in_prob[i];
    }
    EXPECT_NEAR(total, 1.0, 1e-12);
    EXPECT_EQ(prob.cum_prob.back(), 1.0);
}

TEST(BandstructureTest, InjectionWeightIsNormalFlux) {
    Bandstructure band(square_fermi_surface(), 0.0, 1.0);
    // Bottom edge: dr0 = (1, 1) and dr1 = (-1, 1) inject equally
    InjectionProbability prob = band.calculate_injection_prob(std::acos(-1.0) / 2.0);
    EXPECT_NEAR(prob.in_prob[0], 0.5, 1e-12);
    EXPECT_NEAR(prob.in_prob[1], 0.5, 1e-12);
    EXPECT_EQ(prob.in_prob[2], 0.0);
    EXPECT_EQ(prob.in_prob[3], 0.0);
}
