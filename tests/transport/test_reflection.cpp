#include <gtest/gtest.h>
#include "transport/reflection.hpp"
#include <cmath>
#include <random>

using namespace bmc_2d;

namespace {
    std::vector<Vec2> square_fermi_surface() {
        return {{1.0, 0.0}, {0.0, 1.0}, {-1.0, 0.0}, {0.0, -1.0}};
    }

    Edge with_injection(Edge edge, const Bandstructure& band) {
        InjectionProbability prob = band.calculate_injection_prob(edge.normal_angle());
        edge.set_in_prob(prob.in_prob, prob.cum_prob);
        return edge;
    }
}

TEST(ReflectionTest, SpecularReversesNormalMotion) {
    Bandstructure band(Bandstructure::circular_fermi_surface(100, 1.0), 0.0, 1.0);
    Edge bottom({0.0, 0.0}, {1.0, 0.0}, 0);
    const Vec2 n = bottom.normal();

    int tested = 0;
    for (int bin = 0; bin < band.n_bins(); ++bin) {
        const Vec2& dr = band.dr_at(bin);
        if (dr.dot(n) >= -0.1 * dr.norm()) {
            continue;
        }
        FermiState in{bin, 0.5};
        FermiState out = specular(band, in, bottom);

        EXPECT_GT(band.dr_at(out.bin).dot(n), 0.0) << "bin " << bin;
        EXPECT_GE(out.frac, 0.0);
        EXPECT_LE(out.frac, 1.0);

        // Momentum along the edge is conserved
        Vec2 shift = band.fermi_point(out) - band.fermi_point(in);
        EXPECT_NEAR(shift.cross(bottom.direction()), 0.0, 1e-9) << "bin " << bin;
        ++tested;
    }
    EXPECT_GT(tested, 20);
}

TEST(ReflectionTest, SpecularOnSquareFermiSurface) {
    Bandstructure band(square_fermi_surface(), 0.0, 10.0);
    Edge bottom({0.0, 0.0}, {1.0, 0.0}, 0);

    // Moving down-left, half way along the chord
    FermiState out = specular(band, {2, 0.5}, bottom);
    EXPECT_EQ(out.bin, 1);
    EXPECT_NEAR(out.frac, 0.5, 1e-12);
}

TEST(ReflectionTest, SpecularWithoutTargetThrows) {
    // Triangle orbit with a vertex at (1, 0); a vertical line only touches it there
    std::vector<Vec2> k = {{1.0, 0.0}, {0.0, 1.0}, {-1.0, 0.0}};
    Bandstructure band(k, 0.0, 1.0);
    Edge left({0.0, 0.0}, {0.0, 1.0}, 0);
    EXPECT_THROW(specular(band, {1, 1.0}, left), ReflectionError);
}

TEST(ReflectionTest, FermiIntersectionsLieOnLine) {
    Bandstructure band(Bandstructure::circular_fermi_surface(60, 1.0), 0.2, 1.0);
    const Vec2 direction(1.0, 2.0);
    const FermiState n_f{7, 0.3};
    const Vec2 c = band.fermi_point(n_f);

    auto crossings = fermi_intersections(band, n_f, direction);
    EXPECT_GE(crossings.size(), 2u);
    for (const auto& crossing : crossings) {
        EXPECT_NEAR((crossing.point - c).cross(direction), 0.0, 1e-9);
        EXPECT_NEAR((band.fermi_point(crossing.n_f) - crossing.point).norm(), 0.0, 1e-9);
    }
}

TEST(ReflectionTest, ScatterDrawsInjectingBin) {
    Bandstructure band(Bandstructure::circular_fermi_surface(80, 1.0), 0.0, 1.0);
    Edge top = with_injection(Edge({1.0, 1.0}, {0.0, 1.0}, 0), band);
    std::mt19937 rng(11);
    for (int i = 0; i < 500; ++i) {
        FermiState n_f = scatter(top, rng);
        EXPECT_GT(top.in_prob()[n_f.bin], 0.0);
        EXPECT_LT(band.dr_at(n_f.bin).y, 0.0);
    }
}

TEST(ReflectionTest, CornerInjectionProbability) {
    Bandstructure band(square_fermi_surface(), 0.0, 1.0);
    Edge bottom = with_injection(Edge({0.0, 0.0}, {1.0, 0.0}, 1), band);
    Edge left = with_injection(Edge({0.0, 1.0}, {0.0, 0.0}, 0), band);

    auto joint = corner_in_prob(bottom, left);
    ASSERT_TRUE(joint.has_value());
    // Only dr0 = (1, 1) leaves both edges
    EXPECT_NEAR(joint->in_prob[0], 1.0, 1e-12);
    EXPECT_EQ(joint->in_prob[1], 0.0);
    EXPECT_EQ(joint->in_prob[3], 0.0);
    EXPECT_EQ(joint->cum_prob.back(), 1.0);

    std::mt19937 rng(5);
    EXPECT_EQ(corner_scatter(bottom, left, bottom, rng).bin, 0);
}

TEST(ReflectionTest, CornerInjectionProbabilityOnCircle) {
    Bandstructure band(Bandstructure::circular_fermi_surface(120, 1.0), 0.0, 1.0);
    Edge bottom = with_injection(Edge({0.0, 0.0}, {1.0, 0.0}, 1), band);
    Edge right = with_injection(Edge({1.0, 0.0}, {1.0, 1.0}, 0), band);

    auto joint = corner_in_prob(bottom, right);
    ASSERT_TRUE(joint.has_value());
    double total = 0.0;
    for (size_t i = 0; i < joint->in_prob.size(); ++i) {
        if (bottom.in_prob()[i] == 0.0 || right.in_prob()[i] == 0.0) {
            EXPECT_EQ(joint->in_prob[i], 0.0);
        }
        total += joint->in_prob[i];
    }
    EXPECT_NEAR(total, 1.0, 1e-12);
}

TEST(ReflectionTest, OpposingEdgesShareNoBin) {
    Bandstructure band(square_fermi_surface(), 0.0, 1.0);
    Edge bottom = with_injection(Edge({0.0, 0.0}, {1.0, 0.0}, 2), band);
    Edge top = with_injection(Edge({1.0, 1.0}, {0.0, 1.0}, 0), band);

    EXPECT_FALSE(corner_in_prob(bottom, top).has_value());

    // Falls back to the counted edge
    std::mt19937 rng(9);
    for (int i = 0; i < 100; ++i) {
        FermiState n_f = corner_scatter(bottom, top, bottom, rng);
        EXPECT_GT(bottom.in_prob()[n_f.bin], 0.0);
    }
}

TEST(ReflectionTest, CornerInjectionRequiresDistributions) {
    Edge a({0.0, 0.0}, {1.0, 0.0}, 0);
    Edge b({0.0, 1.0}, {0.0, 0.0}, 0);
    EXPECT_THROW(corner_in_prob(a, b), std::invalid_argument);
}

TEST(ReflectionTest, CornerVirtualEdgeBisectsCorner) {
    Edge bottom({0.0, 0.0}, {1.0, 0.0}, 1);
    Edge left({0.0, 1.0}, {0.0, 0.0}, 0);

    auto virtual_edge = corner_virtual_edge(bottom, left, {0.5, 0.5}, 1);
    ASSERT_TRUE(virtual_edge.has_value());
    EXPECT_NEAR(virtual_edge->p0().x, 0.0, 1e-12);
    EXPECT_NEAR(virtual_edge->p0().y, 0.0, 1e-12);
    EXPECT_NEAR(virtual_edge->normal().x, std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(virtual_edge->normal().y, std::sqrt(0.5), 1e-12);
    EXPECT_EQ(virtual_edge->layer(), 1);

    Edge top({1.0, 1.0}, {0.0, 1.0}, 0);
    EXPECT_FALSE(corner_virtual_edge(bottom, top, {0.5, 0.5}, 1).has_value());
}

TEST(ReflectionTest, CornerVirtualEdgeOfObtuseCorner) {
    // 120 degree corner at the origin, origin point inside the wedge
    const double angle = 2.0 * std::acos(-1.0) / 3.0;
    Edge a({0.0, 0.0}, {1.0, 0.0}, 0);
    Edge b({std::cos(angle), std::sin(angle)}, {0.0, 0.0}, 0);

    auto virtual_edge = corner_virtual_edge(a, b, {0.1, 0.5}, 0);
    ASSERT_TRUE(virtual_edge.has_value());
    const double bisector = angle / 2.0;
    EXPECT_NEAR(virtual_edge->normal().x, std::cos(bisector), 1e-12);
    EXPECT_NEAR(virtual_edge->normal().y, std::sin(bisector), 1e-12);
}

TEST(ReflectionTest, CornerSpecularReversesDiagonalMotion) {
    Bandstructure band(square_fermi_surface(), 0.0, 1.0);
    Edge bottom({0.0, 0.0}, {1.0, 0.0}, 1);
    Edge left({0.0, 1.0}, {0.0, 0.0}, 0);

    // dr2 = (-1, -1) heads straight into the corner
    FermiState out = corner_specular(band, {2, 0.5}, bottom, left, bottom, {0.5, 0.5});
    EXPECT_EQ(out.bin, 0);
    EXPECT_NEAR(out.frac, 0.5, 1e-12);
}

TEST(ReflectionTest, CornerSpecularFallsBackForParallelEdges) {
    Bandstructure band(square_fermi_surface(), 0.0, 10.0);
    Edge bottom({0.0, 0.0}, {1.0, 0.0}, 1);
    Edge top({1.0, 1.0}, {0.0, 1.0}, 0);

    FermiState expected = specular(band, {2, 0.5}, bottom);
    FermiState out = corner_specular(band, {2, 0.5}, bottom, top, bottom, {0.5, 0.5});
    EXPECT_EQ(out, expected);
}
