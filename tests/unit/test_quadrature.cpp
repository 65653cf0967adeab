#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Quadrature.hpp"

#include <cmath>
#include <vector>

using namespace ckd;

TEST(QuadratureTest, GaussLegendreIntegratesConstant) {
    for (int n = 1; n <= 8; ++n) {
        const Quad q = Quad::GaussLegendre(n);
        ASSERT_EQ(q.Size(), n);
        const std::vector<double> ones(n, 1.0);
        EXPECT_NEAR(q.Integrate(ones), 2.0, 1e-12) << "n = " << n;
        EXPECT_NEAR(q.Integrate(ones, Interval{0.0, 1.0}), 1.0, 1e-12) << "n = " << n;
        EXPECT_NEAR(q.Integrate(ones, Interval{3.0, 7.5}), 4.5, 1e-12) << "n = " << n;
    }
}

TEST(QuadratureTest, GaussLegendreTwoPoints) {
    const Quad q = Quad::GaussLegendre(2);
    const double x = 1.0 / std::sqrt(3.0);
    EXPECT_NEAR(q.Nodes()[0], -x, 1e-12);
    EXPECT_NEAR(q.Nodes()[1], x, 1e-12);
    EXPECT_NEAR(q.Weights()[0], 1.0, 1e-12);
    EXPECT_NEAR(q.Weights()[1], 1.0, 1e-12);
    EXPECT_EQ(q.Type(), QuadType::GaussLegendre);
}

TEST(QuadratureTest, GaussLegendreExactForPolynomials) {
    // n points integrate polynomials up to degree 2n - 1 exactly.
    const Quad q = Quad::GaussLegendre(4);
    std::vector<double> values;
    for (double x : q.EvalNodes(Interval{0.0, 2.0})) {
        values.push_back(std::pow(x, 7));
    }
    EXPECT_NEAR(q.Integrate(values, Interval{0.0, 2.0}), 256.0 / 8.0, 1e-10);
}

TEST(QuadratureTest, GaussLobattoThreePoints) {
    const Quad q = Quad::GaussLobatto(3);
    ASSERT_EQ(q.Size(), 3);
    EXPECT_NEAR(q.Nodes()[0], -1.0, 1e-12);
    EXPECT_NEAR(q.Nodes()[1], 0.0, 1e-12);
    EXPECT_NEAR(q.Nodes()[2], 1.0, 1e-12);
    EXPECT_NEAR(q.Weights()[0], 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(q.Weights()[1], 4.0 / 3.0, 1e-12);
    EXPECT_NEAR(q.Weights()[2], 1.0 / 3.0, 1e-12);
    EXPECT_EQ(q.Type(), QuadType::GaussLobatto);
}

TEST(QuadratureTest, NewByName) {
    const Quad q = Quad::New("gauss_legendre", 16);
    EXPECT_EQ(q.Type(), QuadType::GaussLegendre);
    EXPECT_EQ(q.Size(), 16);
    EXPECT_EQ(Quad::New("Gauss_Lobatto", 5).Type(), QuadType::GaussLobatto);
    EXPECT_EQ(q.Summary(), "Quad(type=gauss_legendre, n=16)");
}

TEST(QuadratureTest, InvalidArgumentsThrow) {
    EXPECT_THROW(Quad::New("gauss_chebyshev", 4), ConfigError);
    EXPECT_THROW(Quad::GaussLegendre(0), ConfigError);
    EXPECT_THROW(Quad::GaussLobatto(1), ConfigError);
}

TEST(QuadratureTest, SizeMismatchThrows) {
    EXPECT_THROW((Quad(QuadType::GaussLegendre, {-0.5, 0.5}, {1.0})), ValidationError);

    const Quad q = Quad::GaussLegendre(3);
    EXPECT_THROW(q.Integrate(std::vector<double>(2, 1.0)), ValidationError);
}

TEST(QuadratureTest, EvalNodesMapping) {
    const Quad q(QuadType::GaussLobatto, {-1.0, 0.0, 1.0}, {1.0 / 3.0, 4.0 / 3.0, 1.0 / 3.0});
    EXPECT_EQ(q.EvalNodes(), q.Nodes());

    const auto g = q.EvalNodes(Interval{0.0, 1.0});
    ASSERT_EQ(g.size(), 3u);
    EXPECT_DOUBLE_EQ(g[0], 0.0);
    EXPECT_DOUBLE_EQ(g[1], 0.5);
    EXPECT_DOUBLE_EQ(g[2], 1.0);

    const auto w = q.EvalNodes(Interval{500.0, 510.0});
    EXPECT_DOUBLE_EQ(w[0], 500.0);
    EXPECT_DOUBLE_EQ(w[1], 505.0);
    EXPECT_DOUBLE_EQ(w[2], 510.0);
}
